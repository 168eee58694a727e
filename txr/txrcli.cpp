#include "txr/txrcli.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <boost/tokenizer.hpp>

///////////////////////////////////////////////////////////////
#pragma clang diagnostic push
#pragma clang diagnostic ignored  "-Wglobal-constructors"
#pragma clang diagnostic ignored  "-Wexit-time-destructors"
INITIALIZE_EASYLOGGINGPP
#pragma clang diagnostic pop
///////////////////////////////////////////////////////////////

namespace po = boost::program_options;
using po::variables_map;
using std::string;
using std::vector;

namespace txr {

po::options_description standard_options()
{
    using namespace po;
    options_description standard("Standard command-line flags");
    standard.add_options()
      ("help,h", "Produce help message")
      ("response-file,f", value<string>(), "Treat contents of file <arg> as a command line.")
      ("quiet,q","QUIET mode (all logging disabled)")
      ("trace,t","TRACE level debugging (very noisy)")
      ("verbose,v","verbose")
    ;
    return standard;
}

variables_map cmd_line_set_logging(const po::variables_map& vm)
{
    el::Configurations defaultConf;
    defaultConf.setToDefault();
    if (vm.count("quiet"))
        defaultConf.set(el::Level::Global,  el::ConfigurationType::Enabled, "false");
    else
    {
        defaultConf.set(el::Level::Trace, el::ConfigurationType::Enabled, "false");
        defaultConf.set(el::Level::Debug, el::ConfigurationType::Enabled, "false");

        if (vm.count("trace"))
        {
            defaultConf.set(el::Level::Trace, el::ConfigurationType::Enabled, "true");
            debugging_output_enabled = true;
        }

        if (vm.count("verbose"))
            defaultConf.set(el::Level::Debug, el::ConfigurationType::Enabled, "true");
    }
    el::Loggers::reconfigureLogger("default", defaultConf);

    return vm;
}

vector<string> cmd_line_response_file_contents(const po::variables_map& vm)
{
    vector<string> args;
    if (vm.count("response-file"))
    {
        std::ifstream ifs(vm["response-file"].as<string>().c_str());
        if (not ifs)
            throw TXRError() << "Could not open the response file \"" << vm["response-file"].as<string>() << "\"";
        std::stringstream ss;
        ss << ifs.rdbuf();
        boost::char_separator<char> sep(" \t\n\r");
        std::string contents( ss.str() );
        boost::tokenizer<boost::char_separator<char> > tok(contents, sep);
        std::copy(tok.begin(), tok.end(), std::back_inserter(args));
    }
    return args;
}

variables_map parse_cmd_line_response_file(int argc, char* argv[],
                                           po::options_description visible,
                                           po::options_description invisible,
                                           po::positional_options_description p)
{
    using namespace po;
    variables_map vm;
    options_description all;
    all.add(invisible).add(visible);
    store(command_line_parser(argc, argv).options(all).positional(p).run(), vm);
    notify(vm);

    std::vector<string> args = cmd_line_response_file_contents(vm);
    store(command_line_parser(args).options(all).positional(p).run(), vm);
    notify(vm);

    return vm;
}

variables_map parse_cmd_line_standard(int argc, char* argv[],
                                      const string& message,
                                      po::options_description visible,
                                      po::options_description invisible,
                                      po::positional_options_description p)
{
    variables_map vm = parse_cmd_line_response_file(argc, argv, visible, invisible, p);

    if (vm.count("help")) {
        std::cout<<message<<"\n";
        std::cout<<visible<<"\n";
        if (vm.count("verbose"))
            std::cout<<invisible<<"\n";
        exit(0);
    }

    cmd_line_set_logging(vm);

    return vm;
}

} // namespace txr
