#if !defined TAXRECON_TXRCLI_H
#define TAXRECON_TXRCLI_H
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "txr/txr_base_includes.h"
#include "txr/error.h"

namespace txr {

inline bool get_bool(const std::string& arg, const std::string& context) {
    if (arg == "true" or arg == "yes" or arg == "True" or arg == "Yes" or arg == "1") {
        return true;
    } else if (arg == "false" or arg == "no" or arg == "False" or arg == "No" or arg == "0") {
        return false;
    }
    throw TXRError() << context << "'" << arg << "' is not a recognized boolean value.";
}

boost::program_options::options_description standard_options();

boost::program_options::variables_map cmd_line_set_logging(const boost::program_options::variables_map& vm);

std::vector<std::string> cmd_line_response_file_contents(const boost::program_options::variables_map& vm);

boost::program_options::variables_map parse_cmd_line_response_file(int argc, char* argv[],
                                                                   boost::program_options::options_description visible,
                                                                   boost::program_options::options_description invisible,
                                                                   boost::program_options::positional_options_description p);

boost::program_options::variables_map parse_cmd_line_standard(int argc, char* argv[],
                                                              const std::string& message,
                                                              boost::program_options::options_description visible,
                                                              boost::program_options::options_description invisible,
                                                              boost::program_options::positional_options_description p);

} // namespace txr
#endif
