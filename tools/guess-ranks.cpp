#include <iostream>
#include <exception>
#include <vector>

#include "txr/error.h"
#include "txr/txrcli.h"
#include "txr/util.h"
#include "txr/taxonomy/rank_code.h"
#include "txr/taxonomy/taxonomy_store.h"

using namespace txr;

using std::string;
using std::vector;
using std::cout;
using std::cerr;
using std::endl;

namespace po = boost::program_options;
using po::variables_map;

variables_map parse_cmd_line(int argc,char* argv[]) {
    using namespace po;

    options_description invisible("Invisible options");
    invisible.add_options()
        ("taxonomy", value<string>(),"Tab-separated taxonomy file")
        ;

    options_description options("Options");
    options.add_options()
        ("nomenclature,n",value<string>()->default_value("bac"),"Nomenclature code: bac, bot, zoo or vir")
        ("prefixes,p","Write rank prefixes (g__) instead of rank names")
        ;

    options_description visible;
    visible.add(options).add(txr::standard_options());

    positional_options_description p;
    p.add("taxonomy", -1);

    variables_map vm = txr::parse_cmd_line_standard(argc, argv,
                                                    "Usage: txr-guess-ranks <taxonomy-file> [OPTIONS]\n"
                                                    "Write the guessed rank of every position of every lineage.",
                                                    visible, invisible, p);
    return vm;
}

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    try {
        variables_map args = parse_cmd_line(argc, argv);
        if (not args.count("taxonomy")) {
            throw TXRError() << "A taxonomy file must be specified";
        }
        const RankCodeTable rank_codes(args["nomenclature"].as<string>());
        const bool use_prefixes = args.count("prefixes") > 0;
        TaxonomyStore taxonomy(args["taxonomy"].as<string>(), string());
        for (const auto & sr : taxonomy.get_map()) {
            const auto levels = rank_codes.guess_rank_levels(sr.second);
            vector<string> labels;
            for (auto level : levels) {
                const auto & info = rank_level_name(level);
                labels.push_back(use_prefixes ? info.prefix : info.name);
            }
            cout << sr.first << '\t' << join_strings(labels, LINEAGE_DELIM) << '\n';
        }
    } catch (std::exception& e) {
        cerr << "ERROR. Exiting due to an exception:\n" << e.what() << endl;
        return 1;
    }
    return 0;
}
