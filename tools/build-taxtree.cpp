#include <iostream>
#include <iomanip>
#include <fstream>
#include <exception>
#include <vector>
#include <cstdlib>
#include <nlohmann/json.hpp>

#include "txr/error.h"
#include "txr/txrcli.h"
#include "txr/config_file.h"
#include "txr/tree_operations.h"
#include "txr/taxonomy/rank_code.h"
#include "txr/taxonomy/reconcile.h"
#include "txr/taxonomy/taxonomy_store.h"
#include "txr/taxonomy/tax_tree_builder.h"

using namespace txr;

using std::string;
using std::vector;
using std::cout;
using std::cerr;
using std::endl;
using json = nlohmann::json;

namespace po = boost::program_options;
using po::variables_map;

variables_map parse_cmd_line(int argc,char* argv[]) {
    using namespace po;

    // named options
    options_description invisible("Invisible options");
    invisible.add_options()
        ("taxonomy", value<string>(),"Tab-separated taxonomy file: <seq id> <TAB> <rank1;rank2;...>")
        ;

    options_description reconcile("Reconciliation options");
    reconcile.add_options()
        ("config,c",value<string>(),"INI file with [reconcile] and [tree] sections")
        ("nomenclature,n",value<string>(),"Nomenclature code: bac, bot, zoo or vir")
        ("seq-id-prefix",value<string>(),"Prefix prepended to every sequence id read")
        ("no-normalize","Do not replace Newick-unsafe characters in rank names and ids")
        ("no-close-gaps","Do not fill empty intermediate ranks")
        ("no-fix-duplicates","Report but do not rename rank names used under several parents")
        ("no-fix-disbalance","Report but do not shorten lineages deeper than 7 ranks")
        ;

    options_description tree("Tree options");
    tree.add_options()
        ("min-rank",value<string>(),"Rank that must be assigned for a sequence to be used (position, name or prefix)")
        ("max-seqs-per-leaf",value<std::size_t>(),"Max # of sequences attached to a deepest-rank clade")
        ("include-clades",value<string>(),"Comma-separated rank:name clades to keep (default: all)")
        ("ignore-clades",value<string>(),"Comma-separated rank:name clades to drop")
        ;

    options_description output("Output options");
    output.add_options()
        ("output,o",value<string>(),"Path for the Newick tree (default: standard output)")
        ("internal-labels",value<string>()->default_value("key"),"Labels of clade nodes: key, name or none")
        ("seq-ids",value<string>(),"Path for the list of sequence ids in the tree")
        ("write-taxonomy",value<string>(),"Path for the reconciled taxonomy")
        ("json,j", value<string>(), "filepath to an output JSON report")
        ("unpruned-tree",value<string>(),"Path for the tree before unifurcating clades are removed")
        ;

    options_description visible;
    visible.add(reconcile).add(tree).add(output).add(txr::standard_options());

    // positional options
    positional_options_description p;
    p.add("taxonomy", -1);

    variables_map vm = txr::parse_cmd_line_standard(argc, argv,
                                                    "Usage: txr-build-taxtree <taxonomy-file> [OPTIONS]\n"
                                                    "Reconcile a sequence taxonomy and write it as a rooted tree.",
                                                    visible, invisible, p);
    return vm;
}

static std::ofstream open_output(const string & fp) {
    std::ofstream out(fp);
    if (!out.good()) {
        throw TXRError() << "Could not open \"" << fp << "\" for writing";
    }
    return out;
}

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);
    try {
        variables_map args = parse_cmd_line(argc, argv);
        if (not args.count("taxonomy")) {
            throw TXRError() << "A taxonomy file must be specified";
        }
        boost::property_tree::ptree config;
        if (args.count("config")) {
            config = read_config_file(args["config"].as<string>());
        }
        auto rc_config = load_reconcile_config(config);
        auto tree_config = load_tree_build_config(config);
        if (args.count("nomenclature")) {
            rc_config.nomenclature = args["nomenclature"].as<string>();
        }
        if (args.count("seq-id-prefix")) {
            rc_config.seq_id_prefix = args["seq-id-prefix"].as<string>();
        }
        rc_config.normalize = rc_config.normalize and not args.count("no-normalize");
        rc_config.close_gaps = rc_config.close_gaps and not args.count("no-close-gaps");
        rc_config.fix_duplicates = rc_config.fix_duplicates and not args.count("no-fix-duplicates");
        rc_config.fix_disbalance = rc_config.fix_disbalance and not args.count("no-fix-disbalance");
        if (args.count("min-rank")) {
            const auto s = args["min-rank"].as<string>();
            auto position = std_rank_position_from_string(s);
            if (not position) {
                throw TXRError() << "--min-rank: '" << s << "' is not a known rank";
            }
            tree_config.min_rank = *position;
        }
        if (args.count("max-seqs-per-leaf")) {
            tree_config.max_seqs_per_leaf = args["max-seqs-per-leaf"].as<std::size_t>();
        }
        if (args.count("include-clades")) {
            tree_config.clades_to_include = parse_clade_selectors(args["include-clades"].as<string>());
        }
        if (args.count("ignore-clades")) {
            tree_config.clades_to_ignore = parse_clade_selectors(args["ignore-clades"].as<string>());
        }
        const auto label_mode = internal_label_mode_from_string(args["internal-labels"].as<string>());
        const RankCodeTable rank_codes(rc_config.nomenclature);
        LOG(DEBUG) << "using the " << rank_codes.get_code().name << " rank names";

        TaxonomyStore taxonomy(args["taxonomy"].as<string>(), rc_config.seq_id_prefix);
        const auto report = reconcile_taxonomy(taxonomy, rc_config);
        if (args.count("write-taxonomy")) {
            auto out = open_output(args["write-taxonomy"].as<string>());
            taxonomy.write_taxonomy(out);
        }

        TaxTreeBuilder builder(taxonomy);
        if (args.count("unpruned-tree")) {
            builder.set_observer(unpruned_tree_file_writer(args["unpruned-tree"].as<string>()));
        }
        const auto result = builder.build(tree_config);
        LOG(INFO) << result.seq_ids.size() << " of " << taxonomy.seq_count() << " sequences in the tree";
        if (args.count("output")) {
            auto out = open_output(args["output"].as<string>());
            write_tax_tree_newick(out, *result.tree, label_mode);
            out << endl;
        } else {
            write_tax_tree_newick(cout, *result.tree, label_mode);
            cout << endl;
        }
        if (args.count("seq-ids")) {
            auto out = open_output(args["seq-ids"].as<string>());
            for (const auto & sid : result.seq_ids) {
                out << sid << '\n';
            }
        }
        if (args.count("json")) {
            json document = to_json(report);
            document["nomenclature"] = rank_codes.get_code().name;
            document["num_seqs_in_tree"] = result.seq_ids.size();
            document["num_tree_nodes"] = n_nodes(*result.tree);
            auto out = open_output(args["json"].as<string>());
            out << std::setw(1) << document << endl;
        }
    } catch (std::exception& e) {
        cerr << "ERROR. Exiting due to an exception:\n" << e.what() << endl;
        return 1;
    }
    return 0;
}
