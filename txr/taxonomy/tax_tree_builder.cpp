#include "txr/taxonomy/tax_tree_builder.h"

#include <fstream>
#include <sstream>
#include "txr/tree_iter.h"
#include "txr/tree_operations.h"
#include "txr/util.h"

using std::string;
using std::vector;

namespace txr {

InternalLabelMode internal_label_mode_from_string(const string & mode) {
    if (mode == "key") {
        return InternalLabelMode::LINEAGE_KEY;
    }
    if (mode == "name") {
        return InternalLabelMode::RANK_NAME;
    }
    if (mode == "none") {
        return InternalLabelMode::NONE;
    }
    throw TXRError() << "Unknown internal label mode \"" << mode << "\". Expecting \"key\", \"name\" or \"none\"";
}

void write_tax_tree_newick(std::ostream & out, const TaxTree & tree, InternalLabelMode mode) {
    if (tree.get_root() != nullptr) {
        auto namer = [mode](const TaxTreeNode * nd) -> string {
            if (nd->get_data().kind != TaxNodeKind::CLADE) {
                return nd->get_name();
            }
            if (mode == InternalLabelMode::LINEAGE_KEY) {
                return nd->get_name();
            }
            if (mode == InternalLabelMode::RANK_NAME) {
                const auto ranks = TaxonomyStore::split_rank_uid(nd->get_name());
                return ranks.empty() ? string() : ranks.back();
            }
            return string();
        };
        write_newick_generic(out, tree.get_root(), namer);
    }
    out << ';';
}

string tax_tree_newick(const TaxTree & tree, InternalLabelMode mode) {
    std::ostringstream s;
    write_tax_tree_newick(s, tree, mode);
    return s.str();
}

inline bool clade_matches(const RankPath & ranks, const CladeSelector & sel) {
    return sel.first < ranks.size() && ranks[sel.first] == sel.second;
}

bool TaxTreeBuilder::passes_clade_filters(const RankPath & ranks, const TreeBuildConfig & config) {
    if (config.min_rank >= ranks.size() || ranks[config.min_rank] == EMPTY_RANK) {
        return false;
    }
    if (not config.clades_to_include.empty()) {
        bool included = false;
        for (const auto & sel : config.clades_to_include) {
            if (clade_matches(ranks, sel)) {
                included = true;
                break;
            }
        }
        if (not included) {
            return false;
        }
    }
    for (const auto & sel : config.clades_to_ignore) {
        if (clade_matches(ranks, sel)) {
            return false;
        }
    }
    return true;
}

// returns the clade node for ranks[0..rank_level], creating it and any missing
//  ancestor clade on the way. Empty positions get no node.
TaxTreeNode * TaxTreeBuilder::get_clade_node(TaxTree & tree, const RankPath & ranks, int rank_level) {
    vector<int> levels;
    for (int i = 0; i <= rank_level; ++i) {
        if (ranks[i] != EMPTY_RANK) {
            levels.push_back(i);
        }
    }
    assert(not levels.empty() && levels.back() == rank_level);
    TaxTreeNode * par = tree.get_root();
    std::size_t first_missing = 0;
    for (std::size_t j = levels.size(); j > 0; --j) {
        auto it = clade_nodes.find(TaxonomyStore::get_rank_uid(ranks, levels[j - 1]));
        if (it != clade_nodes.end()) {
            par = it->second;
            first_missing = j;
            break;
        }
    }
    for (std::size_t j = first_missing; j < levels.size(); ++j) {
        auto key = TaxonomyStore::get_rank_uid(ranks, levels[j]);
        auto nd = tree.create_child(par);
        nd->set_name(key);
        nd->get_data().kind = TaxNodeKind::CLADE;
        nd->get_data().rank_level = levels[j];
        clade_nodes.emplace(std::move(key), nd);
        par = nd;
    }
    return par;
}

TaxTreeBuildResult TaxTreeBuilder::build(const TreeBuildConfig & config) {
    clade_nodes.clear();
    leaf_count.clear();
    TaxTreeBuildResult result;
    result.tree = std::make_unique<TaxTree>();
    auto & tree = *result.tree;
    auto root = tree.create_root();
    root->get_data().kind = TaxNodeKind::ROOT;
    std::size_t num_processed = 0;
    for (const auto & sr : taxonomy.get_map()) {
        const auto & seq_id = sr.first;
        const auto & ranks = sr.second;
        ++num_processed;
        if (num_processed % PROGRESS_INTERVAL == 0) {
            std::ostringstream msg;
            msg << "Processed nodes: " << num_processed << ", added: " << result.seq_ids.size()
                << ", skipped: " << num_processed - result.seq_ids.size();
            LOG(DEBUG) << msg.str();
            notify("progress", msg.str());
        }
        if (not passes_clade_filters(ranks, config)) {
            continue;
        }
        const int parent_level = TaxonomyStore::lowest_assigned_rank_level(ranks);
        assert(parent_level >= static_cast<int>(config.min_rank));
        const auto parent_key = TaxonomyStore::get_rank_uid(ranks, parent_level);
        auto & num_leaves = leaf_count[parent_key];
        if (config.max_seqs_per_leaf
            && parent_level == static_cast<int>(ranks.size()) - 1
            && num_leaves >= *config.max_seqs_per_leaf) {
            LOG(TRACE) << "quota of \"" << parent_key << "\" reached, skipping \"" << seq_id << "\"";
            continue;
        }
        ++num_leaves;
        auto par = get_clade_node(tree, ranks, parent_level);
        auto leaf = tree.create_child(par);
        leaf->set_name(seq_id);
        leaf->get_data().kind = TaxNodeKind::SEQUENCE;
        leaf->get_data().rank_level = parent_level;
        result.seq_ids.push_back(seq_id);
    }
    LOG(DEBUG) << "Total nodes in resulting tree: " << result.seq_ids.size();
    if (observer) {
        notify("unpruned-tree", tax_tree_newick(tree, InternalLabelMode::LINEAGE_KEY));
    }
    const auto num_suppressed = suppress_monotypic_below_root(tree);
    LOG(DEBUG) << num_suppressed << " unifurcating clade nodes removed";
    // node pointers are no longer valid for a later build
    clade_nodes.clear();
    return result;
}

TaxTreeBuilder::Observer unpruned_tree_file_writer(const string & filepath) {
    return [filepath](const string & event, const string & payload) {
        if (event != "unpruned-tree") {
            return;
        }
        std::ofstream out(filepath);
        if (!out.good()) {
            throw TXRError() << "Could not open \"" << filepath << "\" for writing";
        }
        out << payload << std::endl;
    };
}

} // namespace txr
