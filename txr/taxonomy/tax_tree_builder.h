#ifndef TAXRECON_TAXONOMY_TAX_TREE_BUILDER_H
#define TAXRECON_TAXONOMY_TAX_TREE_BUILDER_H

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "txr/txr_base_includes.h"
#include "txr/tree.h"
#include "txr/taxonomy/taxonomy_store.h"

namespace txr {

struct TreeBuildConfig {
    // RankPath position that must be assigned for a sequence to be used
    std::size_t min_rank = 0;
    // max # of sequences attached directly to a clade at the deepest position of
    //  their path. Unset means no limit.
    std::optional<std::size_t> max_seqs_per_leaf;
    std::vector<CladeSelector> clades_to_include;
    std::vector<CladeSelector> clades_to_ignore;
};

struct TaxTreeBuildResult {
    std::unique_ptr<TaxTree> tree;
    // accepted sequence ids in acceptance order
    std::vector<std::string> seq_ids;
};

enum class InternalLabelMode {
    LINEAGE_KEY,
    RANK_NAME,
    NONE
};

InternalLabelMode internal_label_mode_from_string(const std::string & mode);
void write_tax_tree_newick(std::ostream & out, const TaxTree & tree, InternalLabelMode mode);
std::string tax_tree_newick(const TaxTree & tree, InternalLabelMode mode);

class TaxTreeBuilder {
    public:
        // called with ("progress", message) and ("unpruned-tree", newick)
        using Observer = std::function<void(const std::string & event, const std::string & payload)>;
        static constexpr std::size_t PROGRESS_INTERVAL = 1000;

        explicit TaxTreeBuilder(const TaxonomyStore & tax)
            :taxonomy(tax) {
        }
        void set_observer(Observer obs) {
            observer = std::move(obs);
        }
        TaxTreeBuildResult build(const TreeBuildConfig & config);

        // the filter steps of build(), without the quota
        static bool passes_clade_filters(const RankPath & ranks, const TreeBuildConfig & config);
    private:
        TaxTreeNode * get_clade_node(TaxTree & tree, const RankPath & ranks, int rank_level);
        void notify(const std::string & event, const std::string & payload) const {
            if (observer) {
                observer(event, payload);
            }
        }

        const TaxonomyStore & taxonomy;
        Observer observer;
        std::map<std::string, TaxTreeNode *> clade_nodes;
        std::map<std::string, std::size_t> leaf_count;
};

// observer that writes the "unpruned-tree" payload to filepath
TaxTreeBuilder::Observer unpruned_tree_file_writer(const std::string & filepath);

} // namespace txr
#endif
