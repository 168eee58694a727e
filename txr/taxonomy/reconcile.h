#ifndef TAXRECON_TAXONOMY_RECONCILE_H
#define TAXRECON_TAXONOMY_RECONCILE_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "txr/txr_base_includes.h"
#include "txr/taxonomy/taxonomy_store.h"

namespace txr {

struct ReconcileConfig {
    std::string nomenclature = "bac";
    std::string seq_id_prefix;
    bool normalize = true;
    bool close_gaps = true;
    bool fix_duplicates = true;
    bool fix_disbalance = true;
};

// What the reconciliation passes found (and changed, for the enabled fixes)
struct ReconcileReport {
    std::size_t num_seqs = 0;
    RenameMap rank_renames;
    RenameMap seq_id_renames;
    std::size_t num_gaps_closed = 0;
    std::vector<DuplicateRecord> duplicates;
    std::vector<DisbalanceRecord> disbalanced;
};

// Runs normalization, gap closing, duplicate and disbalance checks in that
//  order. Disabled fixes still report what they would change.
ReconcileReport reconcile_taxonomy(TaxonomyStore & taxonomy, const ReconcileConfig & config);

nlohmann::json to_json(const DuplicateRecord & rec);
nlohmann::json to_json(const DisbalanceRecord & rec);
nlohmann::json to_json(const ReconcileReport & report);

} // namespace txr
#endif
