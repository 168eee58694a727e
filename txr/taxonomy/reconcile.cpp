#include "txr/taxonomy/reconcile.h"

using json = nlohmann::json;

namespace txr {

ReconcileReport reconcile_taxonomy(TaxonomyStore & taxonomy, const ReconcileConfig & config) {
    ReconcileReport report;
    report.num_seqs = taxonomy.seq_count();
    if (config.normalize) {
        report.rank_renames = taxonomy.normalize_rank_names();
        report.seq_id_renames = taxonomy.normalize_seq_ids();
    }
    if (config.close_gaps) {
        report.num_gaps_closed = taxonomy.close_taxonomy_gaps();
    }
    report.duplicates = taxonomy.check_for_duplicates(config.fix_duplicates);
    report.disbalanced = taxonomy.check_for_disbalance(config.fix_disbalance);
    if (not config.fix_duplicates and not report.duplicates.empty()) {
        LOG(WARNING) << report.duplicates.size() << " rank names are used under different parents and were not fixed";
    }
    if (not config.fix_disbalance and not report.disbalanced.empty()) {
        LOG(WARNING) << report.disbalanced.size() << " lineages are deeper than " << STD_RANK_LEVELS << " ranks and were not fixed";
    }
    if (debugging_output_enabled and not taxonomy.check_index_invariants()) {
        throw TXRError() << "Lineage index is out of sync with the sequence records after reconciliation";
    }
    return report;
}

json to_json(const DuplicateRecord & rec) {
    json j;
    j["orig_seq_id"] = rec.orig_seq_id;
    j["orig_lineage"] = rec.orig_lineage;
    j["new_seq_id"] = rec.new_seq_id;
    j["new_lineage"] = rec.new_lineage;
    if (rec.fixed_lineage) {
        j["fixed_lineage"] = *rec.fixed_lineage;
    } else {
        j["fixed_lineage"] = nullptr;
    }
    return j;
}

json to_json(const DisbalanceRecord & rec) {
    json j;
    j["seq_id"] = rec.seq_id;
    j["orig_lineage"] = rec.orig_lineage;
    if (rec.fixed_lineage) {
        j["fixed_lineage"] = *rec.fixed_lineage;
    } else {
        j["fixed_lineage"] = nullptr;
    }
    return j;
}

json to_json(const ReconcileReport & report) {
    json document;
    document["num_seqs"] = report.num_seqs;
    document["rank_renames"] = json::object();
    for (const auto & r : report.rank_renames) {
        document["rank_renames"][r.first] = r.second;
    }
    document["seq_id_renames"] = json::object();
    for (const auto & r : report.seq_id_renames) {
        document["seq_id_renames"][r.first] = r.second;
    }
    document["num_gaps_closed"] = report.num_gaps_closed;
    json dups = json::array();
    for (const auto & d : report.duplicates) {
        dups.push_back(to_json(d));
    }
    document["duplicates"] = dups;
    json disb = json::array();
    for (const auto & d : report.disbalanced) {
        disb.push_back(to_json(d));
    }
    document["disbalanced"] = disb;
    return document;
}

} // namespace txr
