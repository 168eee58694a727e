#ifndef TAXRECON_TAXONOMY_TAXONOMY_STORE_H
#define TAXRECON_TAXONOMY_TAXONOMY_STORE_H

#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "txr/txr_base_includes.h"
#include "txr/error.h"

namespace txr {

extern const std::string EMPTY_RANK;
extern const std::string RANK_UID_DELIM;
extern const std::string LINEAGE_DELIM;
extern const std::string DEFAULT_MERGE_PREFIX;

// A name found under two different parents at the same rank position.
//  fixed_lineage is only set when the conflict was repaired. Audit records of
//  sequences that were altered without being the new side of a conflict have
//  orig_seq_id == new_seq_id.
struct DuplicateRecord {
    std::string orig_seq_id;
    std::string orig_lineage;
    std::string new_seq_id;
    std::string new_lineage;
    std::optional<std::string> fixed_lineage;
};

struct DisbalanceRecord {
    std::string seq_id;
    std::string orig_lineage;
    std::optional<std::string> fixed_lineage;
};

using RenameMap = std::map<std::string, std::string>;

// Sequence id -> RankPath store, plus the reverse LineageKey -> ids index.
//  Every public mutator leaves the reverse index partitioning the ids.
class TaxonomyStore {
    public:
        static std::string lineage_str(const RankPath & ranks);
        static int lowest_assigned_rank_level(const RankPath & ranks);
        static std::optional<std::string> lowest_assigned_rank(const RankPath & ranks);
        static std::string get_rank_uid(const RankPath & ranks, int rank_level = UNASSIGNED_RANK_LEVEL);
        static RankPath split_rank_uid(const std::string & rank_uid, std::size_t min_levels = 0);
        static std::string rank_uid_to_lineage_str(const std::string & rank_uid, std::size_t min_levels = 0);
        static RankPath parse_lineage(const std::string & lineage);

        TaxonomyStore() = default;
        TaxonomyStore(const SeqRanksMap & tax_map, const std::string & seq_id_prefix = std::string());
        TaxonomyStore(const std::string & tax_fname, const std::string & seq_id_prefix);

        void load_taxonomy(const std::string & tax_fname);
        void load_taxonomy(std::istream & inp, const std::string & source_name);
        void add_seq(const std::string & seq_id, const RankPath & ranks);
        void write_taxonomy(std::ostream & out) const;

        std::size_t seq_count() const {
            return seq_ranks_map.size();
        }
        const SeqRanksMap & get_map() const {
            return seq_ranks_map;
        }
        const RankSeqsMap & get_rank_seqs_map() const {
            return rank_seqs_map;
        }
        const std::string & get_prefix() const {
            return prefix;
        }
        bool has_seq(const std::string & seq_id) const;
        const RankPath & get_seq_ranks(const std::string & seq_id) const;
        std::string seq_lineage_str(const std::string & seq_id) const;
        std::string seq_rank_id(const std::string & seq_id) const;
        const SeqIdSet & get_rank_seqs(const std::string & rank_id) const;
        std::size_t get_rank_seq_count(const std::string & rank_id) const;
        std::set<std::string> get_common_ranks() const;

        void remove_seq(const std::string & seq_id);
        void rename_seq(const std::string & old_seq_id, const std::string & new_seq_id);
        std::optional<std::string> merge_ranks(const std::vector<std::string> & rank_ids,
                                               const std::string & name_prefix = DEFAULT_MERGE_PREFIX);
        RenameMap normalize_rank_names();
        RenameMap normalize_seq_ids();
        std::size_t close_taxonomy_gaps();
        std::vector<DuplicateRecord> check_for_duplicates(bool autofix = false);
        std::vector<DisbalanceRecord> check_for_disbalance(bool autofix = false);
        
        // true if the reverse index partitions the sequence ids and agrees with the forward map
        bool check_index_invariants() const;
    private:
        std::string full_seq_id(const std::string & seq_id) const;
        RankPath & get_mutable_seq_ranks(const std::string & seq_id);
        void index_seq(const std::string & seq_id, const RankPath & ranks);
        void unindex_seq(const std::string & seq_id, const RankPath & ranks);
        void set_seq_ranks(const std::string & seq_id, RankPath ranks);

        std::string prefix;
        SeqRanksMap seq_ranks_map;
        RankSeqsMap rank_seqs_map;
};

} // namespace txr
#endif
