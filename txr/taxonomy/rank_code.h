#ifndef TAXRECON_TAXONOMY_RANK_CODE_H
#define TAXRECON_TAXONOMY_RANK_CODE_H

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "txr/txr_base_includes.h"
#include "txr/taxonomy/nomenclature.h"

namespace txr {

enum CanonicalRank {
    RANK_UNKNOWN = 0,
    RANK_KINGDOM,
    RANK_PHYLUM,
    RANK_SUBPHYLUM,
    RANK_CLASS,
    RANK_SUBCLASS,
    RANK_SUPERORDER,
    RANK_ORDER,
    RANK_SUBORDER,
    RANK_INFRAORDER,
    RANK_SUPERFAMILY,
    RANK_EPIFAMILY,
    RANK_FAMILY,
    RANK_SUBFAMILY,
    RANK_INFRAFAMILY,
    RANK_TRIBE,
    RANK_SUBTRIBE,
    RANK_INFRATRIBE,
    RANK_GENUS,
    RANK_SPECIES,
    RANK_SUBSPECIES,
    RANK_STRAIN,
    RANK_ISOLATE
};

struct RankLevelInfo {
    const char * name;
    const char * prefix;
};

// name-recognition rule of one canonical level under one nomenclature code.
//  suffixes and exact names are stored lowercase and alphanumeric only.
struct RankNameRule {
    RankLevel level;
    std::vector<std::string> suffixes;
    std::vector<std::string> exact_names;
};

using RankCodeRules = std::vector<RankNameRule>;

const RankLevelInfo & rank_level_name(RankLevel level);
bool is_std_rank(RankLevel level);
const std::vector<RankLevel> & std_rank_levels();
// "k__", "p__", ... "s__"
const std::vector<std::string> & std_rank_placeholders();
// position in a 7-level RankPath for a backbone rank given as a display name
//  ("class"), a display prefix ("c__") or a position number ("2").
std::optional<std::size_t> std_rank_position_from_string(const std::string & s);

class RankCodeTable {
    public:
        explicit RankCodeTable(const std::string & code_name);
        RankCodeTable(const RankCodeTable &) = default;

        // canonical level of ranks[position], or RANK_UNKNOWN (0)
        RankLevel guess_rank_level(const RankPath & ranks, std::size_t position) const;
        // guesses for positions 0..ranks.size()-1
        std::vector<RankLevel> guess_rank_levels(const RankPath & ranks) const;
        const RankLevelInfo & guess_rank_level_name(const RankPath & ranks, std::size_t position) const;

        const Nomenclature::Code & get_code() const {
            return *code;
        }
        const RankCodeRules & get_rules() const {
            return *rules;
        }
    private:
        RankLevel match_name(const std::string & rank_name) const;
        RankLevel next_std_level_after(RankLevel parent_level) const;
        std::vector<RankLevel> guess_up_to(const RankPath & ranks, std::size_t position) const;

        const Nomenclature::Code * code;
        const RankCodeRules * rules;
};

} // namespace txr
#endif
