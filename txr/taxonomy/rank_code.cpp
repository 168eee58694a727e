#include "txr/taxonomy/rank_code.h"

#include <algorithm>
#include <boost/spirit/include/qi.hpp>
#include <boost/spirit/include/qi_symbols.hpp>

#include "txr/error.h"
#include "txr/util.h"

using std::string;
using std::vector;

using boost::spirit::qi::symbols;
namespace qi = boost::spirit::qi;

namespace txr {

namespace {

const RankLevelInfo UNI_TAX_RANKS[MAX_RANK_LEVELS + 1] = {
    {"Unknown", "?__"},
    {"Kingdom", "k__"},
    {"Phylum", "p__"},
    {"Subphylum", "a__"},
    {"Class", "c__"},
    {"Subclass", "d__"},
    {"Superorder", "e__"},
    {"Order", "o__"},
    {"Suborder", "h__"},
    {"Infraorder", "i__"},
    {"Superfamily", "j__"},
    {"Epifamily", "l__"},
    {"Family", "f__"},
    {"Subfamily", "m__"},
    {"Infrafamily", "n__"},
    {"Tribe", "t__"},
    {"Subtribe", "u__"},
    {"Infratribe", "v__"},
    {"Genus", "g__"},
    {"Species", "s__"},
    {"Subspecies", "b__"},
    {"Strain", "r__"},
    {"Isolate", "q__"}
};

const RankCodeRules & bacterial_rules() {
    static const RankCodeRules r = {
        {RANK_KINGDOM, {}, {"bacteria", "archaea"}},
        {RANK_PHYLUM, {}, {}},
        {RANK_CLASS, {}, {}},
        {RANK_SUBCLASS, {"idae"}, {}},
        {RANK_ORDER, {"ales"}, {}},
        {RANK_SUBORDER, {"ineae"}, {}},
        {RANK_FAMILY, {"aceae"}, {}},
        {RANK_SUBFAMILY, {"oideae"}, {}},
        {RANK_GENUS, {}, {}},
        {RANK_SPECIES, {}, {}},
        {RANK_SUBSPECIES, {}, {}},
        {RANK_STRAIN, {}, {}},
        {RANK_ISOLATE, {}, {}}
    };
    return r;
}

const RankCodeRules & botanical_rules() {
    static const RankCodeRules r = {
        {RANK_KINGDOM, {}, {"plantae", "algae", "fungi"}},
        {RANK_PHYLUM, {"phyta", "phycota", "mycota"}, {}},
        {RANK_SUBPHYLUM, {"phytina", "phycotina", "mycotina"}, {}},
        {RANK_CLASS, {"opsida", "phyceae", "mycetes"}, {}},
        {RANK_SUBCLASS, {"idae", "phycidae", "mycetidae"}, {}},
        {RANK_SUPERORDER, {"anae"}, {}},
        {RANK_ORDER, {"ales"}, {}},
        {RANK_SUBORDER, {"ineae"}, {}},
        {RANK_INFRAORDER, {"aria"}, {}},
        {RANK_SUPERFAMILY, {"acea"}, {}},
        {RANK_FAMILY, {"aceae"}, {}},
        {RANK_SUBFAMILY, {"oideae"}, {}},
        {RANK_TRIBE, {"eae"}, {}},
        {RANK_SUBTRIBE, {"inae"}, {}},
        {RANK_GENUS, {}, {}},
        {RANK_SPECIES, {}, {}},
        {RANK_SUBSPECIES, {}, {}},
        {RANK_STRAIN, {}, {}},
        {RANK_ISOLATE, {}, {}}
    };
    return r;
}

const RankCodeRules & zoological_rules() {
    static const RankCodeRules r = {
        {RANK_KINGDOM, {}, {"animalia"}},
        {RANK_PHYLUM, {}, {"chordata", "arthropoda", "mollusca", "nematoda"}},
        {RANK_SUBPHYLUM, {}, {"vertebrata", "myriapoda", "crustacea", "hexapoda"}},
        {RANK_CLASS, {}, {"mammalia", "aves", "reptilia", "amphibia", "insecta"}},
        {RANK_SUBCLASS, {}, {}},
        {RANK_SUPERORDER, {}, {}},
        {RANK_ORDER, {}, {}},
        {RANK_SUBORDER, {}, {}},
        {RANK_INFRAORDER, {}, {}},
        {RANK_SUPERFAMILY, {"oidea"}, {}},
        {RANK_EPIFAMILY, {"oidae"}, {}},
        {RANK_FAMILY, {"idae"}, {}},
        {RANK_SUBFAMILY, {"inae"}, {}},
        {RANK_INFRAFAMILY, {"odd"}, {}},
        {RANK_TRIBE, {"ini"}, {}},
        {RANK_SUBTRIBE, {"ina"}, {}},
        {RANK_INFRATRIBE, {"ad", "iti"}, {}},
        {RANK_GENUS, {}, {}},
        {RANK_SPECIES, {}, {}},
        {RANK_SUBSPECIES, {}, {}},
        {RANK_STRAIN, {}, {}},
        {RANK_ISOLATE, {}, {}}
    };
    return r;
}

// species names end in " virus" which normalizes to the genus suffix, so species
//  are only reachable through the parent-based fallback.
const RankCodeRules & viral_rules() {
    static const RankCodeRules r = {
        {RANK_KINGDOM, {}, {"viruses"}},
        {RANK_CLASS, {}, {}},
        {RANK_SUBCLASS, {"idae"}, {}},
        {RANK_ORDER, {"virales"}, {}},
        {RANK_FAMILY, {"viridae"}, {}},
        {RANK_SUBFAMILY, {"virinae"}, {}},
        {RANK_GENUS, {"virus"}, {}},
        {RANK_SPECIES, {}, {}},
        {RANK_STRAIN, {}, {}},
        {RANK_ISOLATE, {}, {}}
    };
    return r;
}

const RankCodeRules & rules_for_code(const Nomenclature::Code & code) {
    if (&code == &Nomenclature::ICNP) {
        return bacterial_rules();
    } else if (&code == &Nomenclature::ICN) {
        return botanical_rules();
    } else if (&code == &Nomenclature::ICZN) {
        return zoological_rules();
    }
    assert(&code == &Nomenclature::ICTV);
    return viral_rules();
}

auto get_std_rank_symbols() {
    symbols<char, std::size_t> sym;
    const auto & levels = std_rank_levels();
    for (std::size_t i = 0; i < levels.size(); ++i) {
        string lname = UNI_TAX_RANKS[levels[i]].name;
        std::transform(lname.begin(), lname.end(), lname.begin(), [](unsigned char c) { return std::tolower(c); });
        sym.add(lname, i);
        sym.add(UNI_TAX_RANKS[levels[i]].prefix, i);
    }
    return sym;
}

} // namespace (anon)

const RankLevelInfo & rank_level_name(RankLevel level) {
    if (level < 1 || level > static_cast<RankLevel>(MAX_RANK_LEVELS)) {
        return UNI_TAX_RANKS[RANK_UNKNOWN];
    }
    return UNI_TAX_RANKS[level];
}

const vector<RankLevel> & std_rank_levels() {
    static const vector<RankLevel> s = {RANK_KINGDOM, RANK_PHYLUM, RANK_CLASS, RANK_ORDER,
                                        RANK_FAMILY, RANK_GENUS, RANK_SPECIES};
    return s;
}

bool is_std_rank(RankLevel level) {
    return vcontains(std_rank_levels(), level);
}

const vector<string> & std_rank_placeholders() {
    static const vector<string> p = {"k__", "p__", "c__", "o__", "f__", "g__", "s__"};
    return p;
}

std::optional<std::size_t> std_rank_position_from_string(const string & raw) {
    static const auto std_rank_symbols = get_std_rank_symbols();
    const string s = strip_surrounding_whitespace(raw);
    long n;
    if (char_ptr_to_long(s.c_str(), &n)) {
        if (n < 0 || n >= static_cast<long>(MAX_RANK_LEVELS)) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(n);
    }
    string lowered = s;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
    std::size_t position = 0;
    auto first = lowered.cbegin();
    const auto last = lowered.cend();
    if (qi::parse(first, last, std_rank_symbols, position) and first == last) {
        return position;
    }
    return std::nullopt;
}

RankCodeTable::RankCodeTable(const string & code_name)
    :code(Nomenclature::code_from_name(code_name)),
    rules(nullptr) {
    if (code == nullptr) {
        throw TXRError() << "Unknown taxonomic code: \"" << code_name << "\"";
    }
    rules = &rules_for_code(*code);
}

RankLevel RankCodeTable::match_name(const string & rank_name) const {
    const string normalized = to_lower_alnum(rank_name);
    if (normalized.empty()) {
        return RANK_UNKNOWN;
    }
    for (const auto & rule : *rules) {
        for (const auto & suffix : rule.suffixes) {
            if (ends_with(normalized, suffix)) {
                return rule.level;
            }
        }
        if (vcontains(rule.exact_names, normalized)) {
            return rule.level;
        }
    }
    return RANK_UNKNOWN;
}

// the smallest backbone level of this code's table that is deeper than parent_level
RankLevel RankCodeTable::next_std_level_after(RankLevel parent_level) const {
    for (const auto & rule : *rules) {
        if (rule.level > parent_level and is_std_rank(rule.level)) {
            return rule.level;
        }
    }
    return RANK_UNKNOWN;
}

// Each position only depends on its own name and on the level of the position
//  above it, so the guesses are memoized in a vector filled root-first.
vector<RankLevel> RankCodeTable::guess_up_to(const RankPath & ranks, std::size_t position) const {
    vector<RankLevel> memo;
    memo.reserve(position + 1);
    for (std::size_t i = 0; i <= position; ++i) {
        RankLevel lvl = match_name(ranks[i]);
        if (lvl == RANK_UNKNOWN) {
            if (i == 0) {
                lvl = RANK_KINGDOM;
            } else if (memo[i - 1] != RANK_UNKNOWN) {
                lvl = next_std_level_after(memo[i - 1]);
            }
        }
        memo.push_back(lvl);
    }
    return memo;
}

RankLevel RankCodeTable::guess_rank_level(const RankPath & ranks, std::size_t position) const {
    if (position >= ranks.size()) {
        throw TXRError() << "Rank position " << position << " is outside of a lineage with " << ranks.size() << " ranks";
    }
    return guess_up_to(ranks, position).back();
}

vector<RankLevel> RankCodeTable::guess_rank_levels(const RankPath & ranks) const {
    if (ranks.empty()) {
        return {};
    }
    return guess_up_to(ranks, ranks.size() - 1);
}

const RankLevelInfo & RankCodeTable::guess_rank_level_name(const RankPath & ranks, std::size_t position) const {
    return rank_level_name(guess_rank_level(ranks, position));
}

} // namespace txr
