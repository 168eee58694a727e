#include "txr/taxonomy/taxonomy_store.h"

#include <fstream>
#include "txr/util.h"

using std::string;
using std::vector;
using std::map;
using std::set;
using std::optional;

namespace txr {

const string EMPTY_RANK = "-";
const string RANK_UID_DELIM = "@@";
const string LINEAGE_DELIM = ";";
const string DEFAULT_MERGE_PREFIX = "__TAXCLUSTER__";

namespace {
const char * INVALID_RANK_NAME_CHARS = "[](),;:'";
const char * INVALID_SEQ_ID_CHARS = "[](),;:' ";
const SeqIdSet NO_SEQS;
}

string TaxonomyStore::lineage_str(const RankPath & ranks) {
    string r;
    for (const auto & rank : ranks) {
        const auto stripped = strip_surrounding_whitespace(rank);
        if (stripped.empty()) {
            continue;
        }
        if (not r.empty()) {
            r.append(LINEAGE_DELIM);
        }
        r.append(stripped);
    }
    return r;
}

int TaxonomyStore::lowest_assigned_rank_level(const RankPath & ranks) {
    int rank_level = static_cast<int>(ranks.size()) - 1;
    while (rank_level >= 0 && ranks[rank_level] == EMPTY_RANK) {
        --rank_level;
    }
    return rank_level;
}

optional<string> TaxonomyStore::lowest_assigned_rank(const RankPath & ranks) {
    const auto rank_level = lowest_assigned_rank_level(ranks);
    if (rank_level == UNASSIGNED_RANK_LEVEL) {
        return std::nullopt;
    }
    return ranks[rank_level];
}

string TaxonomyStore::get_rank_uid(const RankPath & ranks, int rank_level) {
    if (rank_level == UNASSIGNED_RANK_LEVEL) {
        rank_level = lowest_assigned_rank_level(ranks);
    }
    if (rank_level >= static_cast<int>(ranks.size())) {
        throw TXRError() << "Rank level " << rank_level << " is outside of the lineage \"" << lineage_str(ranks) << "\"";
    }
    string uid;
    for (int i = 0; i <= rank_level; ++i) {
        if (i > 0) {
            uid.append(RANK_UID_DELIM);
        }
        uid.append(ranks[i]);
    }
    return uid;
}

RankPath TaxonomyStore::split_rank_uid(const string & rank_uid, std::size_t min_levels) {
    RankPath ranks = split_on_token(rank_uid, RANK_UID_DELIM);
    if (ranks.size() < min_levels) {
        ranks.resize(min_levels, EMPTY_RANK);
    }
    return ranks;
}

string TaxonomyStore::rank_uid_to_lineage_str(const string & rank_uid, std::size_t min_levels) {
    return lineage_str(split_rank_uid(rank_uid, min_levels));
}

// splits `rank1;rank2;...`. Blank fields become EMPTY_RANK, except trailing ones
//  which come from a terminal delimiter and are dropped.
RankPath TaxonomyStore::parse_lineage(const string & lineage) {
    RankPath ranks;
    for (const auto & field : split_string(lineage, LINEAGE_DELIM[0])) {
        ranks.push_back(strip_surrounding_whitespace(field));
    }
    while (not ranks.empty() and ranks.back().empty()) {
        ranks.pop_back();
    }
    for (auto & name : ranks) {
        if (name.empty()) {
            name = EMPTY_RANK;
        }
    }
    return ranks;
}

TaxonomyStore::TaxonomyStore(const SeqRanksMap & tax_map, const string & seq_id_prefix)
    :prefix(seq_id_prefix) {
    for (const auto & sr : tax_map) {
        add_seq(sr.first, sr.second);
    }
}

TaxonomyStore::TaxonomyStore(const string & tax_fname, const string & seq_id_prefix)
    :prefix(seq_id_prefix) {
    load_taxonomy(tax_fname);
}

void TaxonomyStore::load_taxonomy(const string & tax_fname) {
    std::ifstream inp;
    if (!open_utf8_file(tax_fname, inp)) {
        throw TXRError() << "Could not open taxonomy file \"" << tax_fname << "\"";
    }
    LOG(INFO) << "reading taxonomy \"" << tax_fname << "\"...";
    load_taxonomy(inp, tax_fname);
}

void TaxonomyStore::load_taxonomy(std::istream & inp, const string & source_name) {
    string line;
    std::size_t line_num = 0;
    std::size_t num_read = 0;
    while (std::getline(inp, line)) {
        ++line_num;
        const auto stripped = strip_surrounding_whitespace(line);
        if (stripped.empty()) {
            continue;
        }
        const auto fields = split_string(stripped, '\t');
        if (fields.size() != 2) {
            throw TXRParsingError("expecting a sequence id and a lineage separated by a tab",
                                  source_name, line_num);
        }
        const string seq_id = prefix + strip_surrounding_whitespace(fields.front());
        if (contains(seq_ranks_map, seq_id)) {
            throw TXRParsingError("duplicate sequence id \"" + seq_id + "\"", source_name, line_num);
        }
        try {
            add_seq(seq_id, parse_lineage(fields.back()));
        } catch (const TXRError & x) {
            throw TXRParsingError(x.what(), source_name, line_num);
        }
        ++num_read;
    }
    LOG(DEBUG) << num_read << " sequence records read from \"" << source_name << "\" into " << rank_seqs_map.size() << " rank groups";
}

void TaxonomyStore::add_seq(const string & seq_id, const RankPath & ranks) {
    if (contains(seq_ranks_map, seq_id)) {
        throw TXRError() << "Sequence id \"" << seq_id << "\" is already in the taxonomy";
    }
    if (ranks.size() > MAX_RANK_LEVELS) {
        throw TXRError() << "Lineage of \"" << seq_id << "\" has " << ranks.size()
                         << " ranks, but at most " << MAX_RANK_LEVELS << " are supported";
    }
    for (const auto & name : ranks) {
        if (name.find(RANK_UID_DELIM) != string::npos) {
            throw TXRError() << "Rank name \"" << name << "\" of \"" << seq_id << "\" contains the reserved token \"" << RANK_UID_DELIM << "\"";
        }
    }
    seq_ranks_map[seq_id] = ranks;
    index_seq(seq_id, ranks);
}

void TaxonomyStore::write_taxonomy(std::ostream & out) const {
    for (const auto & sr : seq_ranks_map) {
        out << sr.first << '\t' << join_strings(sr.second, LINEAGE_DELIM) << '\n';
    }
}

string TaxonomyStore::full_seq_id(const string & seq_id) const {
    if (prefix.empty() or seq_id.compare(0, prefix.length(), prefix) == 0) {
        return seq_id;
    }
    return prefix + seq_id;
}

bool TaxonomyStore::has_seq(const string & seq_id) const {
    return contains(seq_ranks_map, full_seq_id(seq_id));
}

const RankPath & TaxonomyStore::get_seq_ranks(const string & seq_id) const {
    auto it = seq_ranks_map.find(full_seq_id(seq_id));
    if (it == seq_ranks_map.end()) {
        throw TXRNotFoundError() << "Sequence id \"" << seq_id << "\" not found in the taxonomy";
    }
    return it->second;
}

RankPath & TaxonomyStore::get_mutable_seq_ranks(const string & seq_id) {
    auto it = seq_ranks_map.find(full_seq_id(seq_id));
    if (it == seq_ranks_map.end()) {
        throw TXRNotFoundError() << "Sequence id \"" << seq_id << "\" not found in the taxonomy";
    }
    return it->second;
}

string TaxonomyStore::seq_lineage_str(const string & seq_id) const {
    return lineage_str(get_seq_ranks(seq_id));
}

string TaxonomyStore::seq_rank_id(const string & seq_id) const {
    return get_rank_uid(get_seq_ranks(seq_id));
}

const SeqIdSet & TaxonomyStore::get_rank_seqs(const string & rank_id) const {
    auto it = rank_seqs_map.find(rank_id);
    if (it == rank_seqs_map.end()) {
        return NO_SEQS;
    }
    return it->second;
}

std::size_t TaxonomyStore::get_rank_seq_count(const string & rank_id) const {
    return get_rank_seqs(rank_id).size();
}

set<string> TaxonomyStore::get_common_ranks() const {
    set<string> common;
    bool first = true;
    for (const auto & sr : seq_ranks_map) {
        set<string> curr(sr.second.begin(), sr.second.end());
        curr.erase(EMPTY_RANK);
        if (first) {
            common = std::move(curr);
            first = false;
        } else {
            set<string> inters;
            std::set_intersection(common.begin(), common.end(), curr.begin(), curr.end(),
                                  std::inserter(inters, inters.end()));
            common = std::move(inters);
        }
    }
    return common;
}

void TaxonomyStore::index_seq(const string & seq_id, const RankPath & ranks) {
    rank_seqs_map[get_rank_uid(ranks)].insert(seq_id);
}

void TaxonomyStore::unindex_seq(const string & seq_id, const RankPath & ranks) {
    auto it = rank_seqs_map.find(get_rank_uid(ranks));
    assert(it != rank_seqs_map.end());
    it->second.erase(seq_id);
    if (it->second.empty()) {
        rank_seqs_map.erase(it);
    }
}

void TaxonomyStore::set_seq_ranks(const string & seq_id, RankPath ranks) {
    auto & curr = get_mutable_seq_ranks(seq_id);
    unindex_seq(seq_id, curr);
    curr = std::move(ranks);
    index_seq(seq_id, curr);
}

void TaxonomyStore::remove_seq(const string & raw_seq_id) {
    const auto seq_id = full_seq_id(raw_seq_id);
    auto it = seq_ranks_map.find(seq_id);
    if (it == seq_ranks_map.end()) {
        throw TXRNotFoundError() << "Cannot remove \"" << raw_seq_id << "\": sequence id not found in the taxonomy";
    }
    unindex_seq(seq_id, it->second);
    seq_ranks_map.erase(it);
}

void TaxonomyStore::rename_seq(const string & raw_old_seq_id, const string & new_seq_id) {
    const auto old_seq_id = full_seq_id(raw_old_seq_id);
    auto it = seq_ranks_map.find(old_seq_id);
    if (it == seq_ranks_map.end()) {
        throw TXRNotFoundError() << "Cannot rename \"" << raw_old_seq_id << "\": sequence id not found in the taxonomy";
    }
    if (new_seq_id == old_seq_id) {
        return;
    }
    if (contains(seq_ranks_map, new_seq_id)) {
        throw TXRError() << "Cannot rename \"" << old_seq_id << "\" to \"" << new_seq_id << "\": the new id is already in use";
    }
    RankPath ranks = std::move(it->second);
    seq_ranks_map.erase(it);
    auto & group = rank_seqs_map[get_rank_uid(ranks)];
    group.erase(old_seq_id);
    group.insert(new_seq_id);
    seq_ranks_map.emplace(new_seq_id, std::move(ranks));
}

optional<string> TaxonomyStore::merge_ranks(const vector<string> & rank_ids, const string & name_prefix) {
    if (rank_ids.size() < 2) {
        return std::nullopt;
    }
    const RankPath first_taxon = split_rank_uid(rank_ids[0]);
    const int merge_lvl = lowest_assigned_rank_level(first_taxon);
    if (merge_lvl == UNASSIGNED_RANK_LEVEL) {
        throw TXRError() << "Cannot merge rank groups: the first lineage key \"" << rank_ids[0] << "\" has no assigned rank";
    }
    RankPath new_rank(first_taxon.begin(), first_taxon.begin() + merge_lvl);
    new_rank.push_back(name_prefix + first_taxon[merge_lvl]);
    vector<string> all_sid;
    for (const auto & rank_id : rank_ids) {
        const auto & group = get_rank_seqs(rank_id);
        all_sid.insert(all_sid.end(), group.begin(), group.end());
    }
    for (const auto & sid : all_sid) {
        set_seq_ranks(sid, new_rank);
    }
    const auto new_rank_id = get_rank_uid(new_rank);
    LOG(DEBUG) << "merged " << rank_ids.size() << " rank groups (" << all_sid.size() << " sequences) into \"" << new_rank_id << "\"";
    return new_rank_id;
}

RenameMap TaxonomyStore::normalize_rank_names() {
    RenameMap corr_ranks;
    vector<std::pair<string, RankPath> > changed;
    for (const auto & sr : seq_ranks_map) {
        RankPath ranks = sr.second;
        bool modified = false;
        for (auto & name : ranks) {
            auto cit = corr_ranks.find(name);
            if (cit != corr_ranks.end()) {
                name = cit->second;
                modified = true;
                continue;
            }
            const auto new_name = replace_chars(name, INVALID_RANK_NAME_CHARS, '_');
            if (new_name != name) {
                corr_ranks[name] = new_name;
                name = new_name;
                modified = true;
            }
        }
        if (modified) {
            changed.emplace_back(sr.first, std::move(ranks));
        }
    }
    for (auto & c : changed) {
        set_seq_ranks(c.first, std::move(c.second));
    }
    LOG(DEBUG) << corr_ranks.size() << " rank names normalized in " << changed.size() << " lineages";
    return corr_ranks;
}

// An id whose corrected form is already taken gets the first free "_<n>" suffix.
//  Corrected ids hold no invalid character, so they never clash with an id that
//  still waits to be renamed.
RenameMap TaxonomyStore::normalize_seq_ids() {
    RenameMap corr_ids;
    std::set<string> taken;
    for (const auto & sr : seq_ranks_map) {
        const auto new_sid = replace_chars(sr.first, INVALID_SEQ_ID_CHARS, '_');
        if (new_sid == sr.first) {
            taken.insert(sr.first);
        } else {
            corr_ids[sr.first] = new_sid;
        }
    }
    for (auto & c : corr_ids) {
        if (contains(taken, c.second)) {
            const auto base = c.second;
            for (std::size_t n = 1; contains(taken, c.second); ++n) {
                c.second = base + "_" + std::to_string(n);
            }
            LOG(WARNING) << "normalized id of \"" << c.first << "\" clashes with \"" << base << "\", using \"" << c.second << "\"";
        }
        taken.insert(c.second);
    }
    for (const auto & c : corr_ids) {
        rename_seq(c.first, c.second);
    }
    LOG(DEBUG) << corr_ids.size() << " sequence ids normalized";
    return corr_ids;
}

// Position 0 is never filled. A gap takes the name of the closest assigned rank
//  below it, prefixed with the number of gaps filled so far in this lineage.
std::size_t TaxonomyStore::close_taxonomy_gaps() {
    std::size_t num_filled = 0;
    vector<std::pair<string, RankPath> > changed;
    for (const auto & sr : seq_ranks_map) {
        RankPath ranks = sr.second;
        const string * last_rank = nullptr;
        unsigned gap_count = 0;
        for (std::size_t i = ranks.size(); i-- > 1; ) {
            if (ranks[i] != EMPTY_RANK) {
                last_rank = &sr.second[i];
            } else if (last_rank != nullptr) {
                ++gap_count;
                ranks[i] = "parent" + std::to_string(gap_count) + "_" + *last_rank;
            }
        }
        if (gap_count > 0) {
            num_filled += gap_count;
            changed.emplace_back(sr.first, std::move(ranks));
        }
    }
    for (auto & c : changed) {
        set_seq_ranks(c.first, std::move(c.second));
    }
    LOG(DEBUG) << num_filled << " taxonomy gaps closed in " << changed.size() << " lineages";
    return num_filled;
}

// Positions are processed root-first, so that a repaired parent name is
//  already in place when its children are compared. A lineage is only
//  examined down to its first empty rank.
std::vector<DuplicateRecord> TaxonomyStore::check_for_duplicates(bool autofix) {
    struct FirstSighting {
        string seq_id;
        string parent;
    };
    map<string, string> orig_lineages;
    std::size_t max_depth = 0;
    for (const auto & sr : seq_ranks_map) {
        orig_lineages[sr.first] = lineage_str(sr.second);
        max_depth = std::max(max_depth, sr.second.size());
    }
    vector<DuplicateRecord> dups;
    set<string> stopped;
    set<string> conflicting_seqs;
    map<string, string> altered;
    for (std::size_t i = 1; i < max_depth; ++i) {
        map<string, FirstSighting> parent_map;
        set<string> ambiguous;
        for (const auto & sr : seq_ranks_map) {
            const auto & sid = sr.first;
            const auto & ranks = sr.second;
            if (i >= ranks.size() or contains(stopped, sid)) {
                continue;
            }
            if (ranks[i] == EMPTY_RANK) {
                stopped.insert(sid);
                continue;
            }
            const auto & parent = ranks[i - 1];
            auto pit = parent_map.find(ranks[i]);
            if (pit == parent_map.end()) {
                parent_map.emplace(ranks[i], FirstSighting{sid, parent});
            } else if (pit->second.parent != parent) {
                const auto & old_sid = pit->second.seq_id;
                ambiguous.insert(ranks[i]);
                conflicting_seqs.insert(sid);
                dups.push_back(DuplicateRecord{old_sid, orig_lineages[old_sid], sid, orig_lineages[sid], std::nullopt});
            }
        }
        if (not autofix or ambiguous.empty()) {
            continue;
        }
        vector<std::pair<string, RankPath> > changed;
        for (const auto & sr : seq_ranks_map) {
            const auto & ranks = sr.second;
            if (i >= ranks.size() or contains(stopped, sr.first) or not contains(ambiguous, ranks[i])) {
                continue;
            }
            RankPath fixed = ranks;
            fixed[i] += "_" + ranks[i - 1];
            changed.emplace_back(sr.first, std::move(fixed));
        }
        for (auto & c : changed) {
            altered.emplace(c.first, orig_lineages[c.first]);
            set_seq_ranks(c.first, std::move(c.second));
        }
        LOG(DEBUG) << ambiguous.size() << " ambiguous names at rank position " << i << " renamed in " << changed.size() << " lineages";
    }
    if (autofix) {
        for (auto & d : dups) {
            d.fixed_lineage = seq_lineage_str(d.new_seq_id);
        }
        for (const auto & a : altered) {
            if (not contains(conflicting_seqs, a.first)) {
                dups.push_back(DuplicateRecord{a.first, a.second, a.first, a.second, seq_lineage_str(a.first)});
            }
        }
    }
    LOG(INFO) << dups.size() << " duplicate rank name records" << (autofix ? " (fixed)" : "");
    return dups;
}

// Heuristic: subclass/suborder-like ranks go first, then ranks without a
//  recognized suffix, then order/family-like ranks.
std::vector<DisbalanceRecord> TaxonomyStore::check_for_disbalance(bool autofix) {
    vector<DisbalanceRecord> errs;
    vector<std::pair<string, RankPath> > changed;
    for (const auto & sr : seq_ranks_map) {
        const auto & ranks = sr.second;
        if (ranks.size() <= STD_RANK_LEVELS) {
            continue;
        }
        if (not autofix) {
            errs.push_back(DisbalanceRecord{sr.first, lineage_str(ranks), std::nullopt});
            continue;
        }
        vector<std::size_t> dropq;
        vector<std::size_t> keepq;
        vector<std::size_t> restq;
        for (std::size_t i = 1; i < ranks.size(); ++i) {
            if (ends_with(ranks[i], "dae") or ends_with(ranks[i], "neae")) {
                dropq.push_back(i);
            } else if (ends_with(ranks[i], "ceae") or ends_with(ranks[i], "ales")) {
                keepq.push_back(i);
            } else {
                restq.push_back(i);
            }
        }
        vector<std::size_t> to_remove = dropq;
        to_remove.insert(to_remove.end(), restq.begin(), restq.end());
        to_remove.insert(to_remove.end(), keepq.begin(), keepq.end());
        to_remove.resize(ranks.size() - STD_RANK_LEVELS);
        const set<std::size_t> removed(to_remove.begin(), to_remove.end());
        RankPath new_ranks;
        for (std::size_t i = 0; i < ranks.size(); ++i) {
            if (not contains(removed, i)) {
                new_ranks.push_back(ranks[i]);
            }
        }
        errs.push_back(DisbalanceRecord{sr.first, lineage_str(ranks), lineage_str(new_ranks)});
        changed.emplace_back(sr.first, std::move(new_ranks));
    }
    for (auto & c : changed) {
        set_seq_ranks(c.first, std::move(c.second));
    }
    LOG(INFO) << errs.size() << " lineages deeper than " << STD_RANK_LEVELS << " ranks" << (autofix ? " (fixed)" : "");
    return errs;
}

bool TaxonomyStore::check_index_invariants() const {
    std::size_t num_indexed = 0;
    for (const auto & group : rank_seqs_map) {
        if (group.second.empty()) {
            return false;
        }
        for (const auto & sid : group.second) {
            auto it = seq_ranks_map.find(sid);
            if (it == seq_ranks_map.end() or get_rank_uid(it->second) != group.first) {
                return false;
            }
            ++num_indexed;
        }
    }
    return num_indexed == seq_ranks_map.size();
}

} // namespace txr
