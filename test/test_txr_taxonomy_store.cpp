#include <sstream>
#include <type_traits>
#include "txr/taxonomy/taxonomy_store.h"
#include "txr/taxonomy/reconcile.h"
#include "txr/test_harness.h"
#include "txr/util.h"
using namespace txr;
using std::string;
using std::vector;

static const string LACHNO_PREFIX = "Bacteria@@Firmicutes@@";

char test_load_and_query(const TestHarness & h) {
    TaxonomyStore tax(h.get_filepath("lachno.tsv"), string());
    if (tax.seq_count() != 4 || tax.get_rank_seqs_map().size() != 4) {
        return 'F';
    }
    const string expected_uid = LACHNO_PREFIX + "Clostridia@@Clostridiales@@Lachnospiraceae@@Blautia@@Blautia producta";
    if (tax.seq_rank_id("seq1") != expected_uid) {
        test_complete_diff_message(expected_uid, tax.seq_rank_id("seq1"));
        return 'F';
    }
    if (tax.get_rank_seq_count(expected_uid) != 1 || tax.get_rank_seq_count("Bacteria") != 0) {
        return 'F';
    }
    const std::set<string> common = {"Bacteria", "Firmicutes", "Lachnospiraceae"};
    if (tax.get_common_ranks() != common) {
        return 'F';
    }
    std::ostringstream out;
    tax.write_taxonomy(out);
    if (out.str() != read_str_content_of_utf8_file(h.get_filepath("lachno.tsv"))) {
        test_complete_diff_message(read_str_content_of_utf8_file(h.get_filepath("lachno.tsv")), out.str());
        return 'F';
    }
    return tax.check_index_invariants() ? '.' : 'F';
}

char test_seq_id_prefix(const TestHarness & h) {
    TaxonomyStore tax(h.get_filepath("lachno.tsv"), "r_");
    if (!contains(tax.get_map(), string("r_seq1")) || contains(tax.get_map(), string("seq1"))) {
        return 'F';
    }
    if (!tax.has_seq("seq1") || !tax.has_seq("r_seq2") || tax.has_seq("seq9")) {
        return 'F';
    }
    return tax.seq_lineage_str("seq3") == tax.seq_lineage_str("r_seq3") ? '.' : 'F';
}

char test_malformed_record(const TestHarness & h) {
    try {
        TaxonomyStore tax(h.get_filepath("malformed.tsv"), string());
    } catch (const TXRParsingError & x) {
        return (x.line_number == 3 ? '.' : 'F');
    }
    return 'F';
}

char test_duplicate_id_record(const TestHarness &) {
    std::istringstream inp("s1\tA;B\ns1\tA;C\n");
    TaxonomyStore tax;
    try {
        tax.load_taxonomy(inp, "dups");
    } catch (const TXRParsingError & x) {
        return (x.line_number == 2 && tax.seq_count() == 1 ? '.' : 'F');
    }
    return 'F';
}

char test_rank_uid_round_trip(const TestHarness &) {
    const RankPath ranks = {"A", "B", "-", "D", "-", "-"};
    if (TaxonomyStore::get_rank_uid(ranks) != "A@@B@@-@@D" || TaxonomyStore::get_rank_uid(ranks, 1) != "A@@B") {
        return 'F';
    }
    const RankPath prefix = {"A", "B", "-", "D"};
    if (TaxonomyStore::split_rank_uid(TaxonomyStore::get_rank_uid(ranks)) != prefix) {
        return 'F';
    }
    if (TaxonomyStore::split_rank_uid("A@@B@@-@@D", 6) != ranks) {
        return 'F';
    }
    if (TaxonomyStore::rank_uid_to_lineage_str("A@@B@@-@@D", 6) != "A;B;-;D;-;-") {
        return 'F';
    }
    if (TaxonomyStore::lowest_assigned_rank_level(ranks) != 3 || *TaxonomyStore::lowest_assigned_rank(ranks) != "D") {
        return 'F';
    }
    const RankPath empty = {"-", "-"};
    if (TaxonomyStore::lowest_assigned_rank_level(empty) != UNASSIGNED_RANK_LEVEL
        || TaxonomyStore::lowest_assigned_rank(empty)
        || !TaxonomyStore::get_rank_uid(empty).empty()) {
        return 'F';
    }
    if (TaxonomyStore::lineage_str({" A ", "", "B"}) != "A;B") {
        return 'F';
    }
    const RankPath parsed = {"A", "-", "C"};
    return TaxonomyStore::parse_lineage("A; ;C;") == parsed ? '.' : 'F';
}

char test_shared_key_iff_same_prefix(const TestHarness &) {
    SeqRanksMap m;
    m["s1"] = {"A", "B", "C", "-"};
    m["s2"] = {"A", "B", "C"};
    m["s3"] = {"A", "B", "-", "C"};
    TaxonomyStore tax(m);
    if (tax.seq_rank_id("s1") != tax.seq_rank_id("s2") || tax.seq_rank_id("s1") == tax.seq_rank_id("s3")) {
        return 'F';
    }
    return tax.get_rank_seqs(tax.seq_rank_id("s1")).size() == 2 ? '.' : 'F';
}

char test_remove_seq(const TestHarness & h) {
    TaxonomyStore tax(h.get_filepath("mixed.tsv"), string());
    const auto coli_key = tax.seq_rank_id("a1");
    tax.remove_seq("a1");
    if (tax.has_seq("a1") || tax.get_rank_seq_count(coli_key) != 2 || !tax.check_index_invariants()) {
        return 'F';
    }
    tax.remove_seq("a2");
    tax.remove_seq("a3");
    if (contains(tax.get_rank_seqs_map(), coli_key) || !tax.check_index_invariants()) {
        return 'F';
    }
    try {
        tax.remove_seq("a1");
    } catch (const TXRNotFoundError &) {
        return '.';
    }
    return 'F';
}

char test_rename_seq(const TestHarness & h) {
    TaxonomyStore tax(h.get_filepath("mixed.tsv"), string());
    const auto key = tax.seq_rank_id("b1");
    tax.rename_seq("b1", "b9");
    const auto & group = tax.get_rank_seqs(key);
    if (!contains(group, string("b9")) || contains(group, string("b1")) || group.size() != 3) {
        return 'F';
    }
    try {
        tax.get_seq_ranks("b1");
        return 'F';
    } catch (const TXRNotFoundError &) {
    }
    try {
        tax.rename_seq("b2", "b3");
        return 'F';
    } catch (const TXRNotFoundError &) {
        return 'F';
    } catch (const TXRError &) {
    }
    return tax.check_index_invariants() ? '.' : 'F';
}

char test_merge_ranks(const TestHarness & h) {
    TaxonomyStore tax(h.get_filepath("mixed.tsv"), string());
    const auto coli_key = tax.seq_rank_id("a1");
    const auto salmonella_key = tax.seq_rank_id("b1");
    if (tax.merge_ranks({coli_key})) {
        return 'F';
    }
    const auto merged = tax.merge_ranks({coli_key, salmonella_key});
    if (!merged) {
        return 'F';
    }
    const string expected = "Bacteria@@Proteobacteria@@Gammaproteobacteria@@Enterobacterales"
                            "@@Enterobacteriaceae@@Escherichia@@__TAXCLUSTER__Escherichia coli";
    if (*merged != expected) {
        test_complete_diff_message(expected, *merged);
        return 'F';
    }
    if (tax.get_rank_seq_count(*merged) != 6
        || contains(tax.get_rank_seqs_map(), coli_key)
        || contains(tax.get_rank_seqs_map(), salmonella_key)
        || tax.seq_rank_id("b2") != expected) {
        return 'F';
    }
    const auto remerged = tax.merge_ranks({*merged, tax.seq_rank_id("c1")}, "M_");
    if (!remerged || tax.get_rank_seq_count(*remerged) != 7) {
        return 'F';
    }
    return tax.check_index_invariants() ? '.' : 'F';
}

char test_normalize(const TestHarness &) {
    SeqRanksMap m;
    m["id 1:x"] = {"Bacteria", "Firm(icutes)", "Bac'illi"};
    m["id2"] = {"Bacteria", "Firm(icutes)", "Clostridia"};
    TaxonomyStore tax(m);
    const auto rank_corr = tax.normalize_rank_names();
    if (rank_corr.size() != 2 || rank_corr.at("Firm(icutes)") != "Firm_icutes_" || rank_corr.at("Bac'illi") != "Bac_illi") {
        return 'F';
    }
    if (tax.seq_lineage_str("id2") != "Bacteria;Firm_icutes_;Clostridia") {
        return 'F';
    }
    const auto id_corr = tax.normalize_seq_ids();
    if (id_corr.size() != 1 || id_corr.at("id 1:x") != "id_1_x" || !tax.has_seq("id_1_x") || tax.has_seq("id 1:x")) {
        return 'F';
    }
    if (tax.seq_rank_id("id_1_x") != "Bacteria@@Firm_icutes_@@Bac_illi") {
        return 'F';
    }
    return tax.check_index_invariants() ? '.' : 'F';
}

char test_normalize_id_clash(const TestHarness &) {
    SeqRanksMap m;
    m["a b"] = {"A", "B"};
    m["a_b"] = {"A", "C"};
    m["a:b"] = {"A", "D"};
    m["a_b_1x"] = {"A", "E"};
    TaxonomyStore tax(m);
    const auto id_corr = tax.normalize_seq_ids();
    if (id_corr.size() != 2 || id_corr.at("a b") != "a_b_1" || id_corr.at("a:b") != "a_b_2") {
        return 'F';
    }
    if (tax.seq_count() != 4 || tax.seq_lineage_str("a_b") != "A;C") {
        return 'F';
    }
    if (tax.seq_lineage_str("a_b_1") != "A;B" || tax.seq_lineage_str("a_b_2") != "A;D") {
        return 'F';
    }
    return (tax.has_seq("a b") || tax.has_seq("a:b") || !tax.check_index_invariants()) ? 'F' : '.';
}

char test_non_ascii_names(const TestHarness &) {
    if (strip_surrounding_whitespace(" \xC3\x89tude Caf\xC3\xA9\t") != "\xC3\x89tude Caf\xC3\xA9") {
        return 'F';
    }
    std::istringstream inp("s1\tEukaryota;Rhodophyta;Helminthocladia calvadosii Caf\xC3\xA9\n"
                           "s2\tEukaryota;Rhodophyta;Helminthocladia calvadosii Caf\n"
                           "s\xC3\xB8\tEukaryota;\xC3\x85land \n");
    TaxonomyStore tax;
    tax.load_taxonomy(inp, "utf8");
    const string expected = "Eukaryota;Rhodophyta;Helminthocladia calvadosii Caf\xC3\xA9";
    if (tax.seq_lineage_str("s1") != expected) {
        test_complete_diff_message(expected, tax.seq_lineage_str("s1"));
        return 'F';
    }
    if (tax.seq_rank_id("s1") == tax.seq_rank_id("s2") || tax.get_rank_seqs_map().size() != 3) {
        return 'F';
    }
    if (!tax.has_seq("s\xC3\xB8") || tax.get_seq_ranks("s\xC3\xB8").back() != "\xC3\x85land") {
        return 'F';
    }
    return tax.check_index_invariants() ? '.' : 'F';
}

char test_close_gaps(const TestHarness &) {
    SeqRanksMap m;
    m["s1"] = {"A", "-", "-", "D", "E", "-", "-"};
    m["s2"] = {"-", "B", "-", "C"};
    m["s3"] = {"A", "B", "C"};
    TaxonomyStore tax(m);
    if (tax.close_taxonomy_gaps() != 3) {
        return 'F';
    }
    const RankPath s1 = {"A", "parent2_D", "parent1_D", "D", "E", "-", "-"};
    const RankPath s2 = {"-", "B", "parent1_C", "C"};
    if (!test_vec_element_equality(s1, tax.get_seq_ranks("s1")) || !test_vec_element_equality(s2, tax.get_seq_ranks("s2"))) {
        return 'F';
    }
    for (const auto & sr : tax.get_map()) {
        const auto lowest = TaxonomyStore::lowest_assigned_rank_level(sr.second);
        for (int i = 1; i < lowest; ++i) {
            if (sr.second[i] == EMPTY_RANK) {
                return 'F';
            }
        }
    }
    if (tax.close_taxonomy_gaps() != 0) {
        return 'F';
    }
    return tax.check_index_invariants() ? '.' : 'F';
}

char test_duplicates_report_only(const TestHarness & h) {
    TaxonomyStore tax(h.get_filepath("lachno.tsv"), string());
    const auto before = tax.get_map();
    const auto dups = tax.check_for_duplicates(false);
    if (dups.size() != 2 || tax.get_map() != before) {
        return 'F';
    }
    for (const auto & d : dups) {
        if (d.orig_seq_id != "seq1" || d.fixed_lineage) {
            return 'F';
        }
    }
    return (dups[0].new_seq_id == "seq2" && dups[1].new_seq_id == "seq4") ? '.' : 'F';
}

char test_duplicates_autofix(const TestHarness & h) {
    TaxonomyStore tax(h.get_filepath("lachno.tsv"), string());
    const auto dups = tax.check_for_duplicates(true);
    // two conflicts and the audit records of seq1 and seq3
    if (dups.size() != 4) {
        return 'F';
    }
    const string seq1 = "Bacteria;Firmicutes;Clostridia;Clostridiales;Lachnospiraceae_Clostridiales;Blautia;Blautia producta";
    const string seq2 = "Bacteria;Firmicutes;Bacilli;Lactobacillales;Lachnospiraceae_Lactobacillales;Roseburia;Roseburia intestinalis";
    if (tax.seq_lineage_str("seq1") != seq1 || tax.seq_lineage_str("seq2") != seq2) {
        test_complete_diff_message(seq1, tax.seq_lineage_str("seq1"));
        test_complete_diff_message(seq2, tax.seq_lineage_str("seq2"));
        return 'F';
    }
    if (!dups[0].fixed_lineage || *dups[0].fixed_lineage != seq2) {
        return 'F';
    }
    bool found_audit = false;
    for (const auto & d : dups) {
        if (d.orig_seq_id == "seq1" && d.new_seq_id == "seq1") {
            found_audit = (d.fixed_lineage && *d.fixed_lineage == seq1 && d.orig_lineage != seq1);
        }
    }
    if (!found_audit || !tax.check_for_duplicates(false).empty()) {
        return 'F';
    }
    return tax.check_index_invariants() ? '.' : 'F';
}

char test_duplicates_stop_at_empty_rank(const TestHarness &) {
    SeqRanksMap m;
    m["s1"] = {"A", "-", "X"};
    m["s2"] = {"B", "-", "X"};
    m["s3"] = {"A", "P", "Y"};
    m["s4"] = {"B", "Q", "Y"};
    TaxonomyStore tax(m);
    const auto dups = tax.check_for_duplicates(false);
    return (dups.size() == 1 && dups[0].orig_seq_id == "s3" && dups[0].new_seq_id == "s4") ? '.' : 'F';
}

// renaming an ambiguous name changes the parent seen one position deeper
char test_duplicates_cascade(const TestHarness &) {
    SeqRanksMap m;
    m["s1"] = {"A1", "B", "C"};
    m["s2"] = {"A2", "B", "C"};
    TaxonomyStore tax(m);
    if (tax.check_for_duplicates(false).size() != 1) {
        return 'F';
    }
    const auto dups = tax.check_for_duplicates(true);
    // conflicts at positions 1 and 2, plus the audit record of s1
    if (dups.size() != 3 || dups[1].orig_seq_id != "s1" || dups[1].new_seq_id != "s2") {
        return 'F';
    }
    if (tax.seq_lineage_str("s1") != "A1;B_A1;C_B_A1" || tax.seq_lineage_str("s2") != "A2;B_A2;C_B_A2") {
        test_complete_diff_message(string("A1;B_A1;C_B_A1"), tax.seq_lineage_str("s1"));
        return 'F';
    }
    if (!dups[1].fixed_lineage || *dups[1].fixed_lineage != "A2;B_A2;C_B_A2") {
        return 'F';
    }
    return (tax.check_for_duplicates(false).empty() && tax.check_index_invariants()) ? '.' : 'F';
}

// only a map or a file name (with its prefix) builds a populated store
static_assert(!std::is_constructible<TaxonomyStore, const char *>::value, "a lone string is not a store");
static_assert(!std::is_constructible<TaxonomyStore, std::string>::value, "a lone string is not a store");

char test_disbalance(const TestHarness & h) {
    TaxonomyStore tax(h.get_filepath("deep.tsv"), string());
    const auto d2 = tax.get_seq_ranks("d2");
    const auto reported = tax.check_for_disbalance(false);
    if (reported.size() != 1 || reported[0].seq_id != "d1" || reported[0].fixed_lineage || tax.get_seq_ranks("d1").size() != 9) {
        return 'F';
    }
    const auto fixed = tax.check_for_disbalance(true);
    const string expected = "Bacteria;Actinobacteria;Actinobacteria;Actinomycetales;Corynebacteriaceae;Corynebacterium;Corynebacterium glutamicum";
    if (fixed.size() != 1 || !fixed[0].fixed_lineage || *fixed[0].fixed_lineage != expected) {
        return 'F';
    }
    if (tax.get_seq_ranks("d1").size() != STD_RANK_LEVELS || tax.get_seq_ranks("d2") != d2) {
        return 'F';
    }
    return (tax.check_for_disbalance(false).empty() && tax.check_index_invariants()) ? '.' : 'F';
}

char test_too_many_ranks(const TestHarness &) {
    TaxonomyStore tax;
    try {
        tax.add_seq("s1", RankPath(MAX_RANK_LEVELS + 1, "x"));
    } catch (const TXRError &) {
        return tax.seq_count() == 0 ? '.' : 'F';
    }
    return 'F';
}

char test_reconcile_report(const TestHarness & h) {
    TaxonomyStore tax(h.get_filepath("lachno.tsv"), string());
    ReconcileConfig cfg;
    const auto report = reconcile_taxonomy(tax, cfg);
    const auto j = to_json(report);
    if (j["num_seqs"] != 4 || j["duplicates"].size() != 4 || !j["disbalanced"].empty()) {
        return 'F';
    }
    return j["duplicates"][0]["new_seq_id"] == "seq2" ? '.' : 'F';
}

int main(int argc, char *argv[]) {
    TestHarness th(argc, argv);
    TestsVec tests{TestFn("test_load_and_query", test_load_and_query),
                   TestFn("test_seq_id_prefix", test_seq_id_prefix),
                   TestFn("test_malformed_record", test_malformed_record),
                   TestFn("test_duplicate_id_record", test_duplicate_id_record),
                   TestFn("test_rank_uid_round_trip", test_rank_uid_round_trip),
                   TestFn("test_shared_key_iff_same_prefix", test_shared_key_iff_same_prefix),
                   TestFn("test_remove_seq", test_remove_seq),
                   TestFn("test_rename_seq", test_rename_seq),
                   TestFn("test_merge_ranks", test_merge_ranks),
                   TestFn("test_normalize", test_normalize),
                   TestFn("test_normalize_id_clash", test_normalize_id_clash),
                   TestFn("test_non_ascii_names", test_non_ascii_names),
                   TestFn("test_close_gaps", test_close_gaps),
                   TestFn("test_duplicates_report_only", test_duplicates_report_only),
                   TestFn("test_duplicates_autofix", test_duplicates_autofix),
                   TestFn("test_duplicates_stop_at_empty_rank", test_duplicates_stop_at_empty_rank),
                   TestFn("test_duplicates_cascade", test_duplicates_cascade),
                   TestFn("test_disbalance", test_disbalance),
                   TestFn("test_too_many_ranks", test_too_many_ranks),
                   TestFn("test_reconcile_report", test_reconcile_report)
                  };
    return th.run_tests(tests);
}
