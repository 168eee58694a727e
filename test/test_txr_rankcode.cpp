#include "txr/taxonomy/rank_code.h"
#include "txr/test_harness.h"
#include "txr/util.h"
using namespace txr;
using std::string;
using std::vector;

static char check_levels(const RankCodeTable & rct, const RankPath & ranks, const vector<RankLevel> & expected) {
    const auto obtained = rct.guess_rank_levels(ranks);
    if (!test_vec_element_equality(expected, obtained)) {
        return 'F';
    }
    for (std::size_t i = 0; i < ranks.size(); ++i) {
        if (rct.guess_rank_level(ranks, i) != expected[i]) {
            std::cerr << "guess_rank_level differs from guess_rank_levels at " << i << '\n';
            return 'F';
        }
    }
    return '.';
}

char test_bacterial_backbone(const TestHarness &) {
    RankCodeTable rct("bac");
    const RankPath ranks = {"Bacteria", "Firmicutes", "Clostridia", "Clostridiales",
                            "Lachnospiraceae", "Blautia", "Blautia producta"};
    return check_levels(rct, ranks, {RANK_KINGDOM, RANK_PHYLUM, RANK_CLASS, RANK_ORDER,
                                     RANK_FAMILY, RANK_GENUS, RANK_SPECIES});
}

char test_botanical_suffixes(const TestHarness &) {
    RankCodeTable rct("ICN");
    const RankPath ranks = {"Plantae", "Magnoliophyta", "Magnoliopsida", "Rosales",
                            "Rosaceae", "Rosa", "Rosa canina"};
    return check_levels(rct, ranks, {1, 2, 4, 7, 12, 18, 19});
}

char test_zoological_exact_names(const TestHarness &) {
    RankCodeTable rct("zoo");
    const RankPath ranks = {"Animalia", "Chordata", "Mammalia", "Primates",
                            "Hominidae", "Homo", "Homo sapiens"};
    return check_levels(rct, ranks, {1, 2, 4, 7, 12, 18, 19});
}

char test_suffix_beats_position(const TestHarness &) {
    RankCodeTable rct("bac");
    // an order directly below the kingdom is still an order
    const RankPath ranks = {"Bacteria", "Bacillales", "Staphylococcaceae"};
    return check_levels(rct, ranks, {RANK_KINGDOM, RANK_ORDER, RANK_FAMILY});
}

char test_fallback_runs_out(const TestHarness &) {
    RankCodeTable rct("bac");
    const RankPath ranks = {"x", "a", "b", "c", "d", "e", "f", "g", "h"};
    return check_levels(rct, ranks, {1, 2, 4, 7, 12, 18, 19, 0, 0});
}

char test_unknown_code(const TestHarness &) {
    try {
        RankCodeTable rct("klingon");
    } catch (const TXRError &) {
        return '.';
    }
    return 'F';
}

char test_position_out_of_range(const TestHarness &) {
    RankCodeTable rct("vir");
    const RankPath ranks = {"Viruses", "Caudovirales"};
    if (rct.guess_rank_level(ranks, 1) != RANK_ORDER) {
        return 'F';
    }
    try {
        rct.guess_rank_level(ranks, 2);
    } catch (const TXRError &) {
        return '.';
    }
    return 'F';
}

char test_rank_names(const TestHarness &) {
    if (string(rank_level_name(RANK_GENUS).name) != "Genus" || string(rank_level_name(RANK_GENUS).prefix) != "g__") {
        return 'F';
    }
    if (string(rank_level_name(0).prefix) != "?__" || string(rank_level_name(40).name) != "Unknown") {
        return 'F';
    }
    RankCodeTable rct("bac");
    const RankPath ranks = {"Bacteria", "Firmicutes"};
    if (string(rct.guess_rank_level_name(ranks, 1).name) != "Phylum") {
        return 'F';
    }
    if (std_rank_placeholders().size() != STD_RANK_LEVELS || !is_std_rank(RANK_CLASS) || is_std_rank(RANK_SUBCLASS)) {
        return 'F';
    }
    return '.';
}

char test_std_rank_position_parsing(const TestHarness &) {
    if (std_rank_position_from_string("class") != std::optional<std::size_t>(2)
        || std_rank_position_from_string("c__") != std::optional<std::size_t>(2)
        || std_rank_position_from_string(" Genus ") != std::optional<std::size_t>(5)
        || std_rank_position_from_string("3") != std::optional<std::size_t>(3)) {
        return 'F';
    }
    if (std_rank_position_from_string("subclass") || std_rank_position_from_string("99")) {
        return 'F';
    }
    // non-ASCII input is lowered byte-wise and simply fails to match
    if (std_rank_position_from_string("G\xC3\x89NUS") || std_rank_position_from_string("\xC3\xA9")) {
        return 'F';
    }
    return '.';
}

int main(int argc, char *argv[]) {
    TestHarness th(argc, argv);
    TestsVec tests{TestFn("test_bacterial_backbone", test_bacterial_backbone),
                   TestFn("test_botanical_suffixes", test_botanical_suffixes),
                   TestFn("test_zoological_exact_names", test_zoological_exact_names),
                   TestFn("test_suffix_beats_position", test_suffix_beats_position),
                   TestFn("test_fallback_runs_out", test_fallback_runs_out),
                   TestFn("test_unknown_code", test_unknown_code),
                   TestFn("test_position_out_of_range", test_position_out_of_range),
                   TestFn("test_rank_names", test_rank_names),
                   TestFn("test_std_rank_position_parsing", test_std_rank_position_parsing)
                  };
    return th.run_tests(tests);
}
