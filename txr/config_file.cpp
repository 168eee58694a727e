#include "txr/config_file.h"
#include <regex>
#include <fstream>
#include <boost/property_tree/ini_parser.hpp>
#include "txr/error.h"
#include "txr/txrcli.h"
#include "txr/util.h"
#include "txr/taxonomy/rank_code.h"

using std::string;
using std::size_t;
using std::vector;
using std::optional;
using boost::property_tree::ptree;

namespace txr {

optional<string> interpolate(const ptree& pt, const string& section_name, const string& key) {
    static std::regex KEYCRE ("%\\(([^)]+)\\)s");
    if (not pt.get_child_optional(section_name)) {
        return std::nullopt;
    }
    const ptree& section = pt.get_child(section_name);
    if (not section.get_optional<string>(key)) {
        return std::nullopt;
    }
    string value = section.get<string>(key);
    for(int i=0;i<20 and value.find('%') != string::npos;i++) {
        string value2;
        size_t p1 = 0U;
        size_t p2 = 0U;
        while (p1 < value.size()) {
            p2 = value.find('%', p1);
            if (p2 == string::npos) {
                p2 = value.size(); 
            }
            value2 += value.substr(p1, p2-p1);
            if (p2 == value.size()) {
                break;
            }
            if (p2+1 >= value.size()) {
                throw TXRError() << "Found '%' at end of string!";
            }
            char c = value[p2 + 1];
            if (c == '%') {
                value2 += "%";
                p1 = p2 + 2;
            } else if (c == '(') {
                std::cmatch m;
                bool matched = std::regex_search(value.c_str()+p2, value.c_str()+value.size(), m, KEYCRE);
                if (not matched or m.position(0) != 0) {
                    throw TXRError() << "Bad interpolation variable reference: '" << value.substr(p2) << "'";
                }
                string name = m[1];
                if (not section.get_optional<string>(name)) {
                    throw TXRError() << "Reference to undefined key '" << name << "' in " << key << " = " << value;
                }
                value2 += section.get<string>(name);
                p1 = p2 + m.length(0);
            } else {
                throw TXRError() << "Bad interpolation variable reference: '" << value.substr(p2) << "'";
            }
        }
        value = value2;
    }
    return value;
}

ptree read_config_file(const string& filename) {
    ptree pt;
    try {
        boost::property_tree::ini_parser::read_ini(filename, pt);
    } catch (const boost::property_tree::ini_parser_error & x) {
        throw TXRError() << "Could not read config file \"" << filename << "\": " << x.what();
    }
    return pt;
}

optional<string> load_config(const string& filename, const string& section, const string& name)
{
    return interpolate(read_config_file(filename), section, name);
}

static void set_bool(const ptree& pt, const string& section, const string& key, bool & field) {
    auto v = interpolate(pt, section, key);
    if (v) {
        field = get_bool(strip_surrounding_whitespace(*v), "[" + section + "] " + key + ": ");
    }
}

static size_t get_size(const string& s, const string& key) {
    long n;
    if (not char_ptr_to_long(s.c_str(), &n) or n < 0) {
        throw TXRError() << "[tree] " << key << ": expecting a non-negative integer, found '" << s << "'";
    }
    return static_cast<size_t>(n);
}

ReconcileConfig load_reconcile_config(const ptree& pt) {
    ReconcileConfig cfg;
    const string section = "reconcile";
    if (auto v = interpolate(pt, section, "nomenclature")) {
        cfg.nomenclature = strip_surrounding_whitespace(*v);
    }
    if (auto v = interpolate(pt, section, "seq_id_prefix")) {
        cfg.seq_id_prefix = strip_surrounding_whitespace(*v);
    }
    set_bool(pt, section, "normalize", cfg.normalize);
    set_bool(pt, section, "close_gaps", cfg.close_gaps);
    set_bool(pt, section, "fix_duplicates", cfg.fix_duplicates);
    set_bool(pt, section, "fix_disbalance", cfg.fix_disbalance);
    return cfg;
}

vector<CladeSelector> parse_clade_selectors(const string& s) {
    vector<CladeSelector> sels;
    for (const auto & raw : split_string(s, ',')) {
        const auto entry = strip_surrounding_whitespace(raw);
        if (entry.empty()) {
            continue;
        }
        const auto colon = entry.find(':');
        if (colon == string::npos) {
            throw TXRError() << "Clade selector '" << entry << "' is not of the form rank:name";
        }
        const auto rank = entry.substr(0, colon);
        auto name = strip_surrounding_whitespace(entry.substr(colon + 1));
        const auto position = std_rank_position_from_string(rank);
        if (not position or name.empty()) {
            throw TXRError() << "Clade selector '" << entry << "' does not name a known rank and a clade";
        }
        sels.emplace_back(*position, name);
    }
    return sels;
}

TreeBuildConfig load_tree_build_config(const ptree& pt) {
    TreeBuildConfig cfg;
    const string section = "tree";
    if (auto v = interpolate(pt, section, "min_rank")) {
        auto position = std_rank_position_from_string(*v);
        if (not position) {
            throw TXRError() << "[tree] min_rank: '" << *v << "' is not a known rank";
        }
        cfg.min_rank = *position;
    }
    if (auto v = interpolate(pt, section, "max_seqs_per_leaf")) {
        const auto stripped = strip_surrounding_whitespace(*v);
        if (not stripped.empty()) {
            cfg.max_seqs_per_leaf = get_size(stripped, "max_seqs_per_leaf");
        }
    }
    if (auto v = interpolate(pt, section, "include_clades")) {
        cfg.clades_to_include = parse_clade_selectors(*v);
    }
    if (auto v = interpolate(pt, section, "ignore_clades")) {
        cfg.clades_to_ignore = parse_clade_selectors(*v);
    }
    return cfg;
}

}
