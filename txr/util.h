#ifndef TAXRECON_UTIL_H
#define TAXRECON_UTIL_H

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <iterator>
#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "txr/txr_base_includes.h"
#include "txr/error.h"

namespace txr {

enum QuotingRequirementsEnum {
    NO_QUOTES_NEEDED,
    UNDERSCORE_INSTEAD_OF_QUOTES,
    QUOTES_NEEDED
};

const std::string read_str_content_of_utf8_file(const std::string &filepath);
bool open_utf8_file(const std::string &filepath, std::ifstream & inp);

bool char_ptr_to_long(const char *c, long *n);
std::size_t find_first_graph_index(const std::string & s);
std::size_t find_last_graph_index(const std::string & s);
std::string strip_surrounding_whitespace(const std::string &n);
// consecutive delimiters will lead to an empty string
std::list<std::string> split_string(const std::string &s, const char delimiter);
// like split_string with a delimiter, but the delimiter may be several chars long
std::vector<std::string> split_on_token(const std::string &s, const std::string & token);
std::string join_strings(const std::vector<std::string> & v, const std::string & sep);
bool ends_with(const std::string & s, const std::string & suffix);
std::string to_lower_alnum(const std::string & s);
std::string replace_chars(const std::string & s, const char * to_replace, char replacement);

QuotingRequirementsEnum determine_newick_quoting_requirements(const std::string & s);
std::string add_newick_quotes(const std::string &s);
std::string blanks_to_underscores(const std::string &s);
void write_escaped_for_newick(std::ostream & out, const std::string & n);
template<typename T, typename U>
bool contains(const T & container, const U & key);
template<typename T>
inline bool vcontains(const std::vector<T> & container, const T & key);
template<typename T, typename U>
std::set<T> keys(const std::map<T, U> & container);

template<typename T, typename U>
inline bool contains(const T & container, const U & key) {
    return container.find(key) != container.end();
}
template<typename T>
inline bool vcontains(const std::vector<T> & container, const T & key) {
    for (const auto & el : container) {
        if (el == key) {
            return true;
        }
    }
    return false;
}
template<typename T, typename U>
inline std::set<T> keys(const std::map<T, U> & container) {
    std::set<T> k;
    for (const auto & x : container) {
        k.insert(x.first);
    }
    return k;
}

// bytes >= 0x80 belong to multibyte (UTF-8) characters and are never whitespace
inline bool is_graph_byte(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isgraph(u);
}

inline std::size_t find_first_graph_index(const std::string & s) {
    std::size_t pos = 0U;
    for (const auto & c : s) {
        if (is_graph_byte(c)) {
            return pos;
        }
        ++pos;
    }
    return std::string::npos;
}

inline std::size_t find_last_graph_index(const std::string & s) {
    auto pos = s.length();
    while (pos > 0) {
        --pos;
        if (is_graph_byte(s[pos])) {
            return pos;
        }
    }
    return std::string::npos;
}

inline std::string strip_surrounding_whitespace(const std::string &n) {
    const auto s = find_first_graph_index(n);
    if (s == std::string::npos) {
        return std::string();
    }
    const auto e = find_last_graph_index(n);
    assert(e != std::string::npos);
    return n.substr(s, 1 + e - s);
}

inline bool ends_with(const std::string & s, const std::string & suffix) {
    if (suffix.length() > s.length()) {
        return false;
    }
    return std::equal(suffix.rbegin(), suffix.rend(), s.rbegin());
}

inline QuotingRequirementsEnum determine_newick_quoting_requirements(const std::string & s) {
    QuotingRequirementsEnum nrq = NO_QUOTES_NEEDED;
    for (const auto & c : s) {
        if (!is_graph_byte(c)) {
            if (c != ' ') {
                return QUOTES_NEEDED;
            }
            nrq  = UNDERSCORE_INSTEAD_OF_QUOTES;
        } else if (strchr("(){}\"-]/\\,;:=*`+<>", c) != nullptr) {
            return (s.length() > 1 ? QUOTES_NEEDED : NO_QUOTES_NEEDED);
        } else if (strchr("\'[_", c) != nullptr) {
            return QUOTES_NEEDED;
        }
    }
    return nrq;
}

inline std::string add_newick_quotes(const std::string &s) {
    std::string withQuotes;
    withQuotes.reserve(s.length() + 4);
    withQuotes.append(1,'\'');
    for (const auto & c : s) {
        withQuotes.append(1, c);
        if (c == '\'') {
            withQuotes.append(1,'\'');
        }
    }
    withQuotes.append(1,'\'');
    return withQuotes;
}

inline std::string blanks_to_underscores(const std::string &s) {
    std::string r{s};
    std::replace(begin(r), end(r), ' ', '_');
    return r;
}

inline void write_escaped_for_newick(std::ostream & out, const std::string & n) {
    const QuotingRequirementsEnum r = determine_newick_quoting_requirements(n);
    if (r == NO_QUOTES_NEEDED) {
        out << n;
    } else if (r == UNDERSCORE_INSTEAD_OF_QUOTES) {
        out << blanks_to_underscores(n);
    } else {
        out << add_newick_quotes(n);
    }
}

} //namespace txr
#endif
