#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "txr/util.h"

namespace txr {

bool debugging_output_enabled = false;

const std::string read_str_content_of_utf8_file(const std::string &filepath) {
    std::ifstream inp;
    if (!open_utf8_file(filepath, inp)) {
        throw TXRError("Could not open \"" + filepath + "\"");
    }
    const std::string utf8content((std::istreambuf_iterator<char>(inp) ),
                                    (std::istreambuf_iterator<char>()));
    return utf8content;
}

bool open_utf8_file(const std::string &filepath, std::ifstream & inp) {
    inp.open(filepath);
    return inp.good();
}

/*!
    Returns true if `o` points to a string that represents a long (and `o` has no other characters than the long).
    if n is not NULL, then when the function returns true, *n will be the long.
*/
bool char_ptr_to_long(const char *o, long *n) {
    if (o == nullptr || *o == '\0') {
        return false;
    }
    if (strchr("0123456789-+", *o) != nullptr) {
        char * pEnd;
        const long i = strtol(o, &pEnd, 10);
        if (*pEnd != '\0') {
            return false;
        }
        if (n != NULL) {
            *n = i;
        }
        return true;
    }
    return false;
}

// splits a string by whitespace and push the graphical strings to the back of r.
//  Leading and trailing whitespace is lost ( there will be no empty strings added
//      to the list.
std::list<std::string> split_string(const std::string &s, const char delimiter) {
    if (s.empty()) {
        return {};
    }
    std::list<std::string> r;
    r.push_back({});
    for (const auto & c : s) {
        if (c == delimiter) {
            r.push_back({});
        } else {
            r.back().append(1, c);
        }
    }
    return r;
}

std::vector<std::string> split_on_token(const std::string &s, const std::string & token) {
    assert(not token.empty());
    std::vector<std::string> r;
    if (s.empty()) {
        return r;
    }
    std::size_t start = 0U;
    for (;;) {
        const auto found = s.find(token, start);
        if (found == std::string::npos) {
            r.push_back(s.substr(start));
            break;
        }
        r.push_back(s.substr(start, found - start));
        start = found + token.length();
    }
    return r;
}

std::string join_strings(const std::vector<std::string> & v, const std::string & sep) {
    std::string r;
    for (auto it = v.begin(); it != v.end(); ++it) {
        if (it != v.begin()) {
            r.append(sep);
        }
        r.append(*it);
    }
    return r;
}

// lowercased copy of `s` with everything but ASCII letters and digits dropped
std::string to_lower_alnum(const std::string & s) {
    std::string r;
    r.reserve(s.length());
    for (const auto & c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            r.append(1, static_cast<char>(std::tolower(uc)));
        }
    }
    return r;
}

std::string replace_chars(const std::string & s, const char * to_replace, char replacement) {
    std::string r{s};
    for (auto & c : r) {
        if (c != '\0' && strchr(to_replace, c) != nullptr) {
            c = replacement;
        }
    }
    return r;
}

}//namespace txr
