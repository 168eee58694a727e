#include "txr/taxonomy/nomenclature.h"
#include <algorithm>
#include <cctype>

using std::string;

namespace Nomenclature
{
    Code::Code(const string& n, const string& s, const string& d):name(n),short_name(s),description(d) {}
    const Code ICNP("ICNP", "bac", "bacteria and archaea");
    const Code ICN ("ICN",  "bot", "plants, algae and fungi");
    const Code ICZN("ICZN", "zoo", "animals");
    const Code ICTV("ICTV", "vir", "viruses");

    const Code * code_from_name(const string & raw) {
        string n = raw;
        std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return std::tolower(c); });
        for (auto c : {&ICNP, &ICN, &ICZN, &ICTV}) {
            string lname = c->name;
            std::transform(lname.begin(), lname.end(), lname.begin(), [](unsigned char x) { return std::tolower(x); });
            if (n == c->short_name or n == lname) {
                return c;
            }
        }
        return nullptr;
    }
}
