#ifndef TAXRECON_NOMENCLATURE_H
#define TAXRECON_NOMENCLATURE_H

#include <string>

namespace Nomenclature
{
    struct Code
    {
        std::string name;
        std::string short_name;
        std::string description;
        Code(const std::string&, const std::string&, const std::string&);
    };
    
    extern const Code ICNP;
    extern const Code ICN;
    extern const Code ICZN;
    extern const Code ICTV;

    // accepts the short name ("bac", "bot", "zoo", "vir") or the code name, in any case.
    //  Returns nullptr for an unknown code.
    const Code * code_from_name(const std::string &);
}

#endif
