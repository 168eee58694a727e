#ifndef TAXRECON_CONFIG_H
#define TAXRECON_CONFIG_H

#include <string>
#include <vector>
#include <optional>
#include <boost/property_tree/ptree.hpp>
#include "txr/txr_base_includes.h"
#include "txr/taxonomy/reconcile.h"
#include "txr/taxonomy/tax_tree_builder.h"

namespace txr {
std::optional<std::string> load_config(const std::string& filename, const std::string& section, const std::string& name);
std::optional<std::string> interpolate(const boost::property_tree::ptree& pt, const std::string& section_name, const std::string& key);
boost::property_tree::ptree read_config_file(const std::string& filename);

// the [reconcile] section
ReconcileConfig load_reconcile_config(const boost::property_tree::ptree& pt);
// the [tree] section
TreeBuildConfig load_tree_build_config(const boost::property_tree::ptree& pt);
// "class:Clostridia, o__:Bacillales" -> {(2, "Clostridia"), (3, "Bacillales")}
std::vector<CladeSelector> parse_clade_selectors(const std::string& s);
}
#endif
