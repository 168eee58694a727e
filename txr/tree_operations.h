#ifndef TAXRECON_TREE_OPERATIONS_H
#define TAXRECON_TREE_OPERATIONS_H
// Functions that operate on trees - may include iteration
//  over trees
// Depends on: tree.h tree_iter.h
// Depended on by: taxonomy/tax_tree_builder.cpp tools
#include <ostream>
#include <vector>
#include "txr/txr_base_includes.h"
#include "txr/tree_iter.h"
#include "txr/util.h"

namespace txr {
template<typename T>
std::size_t n_nodes(const T& tree);
template<typename T>
std::size_t n_internal_out_degree_1(const T& tree);
template <typename T>
std::size_t suppress_monotypic_below_root(T& tree);
template<typename T, typename Y>
void write_newick_generic(std::ostream & out, const T * nd, Y & nodeNamer);

//// impl
template<typename T>
inline std::size_t n_nodes(const T& tree) {
    std::size_t count = 0;
    for (auto nd : iter_post_const(tree)) {
        if (nd) {
            count++;
        }
    }
    return count;
}

template<typename T>
inline std::size_t n_internal_out_degree_1(const T& tree) {
    std::size_t count = 0;
    for (auto nd : iter_post_internal_const(tree)) {
        if (nd->is_outdegree_one_node()) {
            count++;
        }
    }
    return count;
}

// the root is kept even if it has out-degree one. Returns the # of nodes deleted.
template <typename T>
inline std::size_t suppress_monotypic_below_root(T& tree) {
    std::vector<typename T::node_type*> remove;
    for (auto nd : iter_pre(tree)) {
        if (nd->get_parent() != nullptr && nd->is_outdegree_one_node()) {
            remove.push_back(nd);
        }
    }
    for (auto nd : remove) {
        tree.splice_out(nd);
    }
    return remove.size();
}

// nodeNamer returns the label of a node; empty labels are not written
template<typename T, typename Y>
inline void write_newick_generic(std::ostream & out, const T * nd, Y & nodeNamer) {
    assert(nd != nullptr);
    if (nd->is_internal()) {
        out << '(';
        bool first = true;
        for (auto c : iter_child_const(*nd)) {
            if (first) {
                first = false;
            } else {
                out << ',';
            }
            write_newick_generic<T, Y>(out, c, nodeNamer);
        }
        out << ')';
    }
    const std::string label = nodeNamer(nd);
    if (not label.empty()) {
        write_escaped_for_newick(out, label);
    }
}

} // namespace txr
#endif
