#ifndef TAXRECON_TREE_ITER_H
#define TAXRECON_TREE_ITER_H
// Iterators for traversing trees. P is a node pointer, const or not.
// Depends on: tree.h
// Depended on by: tree_operations.h

#include <functional>
#include <stdexcept>
#include "txr/txr_base_includes.h"
#include "txr/tree.h"

namespace txr {

template<typename P>
inline P find_leftmost_in_subtree(P nd) {
    while (nd != nullptr && nd->get_first_child() != nullptr) {
        nd = nd->get_first_child();
    }
    return nd;
}

/// visits ancestors before descendants
template<typename P>
class preorder_iterator {
    public:
        explicit preorder_iterator(P start)
            :curr(start) {
        }
        bool operator!=(const preorder_iterator & other) const {
            return curr != other.curr;
        }
        P operator*() const {
            return curr;
        }
        preorder_iterator & operator++() {
            if (curr == nullptr) {
                throw std::out_of_range("Incremented a dead preorder_iterator");
            }
            if (curr->get_first_child() != nullptr) {
                curr = curr->get_first_child();
                return *this;
            }
            while (curr != nullptr && curr->get_next_sib() == nullptr) {
                curr = curr->get_parent();
            }
            if (curr != nullptr) {
                curr = curr->get_next_sib();
            }
            return *this;
        }
    private:
        P curr;
};

/// descendants before ancestors, skipping the nodes that fail the filter
template<typename P>
class postorder_iterator {
    public:
        using filter_type = std::function<bool(P)>;
        postorder_iterator(P subtree_root, filter_type f)
            :last(subtree_root),
            curr(find_leftmost_in_subtree(subtree_root)),
            filter(std::move(f)) {
            skip_filtered();
        }
        bool operator!=(const postorder_iterator & other) const {
            return curr != other.curr;
        }
        P operator*() const {
            return curr;
        }
        postorder_iterator & operator++() {
            if (curr == nullptr) {
                throw std::out_of_range("Incremented a dead postorder_iterator");
            }
            step();
            skip_filtered();
            return *this;
        }
    private:
        void step() {
            if (curr == last) {
                curr = nullptr;
                return;
            }
            auto sib = curr->get_next_sib();
            curr = (sib == nullptr ? curr->get_parent() : find_leftmost_in_subtree(sib));
        }
        void skip_filtered() {
            while (curr != nullptr && filter && !filter(curr)) {
                step();
            }
        }
        P last;
        P curr;
        filter_type filter;
};

/// follows one link per step: next sibling for children, parent for ancestors
template<typename P>
class link_iterator {
    public:
        using step_type = P (*)(P);
        link_iterator(P start, step_type s)
            :curr(start),
            step(s) {
        }
        bool operator!=(const link_iterator & other) const {
            return curr != other.curr;
        }
        P operator*() const {
            return curr;
        }
        link_iterator & operator++() {
            if (curr == nullptr) {
                throw std::out_of_range("Incremented a dead link_iterator");
            }
            curr = step(curr);
            return *this;
        }
    private:
        P curr;
        step_type step;
};

template<typename It>
class NodeRange {
    public:
        NodeRange(It b, It e)
            :first(std::move(b)),
            past_last(std::move(e)) {
        }
        It begin() const {
            return first;
        }
        It end() const {
            return past_last;
        }
    private:
        It first;
        It past_last;
};

template<typename P>
inline P next_sib_of(P nd) {
    return nd->get_next_sib();
}

template<typename P>
inline P parent_of(P nd) {
    return nd->get_parent();
}

// the public interface
template<typename T>
using ConstNodePtr = const typename T::node_type *;

template<typename T>
inline NodeRange<preorder_iterator<typename T::node_type *> > iter_pre(T & tree) {
    using It = preorder_iterator<typename T::node_type *>;
    return {It(tree.get_root()), It(nullptr)};
}

template<typename T>
inline NodeRange<postorder_iterator<ConstNodePtr<T> > > iter_post_const(const T & tree) {
    using It = postorder_iterator<ConstNodePtr<T> >;
    return {It(tree.get_root(), nullptr), It(nullptr, nullptr)};
}

template<typename T>
inline NodeRange<postorder_iterator<ConstNodePtr<T> > > iter_post_internal_const(const T & tree) {
    using It = postorder_iterator<ConstNodePtr<T> >;
    return {It(tree.get_root(), [](ConstNodePtr<T> nd) { return nd->is_internal(); }), It(nullptr, nullptr)};
}

template<typename T>
inline NodeRange<postorder_iterator<ConstNodePtr<T> > > iter_leaf_const(const T & tree) {
    using It = postorder_iterator<ConstNodePtr<T> >;
    return {It(tree.get_root(), [](ConstNodePtr<T> nd) { return nd->is_tip(); }), It(nullptr, nullptr)};
}

template<typename N>
inline NodeRange<link_iterator<const N *> > iter_child_const(const N & node) {
    using It = link_iterator<const N *>;
    return {It(node.get_first_child(), &next_sib_of<const N *>), It(nullptr, nullptr)};
}

template<typename N>
inline NodeRange<link_iterator<const N *> > iter_anc_const(const N & node) {
    using It = link_iterator<const N *>;
    return {It(node.get_parent(), &parent_of<const N *>), It(nullptr, nullptr)};
}

} // namespace txr
#endif
