#ifndef TAXRECON_TREE_H
#define TAXRECON_TREE_H

#include <string>
#include <vector>
#include "txr/txr_base_includes.h"

namespace txr {

// first-child/next-sibling node. Nodes are created and deleted only by the
//  RootedTree that owns them.
template<typename T>
class RootedTreeNode {
    public:
        using node_type = RootedTreeNode<T>;
        using data_type = T;

        bool is_tip() const {
            return first_child == nullptr;
        }
        bool is_internal() const {
            return first_child != nullptr;
        }
        bool is_outdegree_one_node() const {
            return first_child != nullptr && first_child->next_sib == nullptr;
        }
        const node_type * get_parent() const { return parent; }
              node_type * get_parent()       { return parent; }
        const node_type * get_first_child() const { return first_child; }
              node_type * get_first_child()       { return first_child; }
        const node_type * get_next_sib() const { return next_sib; }
              node_type * get_next_sib()       { return next_sib; }

        const std::string & get_name() const {
            return name;
        }
        void set_name(std::string n) {
            name = std::move(n);
        }
        const T & get_data() const {
            return data;
        }
        T & get_data() {
            return data;
        }
    private:
        explicit RootedTreeNode(node_type * par)
            :parent(par) {
        }
        RootedTreeNode(const node_type &) = delete;
        node_type & operator=(const node_type &) = delete;

        node_type * first_child = nullptr;
        node_type * last_child = nullptr;
        node_type * prev_sib = nullptr;
        node_type * next_sib = nullptr;
        node_type * parent;
        std::string name;
        T data;

        template<typename> friend class RootedTree;
};

template<typename T>
class RootedTree {
    public:
        using node_type = RootedTreeNode<T>;

        RootedTree() = default;
        RootedTree(const RootedTree &) = delete;
        RootedTree & operator=(const RootedTree &) = delete;
        ~RootedTree() {
            clear();
        }
        const node_type * get_root() const {
            return root;
        }
        node_type * get_root() {
            return root;
        }
        // discards any existing nodes
        node_type * create_root() {
            clear();
            root = new node_type(nullptr);
            return root;
        }
        // appends a new rightmost child to par
        node_type * create_child(node_type * par) {
            assert(par != nullptr);
            auto c = new node_type(par);
            if (par->last_child == nullptr) {
                par->first_child = c;
            } else {
                par->last_child->next_sib = c;
                c->prev_sib = par->last_child;
            }
            par->last_child = c;
            return c;
        }
        // deletes the non-root, out-degree one node nd. Its only child takes
        //  nd's place among nd's siblings.
        void splice_out(node_type * nd) {
            assert(nd != nullptr && nd->parent != nullptr && nd->is_outdegree_one_node());
            auto child = nd->first_child;
            auto par = nd->parent;
            child->parent = par;
            child->prev_sib = nd->prev_sib;
            child->next_sib = nd->next_sib;
            if (nd->prev_sib) {
                nd->prev_sib->next_sib = child;
            } else {
                par->first_child = child;
            }
            if (nd->next_sib) {
                nd->next_sib->prev_sib = child;
            } else {
                par->last_child = child;
            }
            delete nd;
        }
        void clear() {
            std::vector<node_type *> nodes;
            if (root != nullptr) {
                nodes.push_back(root);
            }
            for (std::size_t i = 0; i < nodes.size(); ++i) {
                for (auto c = nodes[i]->first_child; c != nullptr; c = c->next_sib) {
                    nodes.push_back(c);
                }
            }
            for (auto nd : nodes) {
                delete nd;
            }
            root = nullptr;
        }
    private:
        node_type * root = nullptr;
};

enum class TaxNodeKind {
    ROOT,
    CLADE,
    SEQUENCE
};

// Node payload of a taxonomy tree. The label is kept in the node name: the
//  LineageKey for clades, the sequence id for leaves, nothing for the root.
struct RTTaxNodeData {
    TaxNodeKind kind = TaxNodeKind::CLADE;
    // position in the RankPath of the clade (or of the sequence's parent clade)
    int rank_level = UNASSIGNED_RANK_LEVEL;
};

} // namespace txr
#endif
