#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>


namespace pathex {


using node_id = size_t;


enum class node_state {
    unexplored,
    branch,
    done,
};


class execution_tree {
public:
    struct node {
        bool operator==(const node&) const = default;
        node_state state = node_state::unexplored;
        std::vector<node_id> children;
    };

    static constexpr node_id root_id = 0;

public:
    execution_tree();

    /// Resolve a choice among `num_options` at `cursor`.
    /// Returns the node the program moves to and the index it has to take.
    /// Unexplored nodes are expanded and the first child is taken, branch nodes
    /// resume at their first child that is not yet done. Single-option choices
    /// leave the tree untouched.
    auto observe_choice(node_id cursor, size_t num_options) -> std::pair<node_id, size_t>;

    /// Record that a run terminated at `cursor`.
    void mark_done(node_id cursor);

    /// Collapse every subtree whose children are all done.
    void prune();

    /// Undo the expansion of a node whose children were never entered.
    void revert_expansion(node_id id);

    bool is_done() const;
    auto get_node(node_id id) const -> const node&;
    size_t num_nodes() const;
    std::string dump() const;

    bool operator==(const execution_tree& rhs) const;

private:
    node_id allocate();
    void release(node_id id);
    void check_valid(node_id id) const;

private:
    std::vector<node> m_nodes;
    std::vector<node_id> m_free;
};

} // namespace pathex
