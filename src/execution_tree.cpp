#include <pathex/errors.hpp>
#include <pathex/execution_tree.hpp>

#include <algorithm>
#include <sstream>
#include <stack>
#include <stdexcept>


namespace pathex {


static const char* to_string(node_state state) {
    switch (state) {
        case node_state::unexplored: return "unexplored";
        case node_state::branch: return "branch";
        case node_state::done: return "done";
    }
    return "?";
}


execution_tree::execution_tree()
    : m_nodes(1) {}


auto execution_tree::observe_choice(node_id cursor, size_t num_options) -> std::pair<node_id, size_t> {
    check_valid(cursor);
    if (num_options == 0) {
        throw std::invalid_argument("a choice must offer at least one option");
    }
    if (m_nodes[cursor].state == node_state::done) {
        throw consistency_fault("choice requested at a fully explored node");
    }
    if (num_options == 1) {
        return { cursor, 0 };
    }

    if (m_nodes[cursor].state == node_state::unexplored) {
        std::vector<node_id> children(num_options);
        std::ranges::generate(children, [this] { return allocate(); });
        auto& current = m_nodes[cursor];
        current.state = node_state::branch;
        current.children = std::move(children);
        return { current.children.front(), 0 };
    }

    const auto& current = m_nodes[cursor];
    if (current.children.size() != num_options) {
        std::stringstream ss;
        ss << "choice offers " << num_options << " options where a previous run recorded " << current.children.size();
        throw consistency_fault(ss.str());
    }
    const auto it = std::ranges::find_if(current.children, [this](node_id child) {
        return m_nodes[child].state != node_state::done;
    });
    if (it == current.children.end()) {
        throw consistency_fault("every option of the choice is fully explored");
    }
    return { *it, static_cast<size_t>(it - current.children.begin()) };
}


void execution_tree::mark_done(node_id cursor) {
    check_valid(cursor);
    auto& current = m_nodes[cursor];
    if (current.state == node_state::done) {
        throw consistency_fault("run terminated at a fully explored node");
    }
    if (current.state == node_state::branch) {
        throw consistency_fault("run terminated where a previous run made another choice");
    }
    current.state = node_state::done;
}


void execution_tree::prune() {
    // Post-order: a branch is revisited once all of its children were pruned.
    std::stack<std::pair<node_id, bool>> worklist;
    worklist.push({ root_id, false });

    while (!worklist.empty()) {
        const auto [id, children_pruned] = worklist.top();
        worklist.pop();

        if (m_nodes[id].state != node_state::branch) {
            continue;
        }
        if (!children_pruned) {
            worklist.push({ id, true });
            for (const auto child : m_nodes[id].children) {
                if (m_nodes[child].state == node_state::branch) {
                    worklist.push({ child, false });
                }
            }
            continue;
        }

        auto& current = m_nodes[id];
        const bool complete = std::ranges::all_of(current.children, [this](node_id child) {
            return m_nodes[child].state == node_state::done;
        });
        if (complete) {
            for (const auto child : current.children) {
                release(child);
            }
            current.children = {};
            current.state = node_state::done;
        }
    }
}


void execution_tree::revert_expansion(node_id id) {
    check_valid(id);
    auto& current = m_nodes[id];
    const bool fresh = current.state == node_state::branch
                       && std::ranges::all_of(current.children, [this](node_id child) {
                              return m_nodes[child].state == node_state::unexplored;
                          });
    if (!fresh) {
        throw std::logic_error("only a node with untouched children can be reverted");
    }
    for (const auto child : current.children) {
        release(child);
    }
    current.children = {};
    current.state = node_state::unexplored;
}


bool execution_tree::is_done() const {
    return m_nodes[root_id].state == node_state::done;
}


auto execution_tree::get_node(node_id id) const -> const node& {
    check_valid(id);
    return m_nodes[id];
}


size_t execution_tree::num_nodes() const {
    return m_nodes.size() - m_free.size();
}


std::string execution_tree::dump() const {
    std::stringstream ss;

    std::stack<node_id> worklist;
    worklist.push(root_id);

    ss << "digraph G {\n";

    while (!worklist.empty()) {
        const auto id = worklist.top();
        worklist.pop();

        const auto& current = m_nodes[id];
        ss << "_" << id << " [label=\"" << to_string(current.state) << "\"];\n";
        for (size_t index = 0; index < current.children.size(); ++index) {
            ss << "_" << id << " -> _" << current.children[index] << " [label=" << index << "];\n";
            worklist.push(current.children[index]);
        }
    }

    ss << "}";

    return ss.str();
}


bool execution_tree::operator==(const execution_tree& rhs) const {
    std::stack<std::pair<node_id, node_id>> worklist;
    worklist.push({ root_id, root_id });

    while (!worklist.empty()) {
        const auto [lhs_id, rhs_id] = worklist.top();
        worklist.pop();

        const auto& lhs_node = m_nodes[lhs_id];
        const auto& rhs_node = rhs.m_nodes[rhs_id];
        if (lhs_node.state != rhs_node.state || lhs_node.children.size() != rhs_node.children.size()) {
            return false;
        }
        for (size_t index = 0; index < lhs_node.children.size(); ++index) {
            worklist.push({ lhs_node.children[index], rhs_node.children[index] });
        }
    }
    return true;
}


node_id execution_tree::allocate() {
    if (!m_free.empty()) {
        const auto id = m_free.back();
        m_free.pop_back();
        return id;
    }
    m_nodes.emplace_back();
    return m_nodes.size() - 1;
}


void execution_tree::release(node_id id) {
    m_nodes[id] = node{};
    m_free.push_back(id);
}


void execution_tree::check_valid(node_id id) const {
    if (id >= m_nodes.size()) {
        throw std::out_of_range("node id is not part of the tree");
    }
}

} // namespace pathex
