#include <pathex/errors.hpp>
#include <pathex/explorer.hpp>

#include <exception>
#include <stdexcept>
#include <utility>


namespace pathex {


choice_port::choice_port(explorer& session)
    : m_session(session) {}


size_t choice_port::choose(size_t num_options) {
    // A program that swallowed a fault must not keep growing the tree.
    m_session.check_consistent();
    try {
        const bool expands = num_options > 1 && m_session.m_tree.get_node(m_cursor).state == node_state::unexplored;
        const auto [next, chosen] = m_session.m_tree.observe_choice(m_cursor, num_options);
        if (expands) {
            m_expanded.push_back(m_cursor);
        }
        m_cursor = next;
        m_path.steps.push_back({ num_options, chosen });
        return chosen;
    }
    catch (consistency_fault& ex) {
        m_session.fail_consistency(ex.what(), m_path);
    }
}


auto choice_port::get_path() const -> const path& {
    return m_path;
}


explorer::explorer(explorer_options options)
    : m_options(std::move(options)) {}


path explorer::run_next(const program& target) {
    check_consistent();
    m_tree.prune();
    if (m_tree.is_done()) {
        throw std::logic_error("exploration is already complete");
    }
    m_failed_path.reset();

    choice_port port(*this);
    try {
        target(port);
    }
    catch (...) {
        check_consistent();
        // Deepest expansion first, so every reverted node only has untouched children.
        for (auto it = port.m_expanded.rbegin(); it != port.m_expanded.rend(); ++it) {
            m_tree.revert_expansion(*it);
        }
        m_failed_path = port.m_path;
        if (m_options.trace) {
            *m_options.trace << "run " << m_num_runs + 1 << " failed after " << port.m_path << std::endl;
        }
        std::throw_with_nested(target_failure("program failed after choices " + port.m_path.dump()));
    }
    check_consistent();

    try {
        m_tree.mark_done(port.m_cursor);
    }
    catch (consistency_fault& ex) {
        fail_consistency(ex.what(), port.m_path);
    }
    ++m_num_runs;
    if (m_options.trace) {
        *m_options.trace << "run " << m_num_runs << ": " << port.m_path << std::endl;
    }
    return std::move(port.m_path);
}


size_t explorer::explore(const program& target, const path_callback& on_path) {
    return explore(target, std::stop_token{}, on_path);
}


size_t explorer::explore(const program& target, std::stop_token stop, const path_callback& on_path) {
    check_consistent();
    size_t num_runs = 0;
    while (!is_complete() && !stop.stop_requested()) {
        if (m_options.max_runs && m_num_runs >= *m_options.max_runs) {
            throw exhaustion_limit(m_num_runs);
        }
        const auto path_ = run_next(target);
        ++num_runs;
        if (on_path) {
            on_path(path_);
        }
    }
    return num_runs;
}


void explorer::skip_failed_run() {
    check_consistent();
    if (!m_failed_path) {
        throw std::logic_error("there is no failed run to skip");
    }
    const auto failed = std::move(*m_failed_path);
    m_failed_path.reset();

    // The failed run left no trace in the tree, so walk its choices again.
    node_id cursor = execution_tree::root_id;
    try {
        for (const auto& step : failed.steps) {
            const auto [next, chosen] = m_tree.observe_choice(cursor, step.num_options);
            if (chosen != step.chosen) {
                throw consistency_fault("failed run can no longer be reproduced");
            }
            cursor = next;
        }
        m_tree.mark_done(cursor);
    }
    catch (consistency_fault& ex) {
        fail_consistency(ex.what(), failed);
    }
}


bool explorer::is_complete() {
    m_tree.prune();
    return m_tree.is_done();
}


void explorer::set_max_runs(std::optional<size_t> max_runs) {
    m_options.max_runs = max_runs;
}


auto explorer::get_tree() const -> const execution_tree& {
    return m_tree;
}


size_t explorer::get_num_runs() const {
    return m_num_runs;
}


void explorer::check_consistent() const {
    if (m_fault) {
        throw consistency_fault(*m_fault);
    }
}


void explorer::fail_consistency(const std::string& what, const path& so_far) {
    m_fault = what + " after choices " + so_far.dump();
    if (m_options.trace) {
        *m_options.trace << "inconsistent program: " << *m_fault << std::endl;
    }
    throw consistency_fault(*m_fault);
}


std::vector<path> explore_all(const program& target, explorer_options options) {
    explorer session(std::move(options));
    std::vector<path> paths;
    session.explore(target, [&paths](const path& p) { paths.push_back(p); });
    return paths;
}

} // namespace pathex
