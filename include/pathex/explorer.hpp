#pragma once

#include "execution_tree.hpp"
#include "path.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <vector>


namespace pathex {


class explorer;


struct explorer_options {
    std::optional<size_t> max_runs = std::nullopt;
    std::ostream* trace = nullptr;
};


// Handed to the program for the duration of a single run.
class choice_port {
    friend class explorer;

public:
    choice_port(const choice_port&) = delete;
    choice_port& operator=(const choice_port&) = delete;

    size_t choose(size_t num_options);
    size_t operator()(size_t num_options) {
        return choose(num_options);
    }

    auto get_path() const -> const path&;

private:
    explicit choice_port(explorer& session);

private:
    explorer& m_session;
    node_id m_cursor = execution_tree::root_id;
    path m_path;
    std::vector<node_id> m_expanded;
};


using program = std::function<void(choice_port&)>;
using path_callback = std::function<void(const path&)>;


class explorer {
    friend class choice_port;

public:
    explicit explorer(explorer_options options = {});

    path run_next(const program& target);
    size_t explore(const program& target, const path_callback& on_path = {});
    size_t explore(const program& target, std::stop_token stop, const path_callback& on_path = {});
    void skip_failed_run();
    bool is_complete();

    void set_max_runs(std::optional<size_t> max_runs);
    auto get_tree() const -> const execution_tree&;
    size_t get_num_runs() const;

private:
    void check_consistent() const;
    [[noreturn]] void fail_consistency(const std::string& what, const path& so_far);

private:
    explorer_options m_options;
    execution_tree m_tree;
    size_t m_num_runs = 0;
    std::optional<path> m_failed_path;
    std::optional<std::string> m_fault;
};


std::vector<path> explore_all(const program& target, explorer_options options = {});

} // namespace pathex
