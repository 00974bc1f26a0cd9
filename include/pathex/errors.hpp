#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>


namespace pathex {


// The program did not behave deterministically given its choice history.
struct consistency_fault : std::logic_error {
    explicit consistency_fault(const std::string& what) : std::logic_error(what) {}
};


struct target_failure : std::runtime_error {
    explicit target_failure(const std::string& what) : std::runtime_error(what) {}
};


struct exhaustion_limit : std::runtime_error {
    explicit exhaustion_limit(size_t num_runs)
        : std::runtime_error("run limit reached after " + std::to_string(num_runs) + " runs"), m_num_runs(num_runs) {}

    size_t get_num_runs() const noexcept {
        return m_num_runs;
    }

private:
    size_t m_num_runs;
};

} // namespace pathex
