#pragma once

#include <pathex/explorer.hpp>

#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>


// Choice structure of a fake program: at each step the program asks for
// `options.size()` options and continues with the chosen one. No options means
// the program terminates.
struct script {
    std::vector<script> options;

    size_t num_leaves() const {
        if (options.empty()) {
            return 1;
        }
        return std::accumulate(options.begin(), options.end(), size_t(0), [](size_t acc, const script& s) {
            return acc + s.num_leaves();
        });
    }
};


inline script leaf() {
    return {};
}


inline script pick(std::vector<script> options) {
    return script{ std::move(options) };
}


inline script binary(size_t depth) {
    return depth == 0 ? leaf() : pick({ binary(depth - 1), binary(depth - 1) });
}


// Every root-to-leaf index sequence, lowest index first.
inline void enumerate(const script& s, std::vector<size_t>& prefix, std::vector<std::vector<size_t>>& out) {
    if (s.options.empty()) {
        out.push_back(prefix);
        return;
    }
    for (size_t index = 0; index < s.options.size(); ++index) {
        prefix.push_back(index);
        enumerate(s.options[index], prefix, out);
        prefix.pop_back();
    }
}


inline std::vector<std::vector<size_t>> enumerate(const script& s) {
    std::vector<size_t> prefix;
    std::vector<std::vector<size_t>> out;
    enumerate(s, prefix, out);
    return out;
}


struct scripted_program {
    explicit scripted_program(script root) : root(std::move(root)) {}

    void operator()(pathex::choice_port& port) {
        runs.push_back({});
        const script* current = &root;
        while (!current->options.empty()) {
            const auto chosen = port(current->options.size());
            runs.back().push_back(chosen);
            current = &current->options[chosen];
        }
    }

    pathex::program bind() {
        return [this](pathex::choice_port& port) { (*this)(port); };
    }

    script root;
    std::vector<std::vector<size_t>> runs;
};
