#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>


namespace pathex {


struct choice {
    bool operator==(const choice&) const = default;
    size_t num_options = 1;
    size_t chosen = 0;
};


struct path {
    bool operator==(const path&) const = default;

    std::vector<size_t> indices() const;
    std::string dump() const;

    std::vector<choice> steps;
};


std::ostream& operator<<(std::ostream& os, const path& p);

} // namespace pathex
