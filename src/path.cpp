#include <pathex/path.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>


namespace pathex {


std::vector<size_t> path::indices() const {
    std::vector<size_t> result;
    std::ranges::transform(steps, std::back_inserter(result), [](const choice& c) { return c.chosen; });
    return result;
}


std::string path::dump() const {
    std::stringstream ss;
    ss << "{";
    for (size_t index = 0; index < steps.size(); ++index) {
        ss << (index == 0 ? "" : ", ") << steps[index].chosen << "/" << steps[index].num_options;
    }
    ss << "}";
    return ss.str();
}


std::ostream& operator<<(std::ostream& os, const path& p) {
    return os << p.dump();
}

} // namespace pathex
