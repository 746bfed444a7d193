#include "libnumerics/root/convergence_log.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace num::root {

void ConvergenceLog::add_entry(std::size_t iteration,
                               std::vector<double> x,
                               std::vector<double> fx) {
    if (x.size() != fx.size()) {
        throw std::invalid_argument("ConvergenceLog: x and fx must have the same length ("
                                    + std::to_string(x.size()) + " vs "
                                    + std::to_string(fx.size()) + ")");
    }
    if (!entries_.empty() && iteration <= entries_.back().iteration) {
        throw std::invalid_argument("ConvergenceLog: iteration indices must be strictly increasing");
    }
    entries_.push_back({iteration, std::move(x), std::move(fx)});
}

void ConvergenceLog::reset() {
    entries_.clear();
}

} // namespace num::root
