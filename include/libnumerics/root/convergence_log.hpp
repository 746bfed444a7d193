#pragma once

#include <cstddef>
#include <vector>

namespace num::root {

struct IterationEntry {
    std::size_t iteration;
    std::vector<double> x;   // abscissas evaluated this iteration
    std::vector<double> fx;  // f at each abscissa, same length as x
};

// Append-only record of a single search. Cleared by reset().
class ConvergenceLog {
public:
    // Throws std::invalid_argument if x and fx differ in length or if
    // iteration does not exceed the last recorded index.
    void add_entry(std::size_t iteration, std::vector<double> x, std::vector<double> fx);

    const std::vector<IterationEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void reset();

private:
    std::vector<IterationEntry> entries_;
};

} // namespace num::root
