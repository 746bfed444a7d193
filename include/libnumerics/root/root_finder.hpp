#pragma once

#include "libnumerics/root/convergence_log.hpp"
#include "libnumerics/root/types.hpp"

namespace num::root {

// Top-level contract shared by the iteration driver and Brent's method.
// find_root() resets the convergence log before it starts; the log returned
// afterwards belongs to the most recent search.
class RootFinder {
public:
    virtual ~RootFinder() = default;

    virtual Result find_root() = 0;
    virtual const ConvergenceLog& convergence_log() const = 0;
    virtual Method method() const = 0;
};

} // namespace num::root
