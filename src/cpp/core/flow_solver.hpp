#pragma once

#include <string>

#include "core/graph.hpp"
#include "core/solution.hpp"

// Common shape of the exact and greedy solvers. A solver never throws for a
// graph it cannot handle; it reports that through Solution::status.
class FlowSolver
{
   public:
    virtual ~FlowSolver() = default;

    virtual Solution solve(Graph const& graph) = 0;
    virtual std::string name() const = 0;
};
