#pragma once

#include <string>
#include <vector>

#include "core/graph.hpp"

enum class SolveStatus
{
    UNDEFINED,
    OPTIMAL,
    FEASIBLE,
    INFEASIBLE,
    UNBALANCED,
    TIMEOUT,
    ERROR,
    GREEDY
};

inline std::string statusName(SolveStatus status)
{
    switch (status)
    {
        case SolveStatus::UNDEFINED:
            return "UNDEFINED";
        case SolveStatus::OPTIMAL:
            return "OPTIMAL";
        case SolveStatus::FEASIBLE:
            return "FEASIBLE";
        case SolveStatus::INFEASIBLE:
            return "INFEASIBLE";
        case SolveStatus::UNBALANCED:
            return "UNBALANCED";
        case SolveStatus::TIMEOUT:
            return "TIMEOUT";
        case SolveStatus::ERROR:
            return "ERROR";
        case SolveStatus::GREEDY:
            return "GREEDY";
    }
    return "UNDEFINED";
}

struct Solution
{
    SolveStatus status{SolveStatus::UNDEFINED};
    Cost total_cost{};
    DictInt<Flow> flow{};  // indexed by EdgeId

    bool usable() const
    {
        return status == SolveStatus::OPTIMAL || status == SolveStatus::FEASIBLE || status == SolveStatus::GREEDY;
    }

    Flow flowOn(EdgeId e) const { return e >= 0 && e < static_cast<EdgeId>(flow.size()) ? flow[e] : 0; }
};

// Operating cost of the flow plus the penalty of every unserved passenger.
inline Cost evaluateCost(Graph const& graph, DictInt<Flow> const& flow)
{
    Cost total = 0;
    for (EdgeId e = 0; e < static_cast<EdgeId>(graph.numEdges()); ++e)
    {
        auto const& edge = graph.edge(e);
        Flow f = e < static_cast<EdgeId>(flow.size()) ? flow[e] : 0;
        if (auto const* demand = edge.as<DemandEdge>())
            total += demand->penalty * static_cast<Cost>(edge.capacity - f);
        else
            total += edge.cost * static_cast<Cost>(f);
    }
    return total;
}

// Lists every violated flow invariant; empty means the flow is valid.
inline std::vector<std::string> checkFlow(Graph const& graph, DictInt<Flow> const& flow)
{
    std::vector<std::string> violations;
    if (flow.size() != graph.numEdges())
    {
        violations.push_back("flow vector has " + std::to_string(flow.size()) + " entries for " +
                             std::to_string(graph.numEdges()) + " edges");
        return violations;
    }

    DictInt<Flow> balance(graph.numNodes(), 0);
    for (EdgeId e = 0; e < static_cast<EdgeId>(graph.numEdges()); ++e)
    {
        auto const& edge = graph.edge(e);
        Flow f = flow[e];
        if (f < 0 || f > edge.capacity)
        {
            violations.push_back(edgeRoleName(edge.role()) + " edge " + graph.describe(edge.from) + " -> " +
                                 graph.describe(edge.to) + " carries " + std::to_string(f) + " outside [0, " +
                                 std::to_string(edge.capacity) + "]");
        }
        balance[edge.from] -= f;
        balance[edge.to] += f;

        if (auto const* purchase = edge.as<PurchaseEdge>())
        {
            if (purchase->delivery_time - purchase->order_time < purchase->lead_time)
                violations.push_back("purchase of " + kitName(purchase->kit) + " delivered before its lead time");
        }
    }

    for (NodeId v = 0; v < static_cast<NodeId>(graph.numNodes()); ++v)
    {
        if (graph.node(v).isTerminal())
            continue;
        if (balance[v] != 0)
        {
            violations.push_back("node " + graph.describe(v) + " is out of balance by " +
                                 std::to_string(balance[v]));
        }
    }

    if (-balance[graph.source()] != balance[graph.sink()])
    {
        violations.push_back("source emits " + std::to_string(-balance[graph.source()]) + " but sink absorbs " +
                             std::to_string(balance[graph.sink()]));
    }

    return violations;
}
