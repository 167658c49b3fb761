#pragma once

#include <algorithm>
#include <numeric>
#include <tuple>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/flow_solver.hpp"

// Single pass, no refinement. Nodes are visited in topological order, so a
// node has received all of its inflow before any of its out-edges is
// considered. At each node the out-edges are taken by role tier, then by
// unit cost:
//   serve demand, load stock, fly, process   (tier 0)
//   keep in storage, drain Source unused       (tier 1)
//   reposition empty seats, buy                (tier 2)
//   discard                                    (tier 3)
// Every push is bounded by the edge capacity, the kits waiting at the tail
// and the headroom left at the head (its total out capacity minus inflow).
class GreedySolver : public FlowSolver
{
    static int tier_(EdgeRole role)
    {
        switch (role)
        {
            case EdgeRole::DEMAND:
            case EdgeRole::INITIAL_INVENTORY:
            case EdgeRole::FLIGHT:
            case EdgeRole::PROCESSING:
                return 0;
            case EdgeRole::STORAGE:
            case EdgeRole::BALANCING:
                return 1;
            case EdgeRole::REPOSITION:
            case EdgeRole::PURCHASE:
                return 2;
            case EdgeRole::DISCARD:
                return 3;
        }
        return 3;
    }

    static std::vector<EdgeId> pushOrder_(Graph const& graph)
    {
        auto ranks = graph.topologicalRanks();
        std::vector<EdgeId> order(graph.numEdges());
        std::iota(order.begin(), order.end(), 0);

        auto key = [&](EdgeId e)
        {
            auto const& edge = graph.edge(e);
            return std::make_tuple(ranks[edge.from], tier_(edge.role()), edge.cost, e);
        };
        std::sort(order.begin(), order.end(), [&](EdgeId a, EdgeId b) { return key(a) < key(b); });
        return order;
    }

    static DictInt<Flow> headroom_(Graph const& graph)
    {
        DictInt<Flow> headroom(graph.numNodes(), 0);
        for (auto const& edge : graph.edges())
        {
            // Saturates at INFINITE_CAPACITY; several unbounded exits must not overflow.
            headroom[edge.from] = std::min(headroom[edge.from] + edge.capacity, INFINITE_CAPACITY);
        }
        return headroom;
    }

   public:
    std::string name() const override { return "greedy"; }

    Solution solve(Graph const& graph) override
    {
        logger_->info("Solving greedily on {} nodes, {} edges...", graph.numNodes(), graph.numEdges());

        Solution solution;
        solution.flow.assign(graph.numEdges(), 0);

        DictInt<Flow> waiting(graph.numNodes(), 0);
        auto headroom = headroom_(graph);

        KitArray<Flow> source_left{};
        for (KitType kit : ALL_KIT_TYPES) source_left[kitIndex(kit)] = graph.supply(kit);

        for (EdgeId e : pushOrder_(graph))
        {
            auto const& edge = graph.edge(e);
            int k = kitIndex(edge.kit());

            Flow& at_tail = edge.from == graph.source() ? source_left[k] : waiting[edge.from];
            Flow amount = std::min(edge.capacity, at_tail);
            if (edge.to != graph.sink())
                amount = std::min(amount, headroom[edge.to]);
            if (amount <= 0)
                continue;

            solution.flow[e] = amount;
            at_tail -= amount;
            if (edge.to != graph.sink())
            {
                waiting[edge.to] += amount;
                headroom[edge.to] -= amount;
            }
        }

        Flow stranded = 0;
        for (NodeId v = 0; v < static_cast<NodeId>(graph.numNodes()); ++v)
        {
            if (!graph.node(v).isTerminal())
                stranded += waiting[v];
        }
        if (stranded > 0)
            logger_->warn("Greedy pass left {} kits without an outlet.", stranded);

        solution.status = SolveStatus::GREEDY;
        solution.total_cost = evaluateCost(graph, solution.flow);
        logger_->info("Greedy solution with cost {:.2f}.", solution.total_cost);
        return solution;
    }
};
