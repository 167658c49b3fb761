#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <future>
#include <utility>
#include <vector>

#include <ortools/graph/min_cost_flow.h>

#include "app/spdlog_tmp.hpp"
#include "core/flow_solver.hpp"

struct MinCostFlowOptions
{
    double time_limit_seconds{30.0};
    bool accept_incumbent_on_timeout{false};
    bool parallel{true};
    // OR-tools works on integer costs; costs are multiplied by this first.
    double cost_scale{1000.0};
};

// Exact solver on OR-tools SimpleMinCostFlow, one independent subproblem per
// kit type. The time limit is checked before each subproblem starts.
class MinCostFlowSolver : public FlowSolver
{
    using clock = std::chrono::steady_clock;
    using OrFlow = operations_research::SimpleMinCostFlow;

    struct KitResult
    {
        KitType kit{KitType::ECONOMY};
        SolveStatus status{SolveStatus::UNDEFINED};
        std::vector<std::pair<EdgeId, Flow>> flow{};
        size_t arcs{};
    };

    MinCostFlowOptions options_;

    int64_t scale_(Cost cost) const { return static_cast<int64_t>(std::llround(cost * options_.cost_scale)); }

    static SolveStatus fromOrStatus_(OrFlow::Status status)
    {
        switch (status)
        {
            case OrFlow::OPTIMAL:
                return SolveStatus::OPTIMAL;
            case OrFlow::FEASIBLE:
                return SolveStatus::FEASIBLE;
            case OrFlow::INFEASIBLE:
                return SolveStatus::INFEASIBLE;
            case OrFlow::UNBALANCED:
                return SolveStatus::UNBALANCED;
            default:
                return SolveStatus::ERROR;
        }
    }

    bool timeLimitExceeded_(clock::time_point const& start_time) const
    {
        std::chrono::duration<double> elapsed = clock::now() - start_time;
        return elapsed.count() >= options_.time_limit_seconds;
    }

    // Everything through the balancing edge: a valid flow that serves nobody.
    static KitResult drainThroughBalancing_(Graph const& graph, KitResult result)
    {
        for (EdgeId e = 0; e < static_cast<EdgeId>(graph.numEdges()); ++e)
        {
            auto const& edge = graph.edge(e);
            if (edge.kit() == result.kit && edge.role() == EdgeRole::BALANCING)
            {
                result.flow.emplace_back(e, graph.supply(result.kit));
                result.status = SolveStatus::FEASIBLE;
                return result;
            }
        }
        result.status = SolveStatus::TIMEOUT;
        return result;
    }

    KitResult solveKit_(Graph const& graph, KitType kit, clock::time_point const& start_time) const
    {
        KitResult result;
        result.kit = kit;

        Flow supply = graph.supply(kit);
        if (supply > 0 && !graph.hasBalancingEdge(kit))
        {
            logger_->error("{}: supply {} has no balancing edge to drain into.", kitName(kit), supply);
            result.status = SolveStatus::UNBALANCED;
            return result;
        }

        if (supply > 0 && timeLimitExceeded_(start_time))
        {
            logger_->warn("{}: time limit reached before solving, {} kits unrouted.", kitName(kit), supply);
            if (options_.accept_incumbent_on_timeout)
                return drainThroughBalancing_(graph, result);
            result.status = SolveStatus::TIMEOUT;
            return result;
        }

        // Source and Sink are shared between kits and appear in every subproblem.
        DictInt<int> local_of(graph.numNodes(), -1);
        int next_node = 0;
        auto local = [&](NodeId v)
        {
            if (local_of[v] < 0)
                local_of[v] = next_node++;
            return local_of[v];
        };
        int source = local(graph.source());
        int sink = local(graph.sink());

        OrFlow mcf;
        std::vector<std::pair<OrFlow::ArcIndex, EdgeId>> arcs;
        for (EdgeId e = 0; e < static_cast<EdgeId>(graph.numEdges()); ++e)
        {
            auto const& edge = graph.edge(e);
            if (edge.kit() != kit)
                continue;
            auto arc =
                mcf.AddArcWithCapacityAndUnitCost(local(edge.from), local(edge.to), edge.capacity, scale_(edge.cost));
            arcs.emplace_back(arc, e);
        }
        result.arcs = arcs.size();

        if (arcs.empty())
        {
            result.status = SolveStatus::OPTIMAL;
            return result;
        }

        mcf.SetNodeSupply(source, supply);
        mcf.SetNodeSupply(sink, -supply);

        auto status = mcf.Solve();
        result.status = fromOrStatus_(status);
        if (result.status != SolveStatus::OPTIMAL && result.status != SolveStatus::FEASIBLE)
        {
            logger_->error("{}: min-cost flow returned status {} with {} kits to route.",
                           kitName(kit),
                           static_cast<int>(status),
                           supply);
            return result;
        }

        for (auto const& [arc, e] : arcs)
        {
            Flow f = mcf.Flow(arc);
            if (f > 0)
                result.flow.emplace_back(e, f);
        }
        return result;
    }

    static int severity_(SolveStatus status)
    {
        switch (status)
        {
            case SolveStatus::ERROR:
                return 5;
            case SolveStatus::UNBALANCED:
                return 4;
            case SolveStatus::INFEASIBLE:
                return 3;
            case SolveStatus::TIMEOUT:
                return 2;
            case SolveStatus::FEASIBLE:
                return 1;
            default:
                return 0;
        }
    }

   public:
    MinCostFlowSolver() = default;
    explicit MinCostFlowSolver(MinCostFlowOptions options) : options_(options) {}

    std::string name() const override { return "min-cost-flow"; }

    Solution solve(Graph const& graph) override
    {
        logger_->info("Solving min-cost flow on {} nodes, {} edges...", graph.numNodes(), graph.numEdges());
        auto start_time = clock::now();

        Solution solution;
        solution.flow.assign(graph.numEdges(), 0);

        std::vector<KitResult> results;
        try
        {
            if (options_.parallel)
            {
                std::vector<std::future<KitResult>> futures;
                for (KitType kit : ALL_KIT_TYPES)
                {
                    futures.push_back(std::async(std::launch::async,
                                                 [this, &graph, kit, start_time]
                                                 { return solveKit_(graph, kit, start_time); }));
                }
                for (auto& future : futures) results.push_back(future.get());
            }
            else
            {
                for (KitType kit : ALL_KIT_TYPES) results.push_back(solveKit_(graph, kit, start_time));
            }
        }
        catch (std::exception const& e)
        {
            logger_->error("Min-cost flow solver failed: {}", e.what());
            solution.status = SolveStatus::ERROR;
            return solution;
        }

        solution.status = SolveStatus::OPTIMAL;
        for (auto const& result : results)
        {
            if (severity_(result.status) > severity_(solution.status))
                solution.status = result.status;
            logger_->debug("{}: {} on {} arcs.", kitName(result.kit), statusName(result.status), result.arcs);
        }

        if (!solution.usable())
        {
            logger_->warn("Min-cost flow solver finished with status {}.", statusName(solution.status));
            return solution;
        }

        for (auto const& result : results)
        {
            for (auto const& [e, f] : result.flow) solution.flow[e] = f;
        }
        solution.total_cost = evaluateCost(graph, solution.flow);

        std::chrono::duration<double> elapsed = clock::now() - start_time;
        logger_->info("Min-cost flow {} with cost {:.2f} in {:.3f} s.",
                      statusName(solution.status),
                      solution.total_cost,
                      elapsed.count());
        return solution;
    }
};
