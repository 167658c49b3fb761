#include <gtest/gtest.h>

#include "core/graph_builder.hpp"
#include "core/greedy_solver.hpp"
#include "core/min_cost_flow_solver.hpp"
#include "scenario_fixtures.hpp"

namespace
{

class GreedySolverTest : public testing::Test
{
   protected:
    ExampleScenario scenario_;
    GreedySolver greedy_;

    Graph build() const
    {
        return GraphBuilder(scenario_.config)
            .build(scenario_.airports, scenario_.aircraft_types, scenario_.flights, scenario_.inventory, 0);
    }
};

TEST_F(GreedySolverTest, ExampleFullySatisfiesDemand)
{
    auto graph = build();
    auto solution = greedy_.solve(graph);

    EXPECT_EQ(solution.status, SolveStatus::GREEDY);
    EXPECT_TRUE(solution.usable());
    EXPECT_EQ(solution.flowOn(demandEdge(graph, "F1")), ExampleScenario::F1_DEMAND);
    EXPECT_EQ(solution.flowOn(flightEdge(graph, "F1")), ExampleScenario::F1_DEMAND);
    EXPECT_TRUE(checkFlow(graph, solution.flow).empty());
}

TEST_F(GreedySolverTest, NeverCheaperThanExactSolver)
{
    auto graph = build();
    auto greedy = greedy_.solve(graph);

    MinCostFlowSolver exact;
    auto optimal = exact.solve(graph);

    ASSERT_EQ(optimal.status, SolveStatus::OPTIMAL);
    EXPECT_GE(greedy.total_cost, optimal.total_cost - 1e-6);
}

TEST_F(GreedySolverTest, NeverBuysKits)
{
    scenario_.economyStock("HUB1") = 0;
    scenario_.flights = {ExampleScenario::makeFlight("F9", "HUB1", "A1", 14, 16, 1000, 70)};
    auto graph = build();
    auto solution = greedy_.solve(graph);

    for (EdgeId e = 0; e < static_cast<EdgeId>(graph.numEdges()); ++e)
    {
        if (graph.edge(e).role() == EdgeRole::PURCHASE)
            EXPECT_EQ(solution.flowOn(e), 0);
    }
    EXPECT_EQ(solution.flowOn(demandEdge(graph, "F9")), 0);
    EXPECT_TRUE(checkFlow(graph, solution.flow).empty());
}

TEST_F(GreedySolverTest, RespectsAircraftCapacity)
{
    scenario_.flights.front().passengers[kitIndex(KitType::ECONOMY)] = 180;
    auto graph = build();
    auto solution = greedy_.solve(graph);

    EXPECT_EQ(solution.flowOn(flightEdge(graph, "F1")), 100);
    EXPECT_EQ(solution.flowOn(demandEdge(graph, "F1")), 100);
    EXPECT_TRUE(checkFlow(graph, solution.flow).empty());
}

TEST_F(GreedySolverTest, ConservesFlowOnRoundTrips)
{
    scenario_.flights.push_back(ExampleScenario::makeFlight("F2", "A1", "HUB1", 9, 12, 1000, 80));
    scenario_.flights.push_back(ExampleScenario::makeFlight("F3", "HUB1", "A1", 14, 16, 1000, 120));
    scenario_.economyStock("A1") = 0;
    auto graph = build();
    auto solution = greedy_.solve(graph);

    EXPECT_TRUE(checkFlow(graph, solution.flow).empty());
    // F1 brings 60 kits to A1, ready at hour 8, in time for F2.
    EXPECT_EQ(solution.flowOn(demandEdge(graph, "F2")), 60);
}

TEST_F(GreedySolverTest, NoFlightsCostsNothing)
{
    scenario_.flights.clear();
    auto graph = build();
    auto solution = greedy_.solve(graph);

    EXPECT_DOUBLE_EQ(solution.total_cost, 0.0);
    EXPECT_TRUE(checkFlow(graph, solution.flow).empty());
}

}  // namespace
