#include <gtest/gtest.h>

#include "core/decision_extractor.hpp"
#include "core/graph_builder.hpp"
#include "core/min_cost_flow_solver.hpp"
#include "scenario_fixtures.hpp"

namespace
{

class DecisionExtractorTest : public testing::Test
{
   protected:
    ExampleScenario scenario_;

    Graph build(Hour now) const
    {
        return GraphBuilder(scenario_.config)
            .build(scenario_.airports, scenario_.aircraft_types, scenario_.flights, scenario_.inventory, now);
    }

    static Solution solve(Graph const& graph)
    {
        MinCostFlowOptions options;
        options.parallel = false;
        return MinCostFlowSolver(options).solve(graph);
    }
};

TEST_F(DecisionExtractorTest, LoadsOnlyFlightsDepartingThisHour)
{
    scenario_.flights.push_back(ExampleScenario::makeFlight("F2", "HUB1", "A1", 5, 7, 800, 20));
    auto graph = build(2);
    auto solution = solve(graph);
    ASSERT_EQ(solution.status, SolveStatus::OPTIMAL);
    ASSERT_EQ(solution.flowOn(flightEdge(graph, "F2")), 20);

    auto decision = DecisionExtractor::extract(graph, solution, 2);
    EXPECT_EQ(decision.hour, 2);
    EXPECT_EQ(decision.status, SolveStatus::OPTIMAL);
    ASSERT_EQ(decision.flight_loads.size(), 1u);

    auto const& load = decision.flight_loads.front();
    EXPECT_EQ(load.flight_id, "F1");
    EXPECT_EQ(load.origin, "HUB1");
    EXPECT_EQ(load.destination, "A1");
    EXPECT_EQ(load.departure_hour, 2);
    EXPECT_EQ(load.arrival_hour, 4);
    EXPECT_EQ(load.kits[kitIndex(KitType::ECONOMY)], ExampleScenario::F1_DEMAND);
    EXPECT_EQ(load.total(), ExampleScenario::F1_DEMAND);
    EXPECT_EQ(decision.loaded("F2", KitType::ECONOMY), 0);
    EXPECT_DOUBLE_EQ(decision.planned_cost, solution.total_cost);
}

TEST_F(DecisionExtractorTest, NothingToLoadBetweenDepartures)
{
    auto graph = build(0);
    auto solution = solve(graph);

    auto decision = DecisionExtractor::extract(graph, solution, 0);
    EXPECT_TRUE(decision.flight_loads.empty());
    EXPECT_EQ(decision.load("F1"), nullptr);
}

TEST_F(DecisionExtractorTest, PurchasesAreOrderedNowWhateverTheirDelivery)
{
    scenario_.economyStock("HUB1") = 0;
    scenario_.flights = {ExampleScenario::makeFlight("F9", "HUB1", "A1", 14, 16, 1000, 70)};
    auto graph = build(0);
    auto solution = solve(graph);

    auto decision = DecisionExtractor::extract(graph, solution, 0);
    EXPECT_TRUE(decision.flight_loads.empty());
    EXPECT_EQ(decision.purchases[kitIndex(KitType::ECONOMY)], 70);

    auto orders = decision.purchaseOrders();
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders.front().kit, KitType::ECONOMY);
    EXPECT_EQ(orders.front().quantity, 70);
    EXPECT_FALSE(decision.empty());
}

TEST_F(DecisionExtractorTest, UnusableSolutionYieldsNoActions)
{
    auto graph = build(2);
    Solution timed_out;
    timed_out.status = SolveStatus::TIMEOUT;
    timed_out.flow.assign(graph.numEdges(), 1);

    auto decision = DecisionExtractor::extract(graph, timed_out, 2);
    EXPECT_EQ(decision.status, SolveStatus::TIMEOUT);
    EXPECT_TRUE(decision.empty());
}

}  // namespace
