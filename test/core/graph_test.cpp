#include <gtest/gtest.h>

#include <stdexcept>

#include "core/graph.hpp"
#include "core/solution.hpp"

namespace
{

class GraphTest : public testing::Test
{
   protected:
    Graph graph_{6};

    NodeId available(std::string const& airport, Hour t, KitType kit = KitType::ECONOMY)
    {
        return graph_.getOrCreateNode(NodeKey{airport, t, NodeKind::AVAILABLE, kit});
    }
};

TEST_F(GraphTest, StartsWithSourceAndSink)
{
    EXPECT_EQ(graph_.numNodes(), 2u);
    EXPECT_EQ(graph_.numEdges(), 0u);
    EXPECT_EQ(graph_.node(graph_.source()).key.kind, NodeKind::SOURCE);
    EXPECT_EQ(graph_.node(graph_.sink()).key.kind, NodeKind::SINK);
    EXPECT_EQ(graph_.horizon(), 6);
}

TEST_F(GraphTest, NodesAreDeduplicatedByKey)
{
    NodeId a = available("HUB1", 3);
    NodeId b = available("HUB1", 3);
    NodeId c = available("HUB1", 3, KitType::FIRST);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(graph_.findNode(NodeKey{"HUB1", 3, NodeKind::AVAILABLE, KitType::ECONOMY}), a);
    EXPECT_EQ(graph_.findNode(NodeKey{"HUB1", 4, NodeKind::AVAILABLE, KitType::ECONOMY}), ABSENT_NODE);
}

TEST_F(GraphTest, RejectsNodesOutsideHorizon)
{
    EXPECT_THROW(available("HUB1", 6), std::invalid_argument);
    EXPECT_THROW(available("HUB1", -1), std::invalid_argument);
    EXPECT_NO_THROW(available("HUB1", 5));
}

TEST_F(GraphTest, RejectsEdgeMixingKitTypes)
{
    NodeId economy = available("HUB1", 0);
    NodeId first = available("HUB1", 1, KitType::FIRST);
    EXPECT_THROW(graph_.addEdge(economy, first, 10, 0.0, StorageEdge{"HUB1", KitType::ECONOMY, 0}),
                 std::invalid_argument);
}

TEST_F(GraphTest, StorageMustAdvanceExactlyOneHour)
{
    NodeId t0 = available("HUB1", 0);
    NodeId t2 = available("HUB1", 2);
    NodeId other = available("A1", 1);
    EXPECT_THROW(graph_.addEdge(t0, t2, 10, 0.0, StorageEdge{"HUB1", KitType::ECONOMY, 0}), std::invalid_argument);
    EXPECT_THROW(graph_.addEdge(t0, other, 10, 0.0, StorageEdge{"HUB1", KitType::ECONOMY, 0}),
                 std::invalid_argument);
    EXPECT_NO_THROW(
        graph_.addEdge(t0, available("HUB1", 1), 10, 0.0, StorageEdge{"HUB1", KitType::ECONOMY, 0}));
}

TEST_F(GraphTest, PurchaseCannotLandBeforeLeadTime)
{
    NodeId early = available("HUB1", 2);
    EXPECT_THROW(graph_.addEdge(graph_.source(), early, 100, 50.0, PurchaseEdge{KitType::ECONOMY, 0, 2, 3}),
                 std::invalid_argument);

    NodeId on_time = available("HUB1", 3);
    EXPECT_NO_THROW(graph_.addEdge(graph_.source(), on_time, 100, 50.0, PurchaseEdge{KitType::ECONOMY, 0, 3, 3}));
}

TEST_F(GraphTest, RejectsNegativeCapacity)
{
    EXPECT_THROW(graph_.addEdge(graph_.source(), available("HUB1", 0), -1, 0.0,
                                InitialInventoryEdge{"HUB1", KitType::ECONOMY, 0}),
                 std::invalid_argument);
}

TEST_F(GraphTest, SupplyExcludesBalancingEdges)
{
    graph_.addEdge(graph_.source(), available("HUB1", 0), 40, 0.0, InitialInventoryEdge{"HUB1", KitType::ECONOMY, 0});
    graph_.addEdge(graph_.source(), available("HUB1", 4), 100, 50.0, PurchaseEdge{KitType::ECONOMY, 0, 4, 4});
    graph_.addEdge(graph_.source(), graph_.sink(), INFINITE_CAPACITY, 0.0, BalancingEdge{KitType::ECONOMY});

    EXPECT_EQ(graph_.supply(KitType::ECONOMY), 140);
    EXPECT_EQ(graph_.supply(KitType::FIRST), 0);
    EXPECT_TRUE(graph_.hasBalancingEdge(KitType::ECONOMY));
    EXPECT_FALSE(graph_.hasBalancingEdge(KitType::FIRST));
}

TEST_F(GraphTest, TopologicalOrderPointsEveryEdgeForward)
{
    NodeId hub0 = available("HUB1", 0);
    NodeId hub1 = available("HUB1", 1);
    NodeId boarding = graph_.getOrCreateNode(NodeKey{"F1", 1, NodeKind::BOARDING, KitType::ECONOMY});
    NodeId frozen = graph_.getOrCreateNode(NodeKey{"A1", 3, NodeKind::FROZEN, KitType::ECONOMY});
    NodeId a1 = available("A1", 3);

    graph_.addEdge(graph_.source(), hub0, 10, 0.0, InitialInventoryEdge{"HUB1", KitType::ECONOMY, 0});
    graph_.addEdge(hub0, hub1, 10, 0.0, StorageEdge{"HUB1", KitType::ECONOMY, 0});
    graph_.addEdge(hub1, boarding, 5, 0.0, RepositionEdge{"F1", KitType::ECONOMY});
    graph_.addEdge(boarding, frozen, 5, 10.0, FlightEdge{"F1", "HUB1", "A1", KitType::ECONOMY, 1, 3, 1, 3});
    graph_.addEdge(frozen, a1, INFINITE_CAPACITY, 0.0, ProcessingEdge{"A1", KitType::ECONOMY, 3, 3});
    graph_.addEdge(a1, graph_.sink(), INFINITE_CAPACITY, 0.0, DiscardEdge{"A1", KitType::ECONOMY, 3});

    auto ranks = graph_.topologicalRanks();
    EXPECT_EQ(ranks[graph_.source()], 0);
    EXPECT_EQ(ranks[graph_.sink()], static_cast<int>(graph_.numNodes()) - 1);
    for (auto const& edge : graph_.edges())
    {
        EXPECT_LT(ranks[edge.from], ranks[edge.to]) << edgeRoleName(edge.role());
    }
}

TEST_F(GraphTest, StatsCountEdgesPerRole)
{
    NodeId hub0 = available("HUB1", 0);
    graph_.addEdge(graph_.source(), hub0, 10, 0.0, InitialInventoryEdge{"HUB1", KitType::ECONOMY, 0});
    graph_.addEdge(hub0, available("HUB1", 1), 10, 0.0, StorageEdge{"HUB1", KitType::ECONOMY, 0});
    graph_.addEdge(hub0, graph_.sink(), INFINITE_CAPACITY, 0.0, DiscardEdge{"HUB1", KitType::ECONOMY, 0});

    auto stats = graph_.stats();
    EXPECT_EQ(stats.num_nodes, 4u);
    EXPECT_EQ(stats.num_edges, 3u);
    EXPECT_EQ(stats.count(EdgeRole::STORAGE), 1u);
    EXPECT_EQ(stats.count(EdgeRole::FLIGHT), 0u);
    EXPECT_NE(stats.toString().find("storage=1"), std::string::npos);
}

TEST_F(GraphTest, CheckFlowReportsViolations)
{
    NodeId hub0 = available("HUB1", 0);
    NodeId hub1 = available("HUB1", 1);
    graph_.addEdge(graph_.source(), hub0, 10, 0.0, InitialInventoryEdge{"HUB1", KitType::ECONOMY, 0});
    graph_.addEdge(hub0, hub1, 5, 1.0, StorageEdge{"HUB1", KitType::ECONOMY, 0});
    graph_.addEdge(hub1, graph_.sink(), INFINITE_CAPACITY, 0.0, DiscardEdge{"HUB1", KitType::ECONOMY, 1});

    EXPECT_TRUE(checkFlow(graph_, {5, 5, 5}).empty());
    EXPECT_DOUBLE_EQ(evaluateCost(graph_, {5, 5, 5}), 5.0);

    // Over capacity on storage.
    EXPECT_FALSE(checkFlow(graph_, {7, 7, 7}).empty());
    // Kits vanish at HUB1@1.
    EXPECT_FALSE(checkFlow(graph_, {5, 5, 3}).empty());
    // Wrong length.
    EXPECT_FALSE(checkFlow(graph_, {5, 5}).empty());
}

TEST_F(GraphTest, FlowOnMissingEdgeIsZero)
{
    Solution solution;
    solution.flow = {4, 2};

    EXPECT_EQ(solution.flowOn(1), 2);
    EXPECT_EQ(solution.flowOn(ABSENT_EDGE), 0);
    EXPECT_EQ(solution.flowOn(2), 0);
}

}  // namespace
