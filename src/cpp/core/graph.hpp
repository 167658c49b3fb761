#pragma once

#include <algorithm>
#include <functional>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <variant>

#include "app/spdlog_tmp.hpp"
#include "core/kit_types.hpp"

enum class NodeKind
{
    SOURCE,
    SINK,
    AVAILABLE,  // kits at an airport, loadable now
    FROZEN,     // kits just unloaded, waiting for processing
    BOARDING    // kits loaded on one flight (location is the flight id)
};

inline std::string nodeKindName(NodeKind kind)
{
    switch (kind)
    {
        case NodeKind::SOURCE:
            return "SOURCE";
        case NodeKind::SINK:
            return "SINK";
        case NodeKind::AVAILABLE:
            return "AVAILABLE";
        case NodeKind::FROZEN:
            return "FROZEN";
        case NodeKind::BOARDING:
            return "BOARDING";
    }
    return "UNKNOWN";
}

struct NodeKey
{
    std::string location;
    Hour time{};
    NodeKind kind{NodeKind::AVAILABLE};
    KitType kit{KitType::ECONOMY};

    bool operator==(NodeKey const& other) const
    {
        return time == other.time && kind == other.kind && kit == other.kit && location == other.location;
    }
};

struct NodeKeyHash
{
    size_t operator()(NodeKey const& key) const
    {
        size_t seed = std::hash<std::string>{}(key.location);
        for (size_t h : {std::hash<int>{}(key.time),
                         std::hash<int>{}(static_cast<int>(key.kind)),
                         std::hash<int>{}(kitIndex(key.kit))})
        {
            seed ^= h + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

struct Node
{
    NodeKey key;
    std::vector<EdgeId> out_edges;
    std::vector<EdgeId> in_edges;

    bool isTerminal() const { return key.kind == NodeKind::SOURCE || key.kind == NodeKind::SINK; }
};

// Order matches the alternatives of EdgePayload.
enum class EdgeRole
{
    INITIAL_INVENTORY,
    STORAGE,
    REPOSITION,
    FLIGHT,
    PROCESSING,
    DEMAND,
    PURCHASE,
    DISCARD,
    BALANCING
};

constexpr int NUM_EDGE_ROLES = 9;

inline std::string edgeRoleName(EdgeRole role)
{
    switch (role)
    {
        case EdgeRole::INITIAL_INVENTORY:
            return "initial_inventory";
        case EdgeRole::STORAGE:
            return "storage";
        case EdgeRole::REPOSITION:
            return "reposition";
        case EdgeRole::FLIGHT:
            return "flight";
        case EdgeRole::PROCESSING:
            return "processing";
        case EdgeRole::DEMAND:
            return "demand";
        case EdgeRole::PURCHASE:
            return "purchase";
        case EdgeRole::DISCARD:
            return "discard";
        case EdgeRole::BALANCING:
            return "balancing";
    }
    return "unknown";
}

// Stock on hand (available_from == 0) or a committed arrival landing later.
struct InitialInventoryEdge
{
    AirportCode airport;
    KitType kit;
    Hour available_from;
};

struct StorageEdge
{
    AirportCode airport;
    KitType kit;
    Hour time;
};

// Kits boarded on a flight beyond its passenger requirement.
struct RepositionEdge
{
    FlightId flight_id;
    KitType kit;
};

struct FlightEdge
{
    FlightId flight_id;
    AirportCode origin;
    AirportCode destination;
    KitType kit;
    Hour departure;
    Hour arrival;
    Hour departure_absolute;
    Hour arrival_absolute;
};

struct ProcessingEdge
{
    AirportCode airport;
    KitType kit;
    Hour arrival;
    Hour ready;
};

struct DemandEdge
{
    FlightId flight_id;
    AirportCode airport;
    KitType kit;
    Hour time;
    Flow required;
    Cost penalty;
};

struct PurchaseEdge
{
    KitType kit;
    Hour order_time;
    Hour delivery_time;
    Hour lead_time;
};

struct DiscardEdge
{
    std::string location;
    KitType kit;
    Hour time;
};

struct BalancingEdge
{
    KitType kit;
};

using EdgePayload = std::variant<InitialInventoryEdge,
                                 StorageEdge,
                                 RepositionEdge,
                                 FlightEdge,
                                 ProcessingEdge,
                                 DemandEdge,
                                 PurchaseEdge,
                                 DiscardEdge,
                                 BalancingEdge>;

struct Edge
{
    NodeId from{ABSENT_NODE};
    NodeId to{ABSENT_NODE};
    Flow capacity{};
    Cost cost{};
    EdgePayload payload;

    EdgeRole role() const { return static_cast<EdgeRole>(payload.index()); }

    KitType kit() const
    {
        return std::visit([](auto const& p) { return p.kit; }, payload);
    }

    template <typename T>
    T const* as() const
    {
        return std::get_if<T>(&payload);
    }
};

struct GraphStats
{
    size_t num_nodes{};
    size_t num_edges{};
    std::array<size_t, NUM_EDGE_ROLES> edges_by_role{};

    size_t count(EdgeRole role) const { return edges_by_role[static_cast<int>(role)]; }

    std::string toString() const
    {
        std::ostringstream out;
        out << "nodes=" << num_nodes << " edges=" << num_edges;
        for (int r = 0; r < NUM_EDGE_ROLES; ++r)
        {
            out << " " << edgeRoleName(static_cast<EdgeRole>(r)) << "=" << edges_by_role[r];
        }
        return out.str();
    }
};

// Time-expanded network for one planning cycle. Nodes live in an arena and
// are deduplicated by NodeKey; NodeId is a stable index into that arena.
class Graph
{
    Hour horizon_;
    DictInt<Node> nodes_{};
    DictInt<Edge> edges_{};
    std::unordered_map<NodeKey, NodeId, NodeKeyHash> node_index_{};
    NodeId source_{ABSENT_NODE};
    NodeId sink_{ABSENT_NODE};

   public:
    explicit Graph(Hour horizon) : horizon_(horizon)
    {
        if (horizon_ < 1)
            throw std::invalid_argument("Graph horizon must be at least one hour.");
        source_ = createNode_(NodeKey{"", 0, NodeKind::SOURCE, KitType::ECONOMY});
        sink_ = createNode_(NodeKey{"", 0, NodeKind::SINK, KitType::ECONOMY});
    }

    Hour horizon() const { return horizon_; }
    NodeId source() const { return source_; }
    NodeId sink() const { return sink_; }

    size_t numNodes() const { return nodes_.size(); }
    size_t numEdges() const { return edges_.size(); }

    Node const& node(NodeId id) const { return nodes_.at(id); }
    Edge const& edge(EdgeId id) const { return edges_.at(id); }
    DictInt<Node> const& nodes() const { return nodes_; }
    DictInt<Edge> const& edges() const { return edges_; }

    NodeId findNode(NodeKey const& key) const
    {
        auto it = node_index_.find(key);
        return it == node_index_.end() ? ABSENT_NODE : it->second;
    }

    NodeId getOrCreateNode(NodeKey const& key)
    {
        if (key.kind == NodeKind::SOURCE)
            return source_;
        if (key.kind == NodeKind::SINK)
            return sink_;
        if (key.time < 0 || key.time >= horizon_)
        {
            logger_->error("Node {}@{} references time {} outside [0, {}).",
                           key.location,
                           nodeKindName(key.kind),
                           key.time,
                           horizon_);
            throw std::invalid_argument("Node time outside the planning horizon.");
        }

        auto it = node_index_.find(key);
        if (it != node_index_.end())
            return it->second;
        return createNode_(key);
    }

    EdgeId addEdge(NodeId from, NodeId to, Flow capacity, Cost cost, EdgePayload payload)
    {
        if (from < 0 || from >= static_cast<NodeId>(nodes_.size()) || to < 0 ||
            to >= static_cast<NodeId>(nodes_.size()))
            throw std::invalid_argument("Edge endpoint does not exist.");
        if (capacity < 0)
            throw std::invalid_argument("Edge capacity must be non-negative.");

        Edge edge{from, to, capacity, cost, std::move(payload)};
        checkEndpoints_(edge);

        EdgeId id = static_cast<EdgeId>(edges_.size());
        edges_.push_back(std::move(edge));
        nodes_[from].out_edges.push_back(id);
        nodes_[to].in_edges.push_back(id);
        return id;
    }

    // Everything Source can emit for one kit type: stock, committed arrivals
    // and orderable quantity. Balancing edges are the drain, not supply.
    Flow supply(KitType kit) const
    {
        Flow total = 0;
        for (EdgeId e : nodes_[source_].out_edges)
        {
            auto const& edge = edges_[e];
            if (edge.role() != EdgeRole::BALANCING && edge.kit() == kit)
                total += edge.capacity;
        }
        return total;
    }

    bool hasBalancingEdge(KitType kit) const
    {
        for (EdgeId e : nodes_[source_].out_edges)
        {
            auto const& edge = edges_[e];
            if (edge.role() == EdgeRole::BALANCING && edge.kit() == kit)
                return true;
        }
        return false;
    }

    GraphStats stats() const
    {
        GraphStats stats;
        stats.num_nodes = nodes_.size();
        stats.num_edges = edges_.size();
        for (auto const& edge : edges_) stats.edges_by_role[static_cast<int>(edge.role())]++;
        return stats;
    }

    // Source first, Sink last, everything else by (time, kind, location, kit).
    // Every edge points forward in this order: storage and flights advance
    // time, processing leaves FROZEN before AVAILABLE at the same hour, and
    // boarding happens after the AVAILABLE node it drains.
    NodeList topologicalOrder() const
    {
        NodeList order(nodes_.size());
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(),
                  order.end(),
                  [this](NodeId a, NodeId b) { return orderKey_(nodes_[a].key) < orderKey_(nodes_[b].key); });
        return order;
    }

    DictInt<int> topologicalRanks() const
    {
        DictInt<int> ranks(nodes_.size());
        auto order = topologicalOrder();
        for (size_t i = 0; i < order.size(); ++i) ranks[order[i]] = static_cast<int>(i);
        return ranks;
    }

    std::string describe(NodeId id) const
    {
        auto const& key = nodes_.at(id).key;
        if (key.kind == NodeKind::SOURCE || key.kind == NodeKind::SINK)
            return nodeKindName(key.kind);
        return key.location + "@" + std::to_string(key.time) + "/" + nodeKindName(key.kind) + "/" +
               kitName(key.kit);
    }

   private:
    NodeId createNode_(NodeKey const& key)
    {
        NodeId id = static_cast<NodeId>(nodes_.size());
        nodes_.push_back(Node{key, {}, {}});
        if (key.kind != NodeKind::SOURCE && key.kind != NodeKind::SINK)
            node_index_.emplace(key, id);
        return id;
    }

    static int kindRank_(NodeKind kind)
    {
        switch (kind)
        {
            case NodeKind::SOURCE:
                return 0;
            case NodeKind::FROZEN:
                return 1;
            case NodeKind::AVAILABLE:
                return 2;
            case NodeKind::BOARDING:
                return 3;
            case NodeKind::SINK:
                return 4;
        }
        return 4;
    }

    static std::tuple<int, Hour, int, std::string, int> orderKey_(NodeKey const& key)
    {
        int band = key.kind == NodeKind::SOURCE ? 0 : (key.kind == NodeKind::SINK ? 2 : 1);
        return {band, key.time, kindRank_(key.kind), key.location, kitIndex(key.kit)};
    }

    [[noreturn]] void reject_(Edge const& edge, std::string const& reason) const
    {
        logger_->error("Rejected {} edge {} -> {}: {}",
                       edgeRoleName(edge.role()),
                       describe(edge.from),
                       describe(edge.to),
                       reason);
        throw std::invalid_argument("Invalid " + edgeRoleName(edge.role()) + " edge: " + reason);
    }

    void expectKinds_(Edge const& edge, NodeKind from_kind, NodeKind to_kind) const
    {
        if (nodes_[edge.from].key.kind != from_kind || nodes_[edge.to].key.kind != to_kind)
            reject_(edge, "expected " + nodeKindName(from_kind) + " -> " + nodeKindName(to_kind));
    }

    void checkEndpoints_(Edge const& edge) const
    {
        KitType kit = edge.kit();
        for (NodeId v : {edge.from, edge.to})
        {
            auto const& key = nodes_[v].key;
            if (!nodes_[v].isTerminal() && key.kit != kit)
                reject_(edge, "endpoint kit differs from edge kit " + kitName(kit));
        }

        auto const& from_key = nodes_[edge.from].key;
        auto const& to_key = nodes_[edge.to].key;

        switch (edge.role())
        {
            case EdgeRole::INITIAL_INVENTORY:
                expectKinds_(edge, NodeKind::SOURCE, NodeKind::AVAILABLE);
                break;
            case EdgeRole::STORAGE:
                expectKinds_(edge, NodeKind::AVAILABLE, NodeKind::AVAILABLE);
                if (to_key.time != from_key.time + 1 || to_key.location != from_key.location)
                    reject_(edge, "storage must advance one hour at the same airport");
                break;
            case EdgeRole::REPOSITION:
            case EdgeRole::DEMAND:
                expectKinds_(edge, NodeKind::AVAILABLE, NodeKind::BOARDING);
                if (to_key.time != from_key.time)
                    reject_(edge, "boarding happens at the departure hour");
                break;
            case EdgeRole::FLIGHT:
                expectKinds_(edge, NodeKind::BOARDING, NodeKind::FROZEN);
                if (to_key.time <= from_key.time)
                    reject_(edge, "arrival must be after departure");
                break;
            case EdgeRole::PROCESSING:
                expectKinds_(edge, NodeKind::FROZEN, NodeKind::AVAILABLE);
                if (to_key.time < from_key.time || to_key.location != from_key.location)
                    reject_(edge, "processing cannot move kits back in time or between airports");
                break;
            case EdgeRole::PURCHASE:
            {
                expectKinds_(edge, NodeKind::SOURCE, NodeKind::AVAILABLE);
                auto const* purchase = edge.as<PurchaseEdge>();
                if (purchase->delivery_time < purchase->order_time + purchase->lead_time ||
                    purchase->delivery_time != to_key.time)
                    reject_(edge, "delivery earlier than order time plus lead time");
                break;
            }
            case EdgeRole::DISCARD:
                if ((from_key.kind != NodeKind::AVAILABLE && from_key.kind != NodeKind::FROZEN) ||
                    to_key.kind != NodeKind::SINK)
                    reject_(edge, "discard must drain an AVAILABLE or FROZEN node into the sink");
                break;
            case EdgeRole::BALANCING:
                expectKinds_(edge, NodeKind::SOURCE, NodeKind::SINK);
                break;
        }
    }
};
