#pragma once

#include <algorithm>
#include <set>
#include <utility>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/domain.hpp"
#include "core/graph.hpp"
#include "core/planner_config.hpp"

class GraphBuilder
{
    struct ResolvedFlight
    {
        Flight const* flight;
        Airport const* origin;
        Airport const* destination;
        AircraftType const* aircraft;
        Hour departure;
        Hour arrival;
    };

    PlannerConfig config_;

    static std::vector<AirportCode> sortedCodes_(AirportMap const& airports)
    {
        std::vector<AirportCode> codes;
        codes.reserve(airports.size());
        for (auto const& [code, _] : airports) codes.push_back(code);
        std::sort(codes.begin(), codes.end());
        return codes;
    }

    std::vector<ResolvedFlight> resolveFlights_(AirportMap const& airports,
                                                AircraftTypeMap const& aircraft_types,
                                                std::vector<Flight> const& flights,
                                                Hour horizon,
                                                Hour current_hour) const
    {
        std::vector<ResolvedFlight> resolved;

        for (auto const& flight : flights)
        {
            Hour departure = flight.departure_hour - current_hour;
            Hour arrival = flight.arrival_hour - current_hour;

            if (departure < 0)
            {
                logger_->debug("Flight {} already departed ({} h ago), skipped.", flight.id, -departure);
                continue;
            }
            if (departure >= horizon || arrival >= horizon)
            {
                logger_->debug("Flight {} leaves the {} h horizon, skipped.", flight.id, horizon);
                continue;
            }
            if (arrival <= departure)
            {
                logger_->warn("Flight {} arrives at {} but departs at {}, skipped.",
                              flight.id,
                              flight.arrival_hour,
                              flight.departure_hour);
                continue;
            }

            auto origin = airports.find(flight.origin);
            auto destination = airports.find(flight.destination);
            if (origin == airports.end() || destination == airports.end())
            {
                logger_->warn("Flight {} references unknown airport {} -> {}, skipped.",
                              flight.id,
                              flight.origin,
                              flight.destination);
                continue;
            }
            auto aircraft = aircraft_types.find(flight.aircraft_type);
            if (aircraft == aircraft_types.end())
            {
                logger_->warn("Flight {} references unknown aircraft type '{}', skipped.",
                              flight.id,
                              flight.aircraft_type);
                continue;
            }

            resolved.push_back(
                ResolvedFlight{&flight, &origin->second, &destination->second, &aircraft->second, departure, arrival});
        }

        std::sort(resolved.begin(),
                  resolved.end(),
                  [](ResolvedFlight const& a, ResolvedFlight const& b)
                  {
                      if (a.departure != b.departure)
                          return a.departure < b.departure;
                      return a.flight->id < b.flight->id;
                  });
        return resolved;
    }

    // Upper bound on what one kit can cost to route: buy it, load it, fly the
    // longest leg in view, process it, hold it for the whole horizon, drop it.
    KitArray<Cost> routingCostBounds_(AirportMap const& airports,
                                      std::vector<ResolvedFlight> const& flights,
                                      Hour horizon) const
    {
        double max_distance = 0;
        for (auto const& rf : flights) max_distance = std::max(max_distance, rf.flight->distance);

        KitArray<Cost> bounds{};
        for (KitType kit : ALL_KIT_TYPES)
        {
            int k = kitIndex(kit);
            Cost max_loading = 0;
            Cost max_processing = 0;
            for (auto const& [_, airport] : airports)
            {
                max_loading = std::max(max_loading, airport.loading_cost[k]);
                max_processing = std::max(max_processing, airport.processing_cost[k]);
            }
            bounds[k] = config_.kit(kit).unit_cost + max_loading + max_processing +
                        config_.fuelCost(max_distance, kit) + config_.holding_cost * horizon +
                        config_.discard_cost;
        }
        return bounds;
    }

    Cost penalty_(ResolvedFlight const& rf, KitType kit, KitArray<Cost> const& bounds) const
    {
        Cost proportional = rf.flight->distance * config_.kit(kit).unit_cost * config_.unfulfilled_penalty_factor;
        Cost routing_floor = config_.penalty_safety_factor * bounds[kitIndex(kit)];
        return std::max({proportional, routing_floor, 1.0});
    }

    NodeId available_(Graph& graph, AirportCode const& airport, Hour t, KitType kit) const
    {
        return graph.getOrCreateNode(NodeKey{airport, t, NodeKind::AVAILABLE, kit});
    }

    NodeId boarding_(Graph& graph, ResolvedFlight const& rf, KitType kit) const
    {
        return graph.getOrCreateNode(NodeKey{rf.flight->id, rf.departure, NodeKind::BOARDING, kit});
    }

    void addInventoryEdges_(Graph& graph,
                            AirportMap const& airports,
                            InventorySnapshot const& inventory,
                            Hour current_hour) const
    {
        for (auto const& [code, _] : inventory.on_hand)
        {
            if (!airports.count(code))
                logger_->warn("Stock reported at unknown airport {}, ignored.", code);
        }

        for (auto const& code : sortedCodes_(airports))
        {
            for (KitType kit : ALL_KIT_TYPES)
            {
                Flow stock = inventory.onHand(code, kit);
                if (stock <= 0)
                    continue;
                graph.addEdge(graph.source(),
                              available_(graph, code, 0, kit),
                              stock,
                              0.0,
                              InitialInventoryEdge{code, kit, 0});
            }
        }

        for (auto const& arrival : inventory.pending)
        {
            if (arrival.quantity <= 0)
                continue;
            if (!airports.count(arrival.airport))
            {
                logger_->warn("Pending arrival at unknown airport {}, ignored.", arrival.airport);
                continue;
            }
            Hour ready = std::max(arrival.ready_hour - current_hour, 0);
            if (ready >= graph.horizon())
                continue;
            graph.addEdge(graph.source(),
                          available_(graph, arrival.airport, ready, arrival.kit),
                          arrival.quantity,
                          0.0,
                          InitialInventoryEdge{arrival.airport, arrival.kit, ready});
        }
    }

    void addStorageEdges_(Graph& graph, AirportMap const& airports) const
    {
        Hour horizon = graph.horizon();
        for (auto const& code : sortedCodes_(airports))
        {
            auto const& airport = airports.at(code);
            for (KitType kit : ALL_KIT_TYPES)
            {
                for (Hour t = 0; t < horizon; ++t)
                {
                    NodeId here = available_(graph, code, t, kit);
                    if (t + 1 < horizon)
                    {
                        graph.addEdge(here,
                                      available_(graph, code, t + 1, kit),
                                      airport.storage_capacity[kitIndex(kit)],
                                      config_.holding_cost,
                                      StorageEdge{code, kit, t});
                    }
                    // Overflow and end-of-horizon exit.
                    graph.addEdge(
                        here, graph.sink(), INFINITE_CAPACITY, config_.discard_cost, DiscardEdge{code, kit, t});
                }
            }
        }
    }

    std::vector<NodeId> addFlightEdges_(Graph& graph, std::vector<ResolvedFlight> const& flights) const
    {
        std::vector<NodeId> frozen_nodes;
        std::set<NodeId> seen;

        for (auto const& rf : flights)
        {
            for (KitType kit : ALL_KIT_TYPES)
            {
                int k = kitIndex(kit);
                Flow capacity = rf.aircraft->capacity[k];
                if (capacity <= 0)
                    continue;

                NodeId origin = available_(graph, rf.origin->code, rf.departure, kit);
                NodeId boarding = boarding_(graph, rf, kit);
                NodeId frozen =
                    graph.getOrCreateNode(NodeKey{rf.destination->code, rf.arrival, NodeKind::FROZEN, kit});

                Cost cost = rf.origin->loading_cost[k] + config_.fuelCost(rf.flight->distance, kit) +
                            rf.destination->processing_cost[k];

                graph.addEdge(origin, boarding, capacity, 0.0, RepositionEdge{rf.flight->id, kit});
                graph.addEdge(boarding,
                              frozen,
                              capacity,
                              cost,
                              FlightEdge{rf.flight->id,
                                         rf.origin->code,
                                         rf.destination->code,
                                         kit,
                                         rf.departure,
                                         rf.arrival,
                                         rf.flight->departure_hour,
                                         rf.flight->arrival_hour});

                if (seen.insert(frozen).second)
                    frozen_nodes.push_back(frozen);
            }
        }
        return frozen_nodes;
    }

    void addProcessingEdges_(Graph& graph, AirportMap const& airports, std::vector<NodeId> const& frozen_nodes) const
    {
        for (NodeId frozen : frozen_nodes)
        {
            auto const key = graph.node(frozen).key;
            auto const& airport = airports.at(key.location);
            Hour ready = key.time + airport.processing_time[kitIndex(key.kit)];

            if (ready < graph.horizon())
            {
                graph.addEdge(frozen,
                              available_(graph, key.location, ready, key.kit),
                              INFINITE_CAPACITY,
                              0.0,
                              ProcessingEdge{key.location, key.kit, key.time, ready});
            }
            else
            {
                // Never recovers inside this plan.
                graph.addEdge(frozen,
                              graph.sink(),
                              INFINITE_CAPACITY,
                              config_.discard_cost,
                              DiscardEdge{key.location, key.kit, key.time});
            }
        }
    }

    void addDemandEdges_(Graph& graph, AirportMap const& airports, std::vector<ResolvedFlight> const& flights) const
    {
        auto bounds = routingCostBounds_(airports, flights, graph.horizon());
        for (auto const& rf : flights)
        {
            for (KitType kit : ALL_KIT_TYPES)
            {
                Flow required = rf.flight->passengers[kitIndex(kit)];
                if (required <= 0)
                    continue;

                Cost penalty = penalty_(rf, kit, bounds);
                graph.addEdge(available_(graph, rf.origin->code, rf.departure, kit),
                              boarding_(graph, rf, kit),
                              required,
                              -penalty,
                              DemandEdge{rf.flight->id, rf.origin->code, kit, rf.departure, required, penalty});
            }
        }
    }

    void addPurchaseEdges_(Graph& graph, AirportMap const& airports) const
    {
        std::vector<AirportCode> hubs;
        for (auto const& code : sortedCodes_(airports))
        {
            if (airports.at(code).is_hub)
                hubs.push_back(code);
        }
        if (hubs.size() != 1)
        {
            logger_->warn("Expected exactly one purchasing hub, found {}; no purchase edges built.", hubs.size());
            return;
        }

        for (KitType kit : ALL_KIT_TYPES)
        {
            auto const& kit_config = config_.kit(kit);
            if (kit_config.lead_time >= graph.horizon())
            {
                logger_->debug("Lead time {} h of {} exceeds the horizon, no purchase edge.",
                               kit_config.lead_time,
                               kitName(kit));
                continue;
            }
            graph.addEdge(graph.source(),
                          available_(graph, hubs.front(), kit_config.lead_time, kit),
                          config_.max_order_quantity,
                          kit_config.unit_cost,
                          PurchaseEdge{kit, 0, kit_config.lead_time, kit_config.lead_time});
        }
    }

    void addBalancingEdges_(Graph& graph) const
    {
        for (KitType kit : ALL_KIT_TYPES)
        {
            graph.addEdge(graph.source(), graph.sink(), INFINITE_CAPACITY, 0.0, BalancingEdge{kit});
        }
    }

   public:
    explicit GraphBuilder(PlannerConfig config) : config_(std::move(config)) {}

    PlannerConfig const& config() const { return config_; }

    Graph build(AirportMap const& airports,
                AircraftTypeMap const& aircraft_types,
                std::vector<Flight> const& flights,
                InventorySnapshot const& inventory,
                Hour horizon_hours,
                Hour current_hour) const
    {
        Graph graph(horizon_hours);
        auto resolved = resolveFlights_(airports, aircraft_types, flights, horizon_hours, current_hour);

        addInventoryEdges_(graph, airports, inventory, current_hour);
        addStorageEdges_(graph, airports);
        auto frozen_nodes = addFlightEdges_(graph, resolved);
        addProcessingEdges_(graph, airports, frozen_nodes);
        addDemandEdges_(graph, airports, resolved);
        addPurchaseEdges_(graph, airports);
        addBalancingEdges_(graph);

        logger_->info("Graph for hour {} ({} of {} flights in view): {}",
                      current_hour,
                      resolved.size(),
                      flights.size(),
                      graph.stats().toString());
        return graph;
    }

    Graph build(AirportMap const& airports,
                AircraftTypeMap const& aircraft_types,
                std::vector<Flight> const& flights,
                InventorySnapshot const& inventory,
                Hour current_hour) const
    {
        return build(airports, aircraft_types, flights, inventory, config_.horizon_hours, current_hour);
    }
};
