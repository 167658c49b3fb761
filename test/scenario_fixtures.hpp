#pragma once

#include <string>
#include <vector>

#include "core/domain.hpp"
#include "core/graph.hpp"
#include "core/planner_config.hpp"

// Hub HUB1 and outstation A1 with a single economy flight F1 between them:
// 250 economy kits at the hub, 50 at A1, 60 economy passengers on F1.
struct ExampleScenario
{
    PlannerConfig config;
    AirportMap airports;
    AircraftTypeMap aircraft_types;
    std::vector<Flight> flights;
    InventorySnapshot inventory;

    static constexpr Cost HUB_LOADING = 2.0;
    static constexpr Cost A1_PROCESSING = 4.0;
    static constexpr double F1_DISTANCE = 1000.0;
    static constexpr Flow F1_DEMAND = 60;
    // loading + fuel (1000 km * 0.5 * 1 kg) + processing
    static constexpr Cost F1_UNIT_COST = HUB_LOADING + 500.0 + A1_PROCESSING;

    // `now` is the absolute hour of the cycle; F1 leaves two hours later.
    explicit ExampleScenario(Hour now = 0)
    {
        config.horizon_hours = 24;
        config.parallel_kit_solve = false;

        Airport hub;
        hub.code = "HUB1";
        hub.is_hub = true;
        hub.storage_capacity.fill(500);
        hub.loading_cost.fill(HUB_LOADING);
        hub.processing_cost.fill(3.0);
        hub.processing_time.fill(2);
        hub.initial_stock[kitIndex(KitType::ECONOMY)] = 250;

        Airport outstation;
        outstation.code = "A1";
        outstation.storage_capacity.fill(100);
        outstation.loading_cost.fill(3.0);
        outstation.processing_cost.fill(A1_PROCESSING);
        outstation.processing_time.fill(4);
        outstation.initial_stock[kitIndex(KitType::ECONOMY)] = 50;

        airports = {{hub.code, hub}, {outstation.code, outstation}};

        AircraftType narrow_body;
        narrow_body.code = "B738";
        narrow_body.capacity[kitIndex(KitType::ECONOMY)] = 100;
        aircraft_types = {{narrow_body.code, narrow_body}};

        flights.push_back(makeFlight("F1", "HUB1", "A1", now + 2, now + 4, F1_DISTANCE, F1_DEMAND));

        for (auto const& [code, airport] : airports) inventory.on_hand[code] = airport.initial_stock;
    }

    static Flight makeFlight(FlightId const& id,
                             AirportCode const& origin,
                             AirportCode const& destination,
                             Hour departure,
                             Hour arrival,
                             double distance,
                             Flow economy_passengers,
                             std::string const& aircraft = "B738")
    {
        Flight flight;
        flight.id = id;
        flight.flight_number = id;
        flight.origin = origin;
        flight.destination = destination;
        flight.departure_hour = departure;
        flight.arrival_hour = arrival;
        flight.distance = distance;
        flight.aircraft_type = aircraft;
        flight.passengers[kitIndex(KitType::ECONOMY)] = economy_passengers;
        return flight;
    }

    Flow& economyStock(AirportCode const& code) { return inventory.on_hand[code][kitIndex(KitType::ECONOMY)]; }
};

// First edge of the given role whose payload matches `pred`, or ABSENT_EDGE.
template <typename Payload, typename Pred>
EdgeId findEdge(Graph const& graph, Pred pred)
{
    for (EdgeId e = 0; e < static_cast<EdgeId>(graph.numEdges()); ++e)
    {
        if (auto const* payload = graph.edge(e).as<Payload>())
        {
            if (pred(*payload))
                return e;
        }
    }
    return ABSENT_EDGE;
}

inline EdgeId flightEdge(Graph const& graph, FlightId const& id, KitType kit = KitType::ECONOMY)
{
    return findEdge<FlightEdge>(graph,
                                [&](FlightEdge const& f) { return f.flight_id == id && f.kit == kit; });
}

inline EdgeId demandEdge(Graph const& graph, FlightId const& id, KitType kit = KitType::ECONOMY)
{
    return findEdge<DemandEdge>(graph,
                                [&](DemandEdge const& d) { return d.flight_id == id && d.kit == kit; });
}

inline size_t countEdges(Graph const& graph, EdgeRole role, KitType kit)
{
    size_t count = 0;
    for (auto const& edge : graph.edges())
    {
        if (edge.role() == role && edge.kit() == kit)
            ++count;
    }
    return count;
}
