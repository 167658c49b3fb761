#pragma once

#include <string>
#include <vector>

#include "core/kit_types.hpp"

struct Airport
{
    AirportCode code;
    bool is_hub{false};
    KitArray<Flow> storage_capacity{};
    KitArray<Cost> loading_cost{};
    KitArray<Cost> processing_cost{};
    KitArray<Hour> processing_time{};
    KitArray<Flow> initial_stock{};
};

// Empty when the airport's per-kit values can be planned with, otherwise a
// description of the first bad value.
inline std::string airportProblem(Airport const& airport)
{
    for (KitType kit : ALL_KIT_TYPES)
    {
        int k = kitIndex(kit);
        std::string where = " for " + kitName(kit);
        if (airport.storage_capacity[k] < 0)
            return "negative storage capacity" + where;
        if (airport.loading_cost[k] < 0)
            return "negative loading cost" + where;
        if (airport.processing_cost[k] < 0)
            return "negative processing cost" + where;
        if (airport.processing_time[k] < 0)
            return "negative processing time" + where;
        if (airport.initial_stock[k] < 0)
            return "negative initial stock" + where;
    }
    return {};
}

struct AircraftType
{
    std::string code;
    KitArray<Flow> capacity{};
};

enum class FlightStatus
{
    SCHEDULED,
    CHECKED_IN,
    LANDED
};

inline std::string flightStatusName(FlightStatus status)
{
    switch (status)
    {
        case FlightStatus::SCHEDULED:
            return "SCHEDULED";
        case FlightStatus::CHECKED_IN:
            return "CHECKED_IN";
        case FlightStatus::LANDED:
            return "LANDED";
    }
    return "UNKNOWN";
}

inline FlightStatus parseFlightStatus(std::string const& name)
{
    if (name == "SCHEDULED")
        return FlightStatus::SCHEDULED;
    if (name == "CHECKED_IN")
        return FlightStatus::CHECKED_IN;
    if (name == "LANDED")
        return FlightStatus::LANDED;
    throw std::invalid_argument("Unknown flight event type: " + name);
}

struct Flight
{
    FlightId id;
    std::string flight_number;
    AirportCode origin;
    AirportCode destination;
    Hour departure_hour{};
    Hour arrival_hour{};
    double distance{};
    std::string aircraft_type;
    KitArray<Flow> passengers{};
    FlightStatus status{FlightStatus::SCHEDULED};

    // Passenger counts and aircraft are forecasts until check-in.
    bool isForecast() const { return status == FlightStatus::SCHEDULED; }
};

struct FlightEvent
{
    FlightStatus type{FlightStatus::SCHEDULED};
    Flight flight;
};

using AirportMap = Dict<AirportCode, Airport>;
using AircraftTypeMap = Dict<std::string, AircraftType>;

struct PendingArrival
{
    AirportCode airport;
    KitType kit{KitType::ECONOMY};
    Hour ready_hour{};
    Flow quantity{};
};

// Current state handed to the planner each hour: stock on hand plus kits
// already committed to arrive later (in processing or ordered).
struct InventorySnapshot
{
    Dict<AirportCode, KitArray<Flow>> on_hand;
    std::vector<PendingArrival> pending;

    Flow onHand(AirportCode const& airport, KitType kit) const
    {
        auto it = on_hand.find(airport);
        if (it == on_hand.end())
            return 0;
        return it->second[kitIndex(kit)];
    }
};
