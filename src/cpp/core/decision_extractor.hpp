#pragma once

#include <map>
#include <string>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/graph.hpp"
#include "core/solution.hpp"

struct FlightLoad
{
    FlightId flight_id;
    AirportCode origin;
    AirportCode destination;
    Hour departure_hour{};
    Hour arrival_hour{};
    KitArray<Flow> kits{};

    Flow total() const { return kitSum(kits); }
};

struct PurchaseOrder
{
    KitType kit{KitType::ECONOMY};
    Flow quantity{};
};

// Actions for one hour. Everything else in the plan is provisional and is
// re-derived next cycle.
struct Decision
{
    Hour hour{};
    SolveStatus status{SolveStatus::UNDEFINED};
    std::string solver;
    Cost planned_cost{};
    std::vector<FlightLoad> flight_loads{};  // sorted by flight id
    KitArray<Flow> purchases{};

    bool empty() const { return flight_loads.empty() && kitSum(purchases) == 0; }

    FlightLoad const* load(FlightId const& flight_id) const
    {
        for (auto const& flight_load : flight_loads)
        {
            if (flight_load.flight_id == flight_id)
                return &flight_load;
        }
        return nullptr;
    }

    Flow loaded(FlightId const& flight_id, KitType kit) const
    {
        auto const* flight_load = load(flight_id);
        return flight_load ? flight_load->kits[kitIndex(kit)] : 0;
    }

    std::vector<PurchaseOrder> purchaseOrders() const
    {
        std::vector<PurchaseOrder> orders;
        for (KitType kit : ALL_KIT_TYPES)
        {
            if (purchases[kitIndex(kit)] > 0)
                orders.push_back(PurchaseOrder{kit, purchases[kitIndex(kit)]});
        }
        return orders;
    }
};

class DecisionExtractor
{
   public:
    static Decision extract(Graph const& graph, Solution const& solution, Hour current_hour)
    {
        Decision decision;
        decision.hour = current_hour;
        decision.status = solution.status;
        decision.planned_cost = solution.total_cost;

        if (!solution.usable())
        {
            logger_->warn("No usable plan for hour {} ({}); nothing to load or buy.",
                          current_hour,
                          statusName(solution.status));
            return decision;
        }

        std::map<FlightId, FlightLoad> loads;
        for (EdgeId e = 0; e < static_cast<EdgeId>(graph.numEdges()); ++e)
        {
            Flow f = solution.flowOn(e);
            if (f <= 0)
                continue;

            auto const& edge = graph.edge(e);
            if (auto const* flight = edge.as<FlightEdge>())
            {
                // Only the departures of this very hour are actionable.
                if (flight->departure_absolute != current_hour)
                    continue;
                auto& load = loads[flight->flight_id];
                load.flight_id = flight->flight_id;
                load.origin = flight->origin;
                load.destination = flight->destination;
                load.departure_hour = flight->departure_absolute;
                load.arrival_hour = flight->arrival_absolute;
                load.kits[kitIndex(flight->kit)] += f;
            }
            else if (auto const* purchase = edge.as<PurchaseEdge>())
            {
                decision.purchases[kitIndex(purchase->kit)] += f;
            }
        }

        for (auto& [_, load] : loads) decision.flight_loads.push_back(std::move(load));

        logger_->info("Hour {}: {} flights to load, {} kits to order.",
                      current_hour,
                      decision.flight_loads.size(),
                      kitSum(decision.purchases));
        return decision;
    }
};
