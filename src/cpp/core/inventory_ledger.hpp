#pragma once

#include <algorithm>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/decision_extractor.hpp"
#include "core/domain.hpp"
#include "core/planner_config.hpp"

// Stock bookkeeping on the collaborator side: what each airport holds and
// what is still in processing or on order. The planner only ever sees the
// snapshot.
class InventoryLedger
{
    PlannerConfig config_;
    AirportMap airports_;
    AirportCode hub_;
    Dict<AirportCode, KitArray<Flow>> on_hand_{};
    std::vector<PendingArrival> pending_{};

    void schedule_(AirportCode const& airport, KitType kit, Hour ready_hour, Flow quantity)
    {
        if (quantity <= 0)
            return;
        for (auto& arrival : pending_)
        {
            if (arrival.airport == airport && arrival.kit == kit && arrival.ready_hour == ready_hour)
            {
                arrival.quantity += quantity;
                return;
            }
        }
        pending_.push_back(PendingArrival{airport, kit, ready_hour, quantity});
    }

   public:
    InventoryLedger(PlannerConfig config, AirportMap airports)
        : config_(std::move(config)), airports_(std::move(airports))
    {
        for (auto const& [code, airport] : airports_)
        {
            on_hand_[code] = airport.initial_stock;
            if (airport.is_hub)
                hub_ = code;
        }
    }

    AirportCode const& hub() const { return hub_; }
    std::vector<PendingArrival> const& pending() const { return pending_; }

    Flow onHand(AirportCode const& airport, KitType kit) const
    {
        auto it = on_hand_.find(airport);
        return it == on_hand_.end() ? 0 : it->second[kitIndex(kit)];
    }

    // On hand plus everything still on its way, network-wide.
    Flow total(KitType kit) const
    {
        Flow sum = 0;
        for (auto const& [_, stock] : on_hand_) sum += stock[kitIndex(kit)];
        for (auto const& arrival : pending_)
        {
            if (arrival.kit == kit)
                sum += arrival.quantity;
        }
        return sum;
    }

    // Releases every arrival due by `hour` into stock and returns the state.
    InventorySnapshot snapshot(Hour hour)
    {
        auto due = std::stable_partition(
            pending_.begin(), pending_.end(), [hour](PendingArrival const& a) { return a.ready_hour > hour; });
        for (auto it = due; it != pending_.end(); ++it) on_hand_[it->airport][kitIndex(it->kit)] += it->quantity;
        pending_.erase(due, pending_.end());

        InventorySnapshot snapshot;
        snapshot.on_hand = on_hand_;
        snapshot.pending = pending_;
        return snapshot;
    }

    void apply(Decision const& decision)
    {
        for (auto const& load : decision.flight_loads)
        {
            auto destination = airports_.find(load.destination);
            for (KitType kit : ALL_KIT_TYPES)
            {
                int k = kitIndex(kit);
                Flow wanted = load.kits[k];
                if (wanted <= 0)
                    continue;

                Flow& stock = on_hand_[load.origin][k];
                Flow taken = std::min(wanted, stock);
                if (taken < wanted)
                {
                    logger_->warn("Flight {} loads {} {} kits at {} but only {} are on hand.",
                                  load.flight_id,
                                  wanted,
                                  kitName(kit),
                                  load.origin,
                                  stock);
                }
                stock -= taken;

                Hour processing = destination != airports_.end() ? destination->second.processing_time[k]
                                                                 : config_.default_processing_time;
                schedule_(load.destination, kit, load.arrival_hour + processing, taken);
            }
        }

        for (auto const& order : decision.purchaseOrders())
        {
            if (hub_.empty())
            {
                logger_->warn("Purchase of {} {} kits dropped: no hub airport.", order.quantity, kitName(order.kit));
                continue;
            }
            schedule_(hub_, order.kit, decision.hour + config_.kit(order.kit).lead_time, order.quantity);
        }
    }
};
