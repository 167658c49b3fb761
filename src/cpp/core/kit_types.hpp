#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

enum class KitType : int
{
    FIRST = 0,
    BUSINESS = 1,
    PREMIUM_ECONOMY = 2,
    ECONOMY = 3
};

constexpr int NUM_KIT_TYPES = 4;
constexpr std::array<KitType, NUM_KIT_TYPES> ALL_KIT_TYPES{
    KitType::FIRST, KitType::BUSINESS, KitType::PREMIUM_ECONOMY, KitType::ECONOMY};

using Hour = int;
using NodeId = int;
using EdgeId = int;
using Flow = std::int64_t;
using Cost = double;
using FlightId = std::string;
using AirportCode = std::string;
using NodeList = std::vector<NodeId>;
using EdgeList = std::vector<EdgeId>;

constexpr NodeId ABSENT_NODE = -1;
constexpr EdgeId ABSENT_EDGE = -1;

// Stands for "unbounded" on storage-free edges; far above any realistic fleet stock.
constexpr Flow INFINITE_CAPACITY = 1'000'000'000;

template <typename K, typename V>
using Dict = std::unordered_map<K, V>;

template <typename V>
using DictInt = std::vector<V>;

template <typename V>
using KitArray = std::array<V, NUM_KIT_TYPES>;

inline int kitIndex(KitType kit) { return static_cast<int>(kit); }

inline std::string kitName(KitType kit)
{
    switch (kit)
    {
        case KitType::FIRST:
            return "FIRST";
        case KitType::BUSINESS:
            return "BUSINESS";
        case KitType::PREMIUM_ECONOMY:
            return "PREMIUM_ECONOMY";
        case KitType::ECONOMY:
            return "ECONOMY";
    }
    return "UNKNOWN";
}

// Field names used by the round API ("first", "premiumEconomy", ...).
inline std::string kitJsonName(KitType kit)
{
    switch (kit)
    {
        case KitType::FIRST:
            return "first";
        case KitType::BUSINESS:
            return "business";
        case KitType::PREMIUM_ECONOMY:
            return "premiumEconomy";
        case KitType::ECONOMY:
            return "economy";
    }
    return "unknown";
}

inline KitType parseKitType(std::string const& name)
{
    for (KitType kit : ALL_KIT_TYPES)
    {
        if (name == kitName(kit) || name == kitJsonName(kit))
            return kit;
    }
    throw std::invalid_argument("Unknown kit type: " + name);
}

template <typename V>
V kitSum(KitArray<V> const& values)
{
    V total{};
    for (auto const& v : values) total += v;
    return total;
}
