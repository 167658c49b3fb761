#pragma once
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/decision_extractor.hpp"
#include "core/parsed_data.hpp"

class ScenarioParser
{
    [[noreturn]] static void fail_(std::string const& path, std::string const& message)
    {
        logger_->error("Scenario field '{}': {}", path, message);
        throw std::runtime_error("Scenario field '" + path + "': " + message);
    }

    static rapidjson::Value const* member_(rapidjson::Value const& object, char const* key)
    {
        auto it = object.FindMember(key);
        return it == object.MemberEnd() ? nullptr : &it->value;
    }

    static rapidjson::Value const& require_(rapidjson::Value const& object, char const* key, std::string const& path)
    {
        auto const* value = member_(object, key);
        if (!value)
            fail_(path + "." + key, "missing");
        return *value;
    }

    static std::string getString_(rapidjson::Value const& value, std::string const& path)
    {
        if (!value.IsString())
            fail_(path, "expected a string");
        return value.GetString();
    }

    static long long getInt_(rapidjson::Value const& value, std::string const& path)
    {
        if (!value.IsInt64())
            fail_(path, "expected an integer");
        return value.GetInt64();
    }

    static double getDouble_(rapidjson::Value const& value, std::string const& path)
    {
        if (!value.IsNumber())
            fail_(path, "expected a number");
        return value.GetDouble();
    }

    static bool getBool_(rapidjson::Value const& value, std::string const& path)
    {
        if (!value.IsBool())
            fail_(path, "expected true or false");
        return value.GetBool();
    }

    static rapidjson::Value::ConstArray getArray_(rapidjson::Value const& value, std::string const& path)
    {
        if (!value.IsArray())
            fail_(path, "expected an array");
        return value.GetArray();
    }

    template <typename T, typename Read>
    static void readOptional_(rapidjson::Value const& object, char const* key, std::string const& path, T& out, Read read)
    {
        if (auto const* value = member_(object, key))
            out = static_cast<T>(read(*value, path + "." + key));
    }

    // Per-kit object such as {"first": 2, "economy": 5}; absent kits keep `fallback`.
    template <typename V, typename Read>
    static KitArray<V> kitValues_(rapidjson::Value const* object, std::string const& path, V fallback, Read read)
    {
        KitArray<V> values;
        values.fill(fallback);
        if (!object)
            return values;
        if (!object->IsObject())
            fail_(path, "expected an object keyed by kit type");

        for (auto it = object->MemberBegin(); it != object->MemberEnd(); ++it)
        {
            std::string name = it->name.GetString();
            KitType kit{};
            try
            {
                kit = parseKitType(name);
            }
            catch (std::invalid_argument const&)
            {
                fail_(path + "." + name, "unknown kit type");
            }
            values[kitIndex(kit)] = static_cast<V>(read(it->value, path + "." + name));
        }
        return values;
    }

    static PlannerConfig parseConfig_(rapidjson::Value const* object)
    {
        PlannerConfig config;
        if (!object)
            return config;
        if (!object->IsObject())
            fail_("config", "expected an object");

        std::string path = "config";
        auto const& c = *object;

        if (auto const* kits = member_(c, "kits"))
        {
            if (!kits->IsObject())
                fail_(path + ".kits", "expected an object keyed by kit type");
            for (auto it = kits->MemberBegin(); it != kits->MemberEnd(); ++it)
            {
                std::string kit_path = path + ".kits." + it->name.GetString();
                KitType kit{};
                try
                {
                    kit = parseKitType(it->name.GetString());
                }
                catch (std::invalid_argument const&)
                {
                    fail_(kit_path, "unknown kit type");
                }
                if (!it->value.IsObject())
                    fail_(kit_path, "expected an object");
                auto& k = config.kits[kitIndex(kit)];
                readOptional_(it->value, "unit_cost", kit_path, k.unit_cost, getDouble_);
                readOptional_(it->value, "unit_weight", kit_path, k.unit_weight, getDouble_);
                readOptional_(it->value, "lead_time", kit_path, k.lead_time, getInt_);
            }
        }

        readOptional_(c, "horizon_hours", path, config.horizon_hours, getInt_);
        readOptional_(c, "holding_cost", path, config.holding_cost, getDouble_);
        readOptional_(c, "fuel_cost_per_km_kg", path, config.fuel_cost_per_km_kg, getDouble_);
        readOptional_(c, "unfulfilled_penalty_factor", path, config.unfulfilled_penalty_factor, getDouble_);
        readOptional_(c, "penalty_safety_factor", path, config.penalty_safety_factor, getDouble_);
        readOptional_(c, "max_order_quantity", path, config.max_order_quantity, getInt_);
        readOptional_(c, "discard_cost", path, config.discard_cost, getDouble_);
        readOptional_(c, "default_storage_capacity", path, config.default_storage_capacity, getInt_);
        readOptional_(c, "default_loading_cost", path, config.default_loading_cost, getDouble_);
        readOptional_(c, "default_processing_cost", path, config.default_processing_cost, getDouble_);
        readOptional_(c, "default_processing_time", path, config.default_processing_time, getInt_);
        readOptional_(c, "solver_time_limit_seconds", path, config.solver_time_limit_seconds, getDouble_);
        readOptional_(c, "accept_incumbent_on_timeout", path, config.accept_incumbent_on_timeout, getBool_);
        readOptional_(c, "parallel_kit_solve", path, config.parallel_kit_solve, getBool_);
        readOptional_(c, "verify_solutions", path, config.verify_solutions, getBool_);
        readOptional_(c, "log_level", path, config.log_level, getString_);
        return config;
    }

    static Airport parseAirport_(rapidjson::Value const& a, std::string const& path, PlannerConfig const& config)
    {
        Airport airport;
        airport.code = getString_(require_(a, "code", path), path + ".code");
        readOptional_(a, "is_hub", path, airport.is_hub, getBool_);
        airport.storage_capacity = kitValues_<Flow>(
            member_(a, "storage_capacity"), path + ".storage_capacity", config.default_storage_capacity, getInt_);
        airport.loading_cost = kitValues_<Cost>(
            member_(a, "loading_cost"), path + ".loading_cost", config.default_loading_cost, getDouble_);
        airport.processing_cost = kitValues_<Cost>(
            member_(a, "processing_cost"), path + ".processing_cost", config.default_processing_cost, getDouble_);
        airport.processing_time = kitValues_<Hour>(
            member_(a, "processing_time"), path + ".processing_time", config.default_processing_time, getInt_);
        airport.initial_stock =
            kitValues_<Flow>(member_(a, "initial_stock"), path + ".initial_stock", Flow{0}, getInt_);
        auto problem = airportProblem(airport);
        if (!problem.empty())
            fail_(path, problem);
        return airport;
    }

    static Flight parseFlight_(rapidjson::Value const& f, std::string const& path)
    {
        if (!f.IsObject())
            fail_(path, "expected an object");

        Flight flight;
        flight.id = getString_(require_(f, "id", path), path + ".id");
        flight.flight_number = flight.id;
        readOptional_(f, "flight_number", path, flight.flight_number, getString_);
        readOptional_(f, "origin", path, flight.origin, getString_);
        readOptional_(f, "destination", path, flight.destination, getString_);
        readOptional_(f, "departure_hour", path, flight.departure_hour, getInt_);
        readOptional_(f, "arrival_hour", path, flight.arrival_hour, getInt_);
        readOptional_(f, "distance", path, flight.distance, getDouble_);
        readOptional_(f, "aircraft_type", path, flight.aircraft_type, getString_);
        flight.passengers = kitValues_<Flow>(member_(f, "passengers"), path + ".passengers", Flow{0}, getInt_);
        if (auto const* status = member_(f, "status"))
        {
            try
            {
                flight.status = parseFlightStatus(getString_(*status, path + ".status"));
            }
            catch (std::invalid_argument const& e)
            {
                fail_(path + ".status", e.what());
            }
        }
        return flight;
    }

    static FlightEvent parseEvent_(rapidjson::Value const& e, std::string const& path)
    {
        if (!e.IsObject())
            fail_(path, "expected an object");

        FlightEvent event;
        try
        {
            event.type = parseFlightStatus(getString_(require_(e, "type", path), path + ".type"));
        }
        catch (std::invalid_argument const& ex)
        {
            fail_(path + ".type", ex.what());
        }
        event.flight = parseFlight_(require_(e, "flight", path), path + ".flight");
        event.flight.status = event.type;
        return event;
    }

   public:
    static ScenarioData parse_from_string(std::string const& json_content)
    {
        rapidjson::Document j;
        j.Parse(json_content.c_str());

        if (j.HasParseError())
        {
            std::string message = std::string(rapidjson::GetParseError_En(j.GetParseError())) + " at offset " +
                                  std::to_string(j.GetErrorOffset());
            logger_->error("JSON parse error: {}", message);
            throw std::runtime_error("JSON parse error: " + message);
        }
        if (!j.IsObject())
            fail_("$", "expected an object");

        ScenarioData data;
        data.config = parseConfig_(member_(j, "config"));
        data.config.validate();

        // airports
        auto airports = getArray_(require_(j, "airports", "$"), "airports");
        for (rapidjson::SizeType i = 0; i < airports.Size(); ++i)
        {
            std::string path = "airports[" + std::to_string(i) + "]";
            if (!airports[i].IsObject())
                fail_(path, "expected an object");
            auto airport = parseAirport_(airports[i], path, data.config);
            if (data.airports.count(airport.code))
                fail_(path + ".code", "duplicate airport " + airport.code);
            data.airports.emplace(airport.code, std::move(airport));
        }

        // aircraft_types
        auto aircraft = getArray_(require_(j, "aircraft_types", "$"), "aircraft_types");
        for (rapidjson::SizeType i = 0; i < aircraft.Size(); ++i)
        {
            std::string path = "aircraft_types[" + std::to_string(i) + "]";
            if (!aircraft[i].IsObject())
                fail_(path, "expected an object");
            AircraftType type;
            type.code = getString_(require_(aircraft[i], "code", path), path + ".code");
            type.capacity = kitValues_<Flow>(member_(aircraft[i], "capacity"), path + ".capacity", Flow{0}, getInt_);
            data.aircraft_types[type.code] = type;
        }

        // flights
        if (auto const* flights = member_(j, "flights"))
        {
            auto array = getArray_(*flights, "flights");
            for (rapidjson::SizeType i = 0; i < array.Size(); ++i)
                data.flights.push_back(parseFlight_(array[i], "flights[" + std::to_string(i) + "]"));
        }

        // events, grouped by the hour they become known
        if (auto const* events = member_(j, "events"))
        {
            auto array = getArray_(*events, "events");
            for (rapidjson::SizeType i = 0; i < array.Size(); ++i)
            {
                std::string path = "events[" + std::to_string(i) + "]";
                if (!array[i].IsObject())
                    fail_(path, "expected an object");
                Hour hour = static_cast<Hour>(getInt_(require_(array[i], "hour", path), path + ".hour"));
                data.events[hour].push_back(parseEvent_(array[i], path));
            }
        }

        readOptional_(j, "start_hour", "$", data.start_hour, getInt_);
        data.end_hour = data.start_hour + data.config.horizon_hours;
        readOptional_(j, "end_hour", "$", data.end_hour, getInt_);
        if (data.end_hour < data.start_hour)
            fail_("end_hour", "must not precede start_hour");

        logger_->info("Scenario: {} airports, {} aircraft types, {} flights, {} event hours, hours [{}, {}).",
                      data.airports.size(),
                      data.aircraft_types.size(),
                      data.flights.size(),
                      data.events.size(),
                      data.start_hour,
                      data.end_hour);
        return data;
    }

    static ScenarioData parse_from_json(std::string const& filepath)
    {
        std::ifstream input_file(filepath);
        if (!input_file.is_open())
        {
            logger_->error("Cannot open JSON file: {}", filepath);
            throw std::runtime_error("Cannot open JSON file: " + filepath);
        }

        std::stringstream buffer;
        buffer << input_file.rdbuf();
        return parse_from_string(buffer.str());
    }

    static std::string to_json_string(std::vector<Decision> const& decisions)
    {
        rapidjson::Document doc;
        doc.SetArray();
        rapidjson::Document::AllocatorType& allocator = doc.GetAllocator();

        for (auto const& decision : decisions)
        {
            rapidjson::Value entry(rapidjson::kObjectType);
            entry.AddMember("hour", decision.hour, allocator);
            entry.AddMember(
                "status", rapidjson::Value().SetString(statusName(decision.status).c_str(), allocator), allocator);
            entry.AddMember("solver", rapidjson::Value().SetString(decision.solver.c_str(), allocator), allocator);
            entry.AddMember("plannedCost", decision.planned_cost, allocator);

            rapidjson::Value loads(rapidjson::kArrayType);
            for (auto const& load : decision.flight_loads)
            {
                rapidjson::Value kits(rapidjson::kObjectType);
                for (KitType kit : ALL_KIT_TYPES)
                {
                    kits.AddMember(rapidjson::Value().SetString(kitJsonName(kit).c_str(), allocator),
                                   static_cast<int64_t>(load.kits[kitIndex(kit)]),
                                   allocator);
                }
                rapidjson::Value item(rapidjson::kObjectType);
                item.AddMember("flightId", rapidjson::Value().SetString(load.flight_id.c_str(), allocator), allocator);
                item.AddMember("loadedKits", kits, allocator);
                loads.PushBack(item, allocator);
            }
            entry.AddMember("flightLoads", loads, allocator);

            rapidjson::Value orders(rapidjson::kArrayType);
            for (auto const& order : decision.purchaseOrders())
            {
                rapidjson::Value item(rapidjson::kObjectType);
                item.AddMember("kitType", rapidjson::Value().SetString(kitName(order.kit).c_str(), allocator), allocator);
                item.AddMember("quantity", static_cast<int64_t>(order.quantity), allocator);
                orders.PushBack(item, allocator);
            }
            entry.AddMember("purchasingOrders", orders, allocator);

            doc.PushBack(entry, allocator);
        }

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
        return buffer.GetString();
    }

    static void serialize_to_json(std::vector<Decision> const& decisions, std::string const& output_path)
    {
        std::ofstream out_file(output_path);
        if (!out_file.is_open())
        {
            logger_->error("Cannot open output file: {}", output_path);
            throw std::runtime_error("Cannot open output file: " + output_path);
        }
        out_file << to_json_string(decisions);
        out_file.close();
    }
};
