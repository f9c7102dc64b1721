#pragma once
#include "crow.h"
#include <optional>
#include <string>
#include "../util/time_util.h"

struct Route {
    std::string id;
    std::optional<std::string> flight_id;
    std::string origin;
    std::string destination;
    Timestamp departure_date;
    Timestamp arrival_date;
    int capacity = 0;
    std::string description;
    Timestamp created_at;

    crow::json::wvalue to_json() const {
        crow::json::wvalue j;
        j["id"] = id;
        if (flight_id) {
            j["flight_id"] = *flight_id;
        } else {
            j["flight_id"] = nullptr;
        }
        j["origin"] = origin;
        j["destination"] = destination;
        j["departure_date"] = formatTimestamp(departure_date);
        j["arrival_date"] = formatTimestamp(arrival_date);
        j["capacity"] = capacity;
        j["description"] = description;
        j["created_at"] = formatTimestamp(created_at);
        return j;
    }
};

// Данные нового маршрута (id и created_at выставляет база)
struct RouteDraft {
    std::optional<std::string> flight_id;
    std::string origin;
    std::string destination;
    Timestamp departure_date;
    Timestamp arrival_date;
    int capacity = 0;
    std::string description;
};

// Частичное обновление: заданы только переданные поля.
// flight_id: null в запросе снимает номер рейса (clear_flight_id)
struct RoutePatch {
    std::optional<std::string> flight_id;
    bool clear_flight_id = false;
    std::optional<std::string> origin;
    std::optional<std::string> destination;
    std::optional<Timestamp> departure_date;
    std::optional<Timestamp> arrival_date;
    std::optional<int> capacity;
    std::optional<std::string> description;

    bool empty() const {
        return !flight_id && !clear_flight_id && !origin && !destination &&
               !departure_date && !arrival_date && !capacity && !description;
    }
};
