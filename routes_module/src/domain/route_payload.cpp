#include "route_payload.h"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace {

// Поле отсутствует или равно null
bool isAbsent(const crow::json::rvalue& body, const char* field) {
    return !body.has(field) || body[field].t() == crow::json::type::Null;
}

bool isExplicitNull(const crow::json::rvalue& body, const char* field) {
    return body.has(field) && body[field].t() == crow::json::type::Null;
}

std::optional<std::string> readText(
    const crow::json::rvalue& body,
    const char* field,
    bool required,
    std::vector<FieldError>& errors
) {
    if (isAbsent(body, field)) {
        if (required) errors.push_back({field, "field required"});
        return std::nullopt;
    }
    const auto& value = body[field];
    if (value.t() != crow::json::type::String) {
        errors.push_back({field, "must be a string"});
        return std::nullopt;
    }
    return std::string(value.s());
}

std::optional<std::string> readNonEmptyText(
    const crow::json::rvalue& body,
    const char* field,
    bool required,
    std::vector<FieldError>& errors
) {
    auto text = readText(body, field, required, errors);
    if (text && text->empty()) {
        errors.push_back({field, "must not be empty"});
        return std::nullopt;
    }
    return text;
}

std::optional<Timestamp> readTimestamp(
    const crow::json::rvalue& body,
    const char* field,
    bool required,
    std::vector<FieldError>& errors
) {
    auto text = readText(body, field, required, errors);
    if (!text) return std::nullopt;

    Timestamp ts;
    if (!parseTimestamp(*text, ts)) {
        errors.push_back({field, "must be an ISO-8601 datetime"});
        return std::nullopt;
    }
    return ts;
}

std::optional<int> readCapacity(
    const crow::json::rvalue& body,
    bool required,
    std::vector<FieldError>& errors
) {
    const char* field = "capacity";
    if (isAbsent(body, field)) {
        if (required) errors.push_back({field, "field required"});
        return std::nullopt;
    }
    const auto& value = body[field];
    if (value.t() != crow::json::type::Number) {
        errors.push_back({field, "must be an integer"});
        return std::nullopt;
    }

    long long capacity;
    switch (value.nt()) {
        case crow::json::num_type::Signed_integer:
            capacity = value.i();
            break;
        case crow::json::num_type::Unsigned_integer:
            if (value.u() > static_cast<unsigned long long>(INT_MAX)) {
                errors.push_back({field, "is too large"});
                return std::nullopt;
            }
            capacity = static_cast<long long>(value.u());
            break;
        default:
            errors.push_back({field, "must be an integer"});
            return std::nullopt;
    }

    if (capacity <= 0) {
        errors.push_back({field, "must be greater than 0"});
        return std::nullopt;
    }
    if (capacity > INT_MAX) {
        errors.push_back({field, "is too large"});
        return std::nullopt;
    }
    return static_cast<int>(capacity);
}

void checkSchedule(Timestamp departure, Timestamp arrival, std::vector<FieldError>& errors) {
    if (departure >= arrival) {
        errors.push_back({"arrival_date", "departure_date must be earlier than arrival_date"});
    }
}

bool readNonNegative(const char* raw, long long& out) {
    if (!raw || !*raw) return false;
    for (const char* p = raw; *p; p++) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(raw, &end, 10);
    if (errno == ERANGE || *end != '\0') return false;
    out = value;
    return true;
}

} // namespace

std::vector<FieldError> parseRouteDraft(const crow::json::rvalue& body, RouteDraft& draft) {
    std::vector<FieldError> errors;

    auto flightId = readNonEmptyText(body, "flight_id", false, errors);
    auto origin = readNonEmptyText(body, "origin", true, errors);
    auto destination = readNonEmptyText(body, "destination", true, errors);
    auto departure = readTimestamp(body, "departure_date", true, errors);
    auto arrival = readTimestamp(body, "arrival_date", true, errors);
    auto capacity = readCapacity(body, true, errors);
    auto description = readText(body, "description", false, errors);

    if (departure && arrival) {
        checkSchedule(*departure, *arrival, errors);
    }
    if (!errors.empty()) {
        return errors;
    }

    draft.flight_id = flightId;
    draft.origin = *origin;
    draft.destination = *destination;
    draft.departure_date = *departure;
    draft.arrival_date = *arrival;
    draft.capacity = *capacity;
    draft.description = description.value_or("");
    return errors;
}

std::vector<FieldError> parseRoutePatch(const crow::json::rvalue& body, RoutePatch& patch) {
    std::vector<FieldError> errors;

    patch.flight_id = readNonEmptyText(body, "flight_id", false, errors);
    patch.origin = readNonEmptyText(body, "origin", false, errors);
    patch.destination = readNonEmptyText(body, "destination", false, errors);
    patch.departure_date = readTimestamp(body, "departure_date", false, errors);
    patch.arrival_date = readTimestamp(body, "arrival_date", false, errors);
    patch.capacity = readCapacity(body, false, errors);
    patch.description = readText(body, "description", false, errors);

    // null очищает необязательные поля
    patch.clear_flight_id = isExplicitNull(body, "flight_id");
    if (isExplicitNull(body, "description")) {
        patch.description = std::string();
    }

    return errors;
}

Route applyPatch(const Route& current, const RoutePatch& patch) {
    Route merged = current;
    if (patch.clear_flight_id) merged.flight_id.reset();
    if (patch.flight_id) merged.flight_id = patch.flight_id;
    if (patch.origin) merged.origin = *patch.origin;
    if (patch.destination) merged.destination = *patch.destination;
    if (patch.departure_date) merged.departure_date = *patch.departure_date;
    if (patch.arrival_date) merged.arrival_date = *patch.arrival_date;
    if (patch.capacity) merged.capacity = *patch.capacity;
    if (patch.description) merged.description = *patch.description;
    return merged;
}

std::vector<FieldError> validateRoute(const Route& route) {
    std::vector<FieldError> errors;
    if (route.origin.empty()) errors.push_back({"origin", "must not be empty"});
    if (route.destination.empty()) errors.push_back({"destination", "must not be empty"});
    if (route.capacity <= 0) errors.push_back({"capacity", "must be greater than 0"});
    checkSchedule(route.departure_date, route.arrival_date, errors);
    return errors;
}

std::vector<FieldError> parsePaging(const crow::query_string& params, Paging& paging) {
    std::vector<FieldError> errors;

    const char* offset = params.get("offset");
    const char* field = "offset";
    if (!offset) {
        offset = params.get("skip");
        field = "skip";
    }
    paging.offset = 0;
    if (offset && !readNonNegative(offset, paging.offset)) {
        errors.push_back({field, "must be a non-negative integer"});
    }

    paging.limit = kDefaultPageLimit;
    const char* limit = params.get("limit");
    if (limit) {
        if (!readNonNegative(limit, paging.limit)) {
            errors.push_back({"limit", "must be a non-negative integer"});
        }
    }

    const char* flight = params.get("flight");
    paging.flight = flight ? flight : "";

    return errors;
}

bool isRouteId(const std::string& id) {
    if (id.size() != 36) return false;
    for (size_t i = 0; i < id.size(); i++) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

crow::json::wvalue fieldErrorsToJson(const std::vector<FieldError>& errors) {
    std::vector<crow::json::wvalue> items;
    for (const auto& e : errors) {
        crow::json::wvalue item;
        item["field"] = e.field;
        item["message"] = e.message;
        items.push_back(std::move(item));
    }
    crow::json::wvalue res;
    res["detail"] = std::move(items);
    return res;
}
