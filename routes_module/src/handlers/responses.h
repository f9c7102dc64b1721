#pragma once
#include "crow.h"
#include <string>
#include <vector>
#include "../db/db.h"
#include "../domain/route_payload.h"

// Ответ вида {"detail": "..."}
inline crow::response detailResponse(int code, const std::string& detail) {
    crow::json::wvalue body;
    body["detail"] = detail;
    return crow::response(code, body);
}

// 422 со списком ошибок по полям
inline crow::response validationFailed(const std::vector<FieldError>& errors) {
    return crow::response(422, fieldErrorsToJson(errors));
}

// Ошибка базы: нарушение уникальности -> 409, нарушение CHECK -> 422, остальное -> 500
inline crow::response dbFailed(const DbError& e) {
    if (e.isUniqueViolation()) {
        return detailResponse(409, "Route with this flight_id already exists");
    }
    if (e.isCheckViolation()) {
        if (e.constraintName() == "routes_capacity_positive") {
            return validationFailed({FieldError{"capacity", "must be greater than 0"}});
        }
        return validationFailed({FieldError{"arrival_date", "departure_date must be earlier than arrival_date"}});
    }
    return detailResponse(500, "Database error");
}

// Тело запроса должно быть JSON-объектом
inline bool loadJsonObject(const crow::request& req, crow::json::rvalue& body) {
    body = crow::json::load(req.body);
    return body && body.t() == crow::json::type::Object;
}
