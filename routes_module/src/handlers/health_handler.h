#pragma once
#include "crow.h"
#include "../db/db.h"
#include "responses.h"

inline void registerHealthRoutes(crow::SimpleApp& app, DB& db) {
    // Проверка активации
    CROW_ROUTE(app, "/ping").methods("GET"_method)
    ([] {
        crow::json::wvalue res;
        res["status"] = "pong";
        return crow::response(200, res);
    });
    // Проверка доступности базы
    CROW_ROUTE(app, "/health/db").methods("GET"_method)
    ([&db] {
        if (!db.ping()) {
            return detailResponse(503, "Database unavailable");
        }
        crow::json::wvalue res;
        res["status"] = "ok";
        return crow::response(200, res);
    });
}
