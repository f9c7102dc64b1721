#pragma once
#include "crow.h"
#include "../db/db.h"
#include "../domain/route_payload.h"
#include "responses.h"

// Обновление маршрута: PATCH и PUT работают одинаково
inline crow::response updateRouteResponse(DB& db, const crow::request& req, const std::string& routeId) {
    if (!isRouteId(routeId)) {
        return detailResponse(400, "Invalid route id");
    }

    crow::json::rvalue body;
    if (!loadJsonObject(req, body)) {
        return detailResponse(400, "Invalid JSON");
    }

    RoutePatch patch;
    auto errors = parseRoutePatch(body, patch);
    if (!errors.empty()) {
        return validationFailed(errors);
    }
    if (patch.empty()) {
        return detailResponse(400, "No fields to update");
    }

    try {
        auto current = db.getRouteById(routeId);
        if (current.id.empty()) {
            return detailResponse(404, "Route not found");
        }

        // Предварительная проверка ради понятных ошибок; запись атомарна и защищена CHECK
        errors = validateRoute(applyPatch(current, patch));
        if (!errors.empty()) {
            return validationFailed(errors);
        }

        auto updated = db.updateRoute(routeId, patch);
        if (updated.id.empty()) {
            return detailResponse(404, "Route not found");
        }
        return crow::response(200, updated.to_json());
    } catch (const DbError& e) {
        return dbFailed(e);
    }
}

inline crow::response resetResponse(DB& db) {
    try {
        db.resetRoutes();
    } catch (const DbError& e) {
        return dbFailed(e);
    }
    crow::json::wvalue res;
    res["status"] = "ok";
    res["message"] = "All routes were deleted";
    return crow::response(200, res);
}

inline void registerRouteRoutes(crow::SimpleApp& app, DB& db) {
    // Статические пути регистрируются раньше /routes/<string>
    CROW_ROUTE(app, "/routes/ping").methods("GET"_method)
    ([] {
        crow::json::wvalue res;
        res["status"] = "ok";
        return crow::response(200, res);
    });
    // Количество маршрутов
    CROW_ROUTE(app, "/routes/count").methods("GET"_method)
    ([&db](const crow::request& req) {
        const char* flight = req.url_params.get("flight");
        try {
            crow::json::wvalue res;
            res["count"] = db.countRoutes(flight ? flight : "");
            return crow::response(200, res);
        } catch (const DbError& e) {
            return dbFailed(e);
        }
    });
    // Очистка базы (только для разработки)
    CROW_ROUTE(app, "/routes/reset").methods("POST"_method)
    ([&db] {
        return resetResponse(db);
    });
    CROW_ROUTE(app, "/reset").methods("POST"_method)
    ([&db] {
        return resetResponse(db);
    });

    // Список маршрутов
    CROW_ROUTE(app, "/routes").methods("GET"_method)
    ([&db](const crow::request& req) {
        Paging paging;
        auto errors = parsePaging(req.url_params, paging);
        if (!errors.empty()) {
            return validationFailed(errors);
        }

        try {
            auto routes = db.getRoutes(paging.offset, paging.limit, paging.flight);
            std::vector<crow::json::wvalue> route_list;
            for (const auto& r : routes) {
                route_list.push_back(r.to_json());
            }
            crow::json::wvalue res;
            res["total"] = route_list.size();
            res["offset"] = paging.offset;
            res["limit"] = paging.limit;
            res["routes"] = std::move(route_list);
            return crow::response(200, res);
        } catch (const DbError& e) {
            return dbFailed(e);
        }
    });
    // Создание маршрута
    CROW_ROUTE(app, "/routes").methods("POST"_method)
    ([&db](const crow::request& req) {
        crow::json::rvalue body;
        if (!loadJsonObject(req, body)) {
            return detailResponse(400, "Invalid JSON");
        }

        RouteDraft draft;
        auto errors = parseRouteDraft(body, draft);
        if (!errors.empty()) {
            return validationFailed(errors);
        }

        try {
            auto route = db.createRoute(draft);
            CROW_LOG_INFO << "Route created: " << route.id;
            return crow::response(201, route.to_json());
        } catch (const DbError& e) {
            return dbFailed(e);
        }
    });
    // Получение маршрута по айди
    CROW_ROUTE(app, "/routes/<string>").methods("GET"_method)
    ([&db](std::string routeId) {
        if (!isRouteId(routeId)) {
            return detailResponse(400, "Invalid route id");
        }
        try {
            auto route = db.getRouteById(routeId);
            if (route.id.empty()) {
                return detailResponse(404, "Route not found");
            }
            return crow::response(200, route.to_json());
        } catch (const DbError& e) {
            return dbFailed(e);
        }
    });
    // Изменить маршрут
    CROW_ROUTE(app, "/routes/<string>").methods("PATCH"_method, "PUT"_method)
    ([&db](const crow::request& req, std::string routeId) {
        return updateRouteResponse(db, req, routeId);
    });
    // Удаление маршрута
    CROW_ROUTE(app, "/routes/<string>").methods("DELETE"_method)
    ([&db](std::string routeId) {
        if (!isRouteId(routeId)) {
            return detailResponse(400, "Invalid route id");
        }
        try {
            if (!db.deleteRoute(routeId)) {
                return detailResponse(404, "Route not found");
            }
            CROW_LOG_INFO << "Route deleted: " << routeId;
            return crow::response(204);
        } catch (const DbError& e) {
            return dbFailed(e);
        }
    });
}
