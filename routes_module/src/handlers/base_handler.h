#pragma once
#include "crow.h"
#include "health_handler.h"
#include "route_handler.h"
#include "../db/db.h"


inline void registerRoutes(crow::SimpleApp& app, DB& db) {
    registerHealthRoutes(app, db);
    registerRouteRoutes(app, db);
}
