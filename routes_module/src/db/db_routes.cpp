#include "db.h"
#include <string>

// Колонки маршрута; даты отдаются в микросекундах от эпохи
static const std::string kRouteColumns =
    "id::text, flight_id, origin, destination, "
    "(EXTRACT(EPOCH FROM departure_date) * 1000000)::bigint, "
    "(EXTRACT(EPOCH FROM arrival_date) * 1000000)::bigint, "
    "capacity, description, "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::bigint";

static Route readRoute(PGresult* res, int row) {
    Route r;
    r.id = PQgetvalue(res, row, 0);
    if (!PQgetisnull(res, row, 1)) {
        r.flight_id = std::string(PQgetvalue(res, row, 1));
    }
    r.origin = PQgetvalue(res, row, 2);
    r.destination = PQgetvalue(res, row, 3);
    r.departure_date = timestampFromMicros(std::stoll(PQgetvalue(res, row, 4)));
    r.arrival_date = timestampFromMicros(std::stoll(PQgetvalue(res, row, 5)));
    r.capacity = std::stoi(PQgetvalue(res, row, 6));
    r.description = PQgetvalue(res, row, 7);
    r.created_at = timestampFromMicros(std::stoll(PQgetvalue(res, row, 8)));
    return r;
}

// Создание маршрута
Route DB::createRoute(const RouteDraft& draft) {
    auto conn = connect();

    std::string departure = formatTimestamp(draft.departure_date);
    std::string arrival = formatTimestamp(draft.arrival_date);
    std::string capacity = std::to_string(draft.capacity);

    std::vector<const char*> params = {
        draft.flight_id ? draft.flight_id->c_str() : nullptr,
        draft.origin.c_str(),
        draft.destination.c_str(),
        departure.c_str(),
        arrival.c_str(),
        capacity.c_str(),
        draft.description.c_str()
    };

    std::string sql =
        "INSERT INTO routes (flight_id, origin, destination, departure_date, arrival_date, capacity, description) "
        "VALUES ($1, $2, $3, $4::timestamptz, $5::timestamptz, $6::int, $7) "
        "RETURNING " + kRouteColumns;

    auto res = exec(conn.get(), sql, params, PGRES_TUPLES_OK, "Create route");
    return readRoute(res.get(), 0);
}

// Список маршрутов, новые первыми
std::vector<Route> DB::getRoutes(long long offset, long long limit, const std::string& flightFilter) {
    auto conn = connect();

    std::string offsetStr = std::to_string(offset);
    std::string limitStr = std::to_string(limit);
    std::vector<const char*> params = {
        flightFilter.empty() ? nullptr : flightFilter.c_str(),
        limitStr.c_str(),
        offsetStr.c_str()
    };

    std::string sql =
        "SELECT " + kRouteColumns + " FROM routes "
        "WHERE ($1::text IS NULL OR flight_id = $1::text) "
        "ORDER BY created_at DESC, seq DESC "
        "LIMIT $2::bigint OFFSET $3::bigint";

    auto res = exec(conn.get(), sql, params, PGRES_TUPLES_OK, "Select routes");

    std::vector<Route> routes;
    int rows = PQntuples(res.get());
    routes.reserve(rows);
    for (int i = 0; i < rows; i++) {
        routes.push_back(readRoute(res.get(), i));
    }
    return routes;
}

// Количество маршрутов
long long DB::countRoutes(const std::string& flightFilter) {
    auto conn = connect();

    std::vector<const char*> params = {
        flightFilter.empty() ? nullptr : flightFilter.c_str()
    };
    auto res = exec(
        conn.get(),
        "SELECT COUNT(*) FROM routes WHERE ($1::text IS NULL OR flight_id = $1::text)",
        params, PGRES_TUPLES_OK, "Count routes"
    );
    return std::stoll(PQgetvalue(res.get(), 0, 0));
}

// Получение маршрута по айди
Route DB::getRouteById(const std::string& routeId) {
    auto conn = connect();

    std::vector<const char*> params = { routeId.c_str() };
    std::string sql = "SELECT " + kRouteColumns + " FROM routes WHERE id = $1::uuid";

    auto res = exec(conn.get(), sql, params, PGRES_TUPLES_OK, "Select route");
    if (PQntuples(res.get()) == 0) {
        return Route{};
    }
    return readRoute(res.get(), 0);
}

// Частичное обновление одним запросом: непереданные поля берутся из текущей строки,
// инварианты проверяют CHECK-ограничения. Пустой id в ответе - записи уже нет
Route DB::updateRoute(const std::string& routeId, const RoutePatch& patch) {
    auto conn = connect();

    std::string departure = patch.departure_date ? formatTimestamp(*patch.departure_date) : "";
    std::string arrival = patch.arrival_date ? formatTimestamp(*patch.arrival_date) : "";
    std::string capacity = patch.capacity ? std::to_string(*patch.capacity) : "";

    std::vector<const char*> params = {
        routeId.c_str(),
        patch.flight_id ? patch.flight_id->c_str() : nullptr,
        patch.clear_flight_id ? "true" : "false",
        patch.origin ? patch.origin->c_str() : nullptr,
        patch.destination ? patch.destination->c_str() : nullptr,
        patch.departure_date ? departure.c_str() : nullptr,
        patch.arrival_date ? arrival.c_str() : nullptr,
        patch.capacity ? capacity.c_str() : nullptr,
        patch.description ? patch.description->c_str() : nullptr
    };

    std::string sql =
        "UPDATE routes SET "
        "flight_id = CASE WHEN $2::text IS NOT NULL THEN $2::text "
        "WHEN $3::bool THEN NULL ELSE flight_id END, "
        "origin = COALESCE($4::text, origin), "
        "destination = COALESCE($5::text, destination), "
        "departure_date = COALESCE($6::timestamptz, departure_date), "
        "arrival_date = COALESCE($7::timestamptz, arrival_date), "
        "capacity = COALESCE($8::int, capacity), "
        "description = COALESCE($9::text, description) "
        "WHERE id = $1::uuid "
        "RETURNING " + kRouteColumns;

    auto res = exec(conn.get(), sql, params, PGRES_TUPLES_OK, "Update route");
    if (PQntuples(res.get()) == 0) {
        return Route{};
    }
    return readRoute(res.get(), 0);
}

// Удаление маршрута
bool DB::deleteRoute(const std::string& routeId) {
    auto conn = connect();

    std::vector<const char*> params = { routeId.c_str() };
    auto res = exec(conn.get(), "DELETE FROM routes WHERE id = $1::uuid", params, PGRES_COMMAND_OK, "Delete route");

    return std::string(PQcmdTuples(res.get())) == "1";
}
