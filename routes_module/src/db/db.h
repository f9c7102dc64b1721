#pragma once
#include <libpq-fe.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "../domain/route.h"

// Ошибка выполнения запроса к базе, с кодом SQLSTATE
class DbError : public std::runtime_error {
public:
    DbError(const std::string& message, std::string sqlstate, std::string constraint = "");

    const std::string& sqlState() const { return sqlstate; }
    const std::string& constraintName() const { return constraint; }
    bool isUniqueViolation() const { return sqlstate == "23505"; }
    bool isCheckViolation() const { return sqlstate == "23514"; }

private:
    std::string sqlstate;
    std::string constraint;
};

class DB {
public:
    explicit DB(const std::string& conninfo);

    // Схема
    void ensureSchema();
    void resetRoutes();
    bool ping();

    // Маршруты
    Route createRoute(const RouteDraft& draft);
    std::vector<Route> getRoutes(long long offset, long long limit, const std::string& flightFilter);
    long long countRoutes(const std::string& flightFilter);
    Route getRouteById(const std::string& routeId);
    Route updateRoute(const std::string& routeId, const RoutePatch& patch);
    bool deleteRoute(const std::string& routeId);

private:
    using Connection = std::unique_ptr<PGconn, decltype(&PQfinish)>;
    using Result = std::unique_ptr<PGresult, decltype(&PQclear)>;

    Connection connect();
    Result exec(
        PGconn* conn,
        const std::string& sql,
        const std::vector<const char*>& params,
        ExecStatusType expected,
        const char* what
    );

    std::string conninfo;
};
