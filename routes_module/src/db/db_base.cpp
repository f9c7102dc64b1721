#include "db.h"

DbError::DbError(const std::string& message, std::string sqlstate, std::string constraint)
    : std::runtime_error(message), sqlstate(std::move(sqlstate)), constraint(std::move(constraint)) {}

// Конструктор. Соединение открывается на каждый запрос отдельно
DB::DB(const std::string& conninfo) : conninfo(conninfo) {}

// Новое соединение с базой данных
DB::Connection DB::connect() {
    Connection conn(PQconnectdb(conninfo.c_str()), &PQfinish);

    if (!conn) {
        throw DbError("DB connection error: out of memory", "08000");
    }
    if (PQstatus(conn.get()) != CONNECTION_OK) {
        std::string message = PQerrorMessage(conn.get());
        CROW_LOG_ERROR << "DB connection error: " << message;
        throw DbError("DB connection error: " + message, "08006");
    }
    return conn;
}

// Выполнение параметризованного запроса
DB::Result DB::exec(
    PGconn* conn,
    const std::string& sql,
    const std::vector<const char*>& params,
    ExecStatusType expected,
    const char* what
) {
    Result res(
        PQexecParams(
            conn,
            sql.c_str(),
            static_cast<int>(params.size()), nullptr, params.data(), nullptr, nullptr, 0
        ),
        &PQclear
    );

    if (!res || PQresultStatus(res.get()) != expected) {
        std::string message = PQerrorMessage(conn);
        const char* state = res ? PQresultErrorField(res.get(), PG_DIAG_SQLSTATE) : nullptr;
        const char* constraint = res ? PQresultErrorField(res.get(), PG_DIAG_CONSTRAINT_NAME) : nullptr;
        CROW_LOG_ERROR << what << " failed: " << message;
        throw DbError(std::string(what) + " failed: " + message, state ? state : "", constraint ? constraint : "");
    }
    return res;
}

// Создание таблицы маршрутов, если её нет
void DB::ensureSchema() {
    auto conn = connect();

    const char* sql =
        "CREATE TABLE IF NOT EXISTS routes ("
        "  id UUID PRIMARY KEY DEFAULT gen_random_uuid(),"
        "  flight_id TEXT UNIQUE,"
        "  origin TEXT NOT NULL,"
        "  destination TEXT NOT NULL,"
        "  departure_date TIMESTAMPTZ NOT NULL,"
        "  arrival_date TIMESTAMPTZ NOT NULL,"
        "  capacity INTEGER NOT NULL CONSTRAINT routes_capacity_positive CHECK (capacity > 0),"
        "  description TEXT NOT NULL DEFAULT '',"
        "  created_at TIMESTAMPTZ NOT NULL DEFAULT clock_timestamp(),"
        "  seq BIGINT GENERATED ALWAYS AS IDENTITY,"
        "  CONSTRAINT routes_schedule_order CHECK (departure_date < arrival_date)"
        ")";
    exec(conn.get(), sql, {}, PGRES_COMMAND_OK, "Create routes table");

    // Таблицы, созданные до появления seq
    exec(conn.get(),
         "ALTER TABLE routes ADD COLUMN IF NOT EXISTS seq BIGINT GENERATED ALWAYS AS IDENTITY",
         {}, PGRES_COMMAND_OK, "Add routes seq column");
    exec(conn.get(),
         "ALTER TABLE routes ALTER COLUMN created_at SET DEFAULT clock_timestamp()",
         {}, PGRES_COMMAND_OK, "Set routes created_at default");

    exec(conn.get(),
         "CREATE INDEX IF NOT EXISTS routes_created_order_idx ON routes (created_at DESC, seq DESC)",
         {}, PGRES_COMMAND_OK, "Create routes index");
}

// Очистка таблицы (только для разработки)
void DB::resetRoutes() {
    ensureSchema();
    auto conn = connect();
    exec(conn.get(), "TRUNCATE TABLE routes RESTART IDENTITY CASCADE", {}, PGRES_COMMAND_OK, "Truncate routes");
    CROW_LOG_WARNING << "Routes table truncated";
}

// Проверка доступности базы
bool DB::ping() {
    try {
        auto conn = connect();
        exec(conn.get(), "SELECT 1", {}, PGRES_TUPLES_OK, "Ping");
        return true;
    } catch (const DbError&) {
        return false;
    }
}
