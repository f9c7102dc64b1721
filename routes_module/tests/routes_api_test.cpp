// Сквозные тесты HTTP-обработчиков. Нужна живая база PostgreSQL:
//   ROUTES_TEST_DB_CONNINFO="host=localhost user=postgres password=postgres dbname=routes_test"
// Без переменной тесты пропускаются. Таблица routes очищается перед каждым тестом.

#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include "db/db.h"
#include "handlers/base_handler.h"

static const char* kValidRoute = R"({
    "origin": "A",
    "destination": "B",
    "departure_date": "2025-01-01T00:00Z",
    "arrival_date": "2025-01-02T00:00Z",
    "capacity": 10
})";

class RoutesApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* conninfo = std::getenv("ROUTES_TEST_DB_CONNINFO");
        if (!conninfo) {
            GTEST_SKIP() << "ROUTES_TEST_DB_CONNINFO is not set";
        }
        db = std::make_unique<DB>(conninfo);
        registerRoutes(app, *db);
        app.validate();

        ASSERT_EQ(call(crow::HTTPMethod::Post, "/reset").code, 200);
    }

    crow::response call(crow::HTTPMethod method, const std::string& url, const std::string& body = "") {
        crow::request req;
        req.method = method;
        req.raw_url = url;
        req.url = url.substr(0, url.find('?'));
        req.url_params = crow::query_string(url);
        req.body = body;

        crow::response res;
        app.handle_full(req, res);
        return res;
    }

    // Создаёт маршрут и возвращает его id
    std::string create(const std::string& body = kValidRoute) {
        auto res = call(crow::HTTPMethod::Post, "/routes", body);
        EXPECT_EQ(res.code, 201) << res.body;
        auto json = crow::json::load(res.body);
        return json ? std::string(json["id"].s()) : "";
    }

    static std::string routeWith(const std::string& destination, const std::string& flightId = "") {
        std::string flight = flightId.empty() ? "" : "\"flight_id\": \"" + flightId + "\", ";
        return "{" + flight +
               "\"origin\": \"A\", \"destination\": \"" + destination + "\", "
               "\"departure_date\": \"2025-01-01T00:00Z\", \"arrival_date\": \"2025-01-02T00:00Z\", "
               "\"capacity\": 10}";
    }

    std::unique_ptr<DB> db;
    crow::SimpleApp app;
};

TEST_F(RoutesApiTest, PingEndpoints) {
    auto ping = call(crow::HTTPMethod::Get, "/ping");
    EXPECT_EQ(ping.code, 200);
    EXPECT_EQ(std::string(crow::json::load(ping.body)["status"].s()), "pong");

    auto routesPing = call(crow::HTTPMethod::Get, "/routes/ping");
    EXPECT_EQ(routesPing.code, 200);
    EXPECT_EQ(std::string(crow::json::load(routesPing.body)["status"].s()), "ok");
}

TEST_F(RoutesApiTest, DatabaseHealth) {
    EXPECT_EQ(call(crow::HTTPMethod::Get, "/health/db").code, 200);
}

TEST_F(RoutesApiTest, CreateThenGetReturnsSameFields) {
    auto created = call(crow::HTTPMethod::Post, "/routes", kValidRoute);
    ASSERT_EQ(created.code, 201) << created.body;

    auto body = crow::json::load(created.body);
    ASSERT_TRUE(body);
    std::string id = body["id"].s();
    EXPECT_TRUE(isRouteId(id));
    EXPECT_TRUE(body.has("created_at"));

    auto fetched = call(crow::HTTPMethod::Get, "/routes/" + id);
    ASSERT_EQ(fetched.code, 200);
    auto route = crow::json::load(fetched.body);
    EXPECT_EQ(std::string(route["id"].s()), id);
    EXPECT_EQ(std::string(route["origin"].s()), "A");
    EXPECT_EQ(std::string(route["destination"].s()), "B");
    EXPECT_EQ(std::string(route["departure_date"].s()), "2025-01-01T00:00:00Z");
    EXPECT_EQ(std::string(route["arrival_date"].s()), "2025-01-02T00:00:00Z");
    EXPECT_EQ(route["capacity"].i(), 10);
    EXPECT_EQ(std::string(route["description"].s()), "");
    EXPECT_EQ(std::string(route["created_at"].s()), std::string(body["created_at"].s()));
}

TEST_F(RoutesApiTest, CreateRejectsZeroCapacity) {
    auto res = call(crow::HTTPMethod::Post, "/routes", R"({
        "origin": "A", "destination": "B",
        "departure_date": "2025-01-01T00:00Z", "arrival_date": "2025-01-02T00:00Z",
        "capacity": 0
    })");

    EXPECT_EQ(res.code, 422);
    auto body = crow::json::load(res.body);
    ASSERT_TRUE(body);
    ASSERT_EQ(body["detail"].size(), 1u);
    EXPECT_EQ(std::string(body["detail"][0]["field"].s()), "capacity");
    EXPECT_EQ(call(crow::HTTPMethod::Get, "/routes/count").body, R"({"count":0})");
}

TEST_F(RoutesApiTest, CreateRejectsDepartureNotBeforeArrival) {
    auto res = call(crow::HTTPMethod::Post, "/routes", R"({
        "origin": "A", "destination": "B",
        "departure_date": "2025-01-02T00:00Z", "arrival_date": "2025-01-02T00:00Z",
        "capacity": 10
    })");

    EXPECT_EQ(res.code, 422);
}

TEST_F(RoutesApiTest, CreateRejectsMissingFieldsAndBadJson) {
    EXPECT_EQ(call(crow::HTTPMethod::Post, "/routes", R"({"origin": "A"})").code, 422);
    EXPECT_EQ(call(crow::HTTPMethod::Post, "/routes", "{not json").code, 400);
    EXPECT_EQ(call(crow::HTTPMethod::Post, "/routes", "[1, 2]").code, 400);
}

TEST_F(RoutesApiTest, DuplicateFlightIdConflicts) {
    create(routeWith("B", "AV123"));

    auto res = call(crow::HTTPMethod::Post, "/routes", routeWith("C", "AV123"));
    EXPECT_EQ(res.code, 409);
}

TEST_F(RoutesApiTest, GetUnknownAndMalformedIds) {
    EXPECT_EQ(call(crow::HTTPMethod::Get, "/routes/6f1c1f0e-9a4b-4c1e-8d3a-2b7e5f0a9c11").code, 404);
    EXPECT_EQ(call(crow::HTTPMethod::Get, "/routes/not-a-uuid").code, 400);
}

TEST_F(RoutesApiTest, ListEmpty) {
    auto res = call(crow::HTTPMethod::Get, "/routes");

    ASSERT_EQ(res.code, 200);
    auto body = crow::json::load(res.body);
    EXPECT_EQ(body["routes"].size(), 0u);
    EXPECT_EQ(body["total"].i(), 0);
}

TEST_F(RoutesApiTest, ListNewestFirstWithPagination) {
    for (int i = 0; i < 5; i++) {
        create(routeWith("City " + std::to_string(i)));
    }

    auto all = crow::json::load(call(crow::HTTPMethod::Get, "/routes").body);
    ASSERT_EQ(all["routes"].size(), 5u);
    EXPECT_EQ(std::string(all["routes"][0]["destination"].s()), "City 4");
    EXPECT_EQ(std::string(all["routes"][4]["destination"].s()), "City 0");

    auto page = call(crow::HTTPMethod::Get, "/routes?offset=2&limit=2");
    ASSERT_EQ(page.code, 200);
    auto body = crow::json::load(page.body);
    ASSERT_EQ(body["routes"].size(), 2u);
    EXPECT_EQ(body["total"].i(), 2);
    EXPECT_EQ(std::string(body["routes"][0]["destination"].s()), "City 2");

    auto skipped = crow::json::load(call(crow::HTTPMethod::Get, "/routes?skip=4").body);
    EXPECT_EQ(skipped["routes"].size(), 1u);

    EXPECT_EQ(call(crow::HTTPMethod::Get, "/routes?limit=-3").code, 422);
}

TEST_F(RoutesApiTest, ListOrderFollowsInsertionForBursts) {
    std::vector<std::string> ids;
    for (int i = 0; i < 20; i++) {
        ids.push_back(create(routeWith("City " + std::to_string(i))));
    }

    for (int attempt = 0; attempt < 3; attempt++) {
        auto list = crow::json::load(call(crow::HTTPMethod::Get, "/routes?limit=20").body);
        ASSERT_EQ(list["routes"].size(), 20u);
        for (size_t i = 0; i < ids.size(); i++) {
            EXPECT_EQ(std::string(list["routes"][i]["id"].s()), ids[ids.size() - 1 - i]);
        }
    }
}

TEST_F(RoutesApiTest, ListAndCountFilterByFlight) {
    create(routeWith("B", "AV1"));
    create(routeWith("C", "AV2"));
    create(routeWith("D"));

    auto filtered = crow::json::load(call(crow::HTTPMethod::Get, "/routes?flight=AV2").body);
    ASSERT_EQ(filtered["routes"].size(), 1u);
    EXPECT_EQ(std::string(filtered["routes"][0]["destination"].s()), "C");
    EXPECT_EQ(std::string(filtered["routes"][0]["flight_id"].s()), "AV2");

    auto none = crow::json::load(call(crow::HTTPMethod::Get, "/routes?flight=AV9").body);
    EXPECT_EQ(none["routes"].size(), 0u);
    EXPECT_EQ(call(crow::HTTPMethod::Get, "/routes/count?flight=AV1").body, R"({"count":1})");
}

TEST_F(RoutesApiTest, CountMatchesFullList) {
    for (int i = 0; i < 3; i++) {
        create(routeWith("City " + std::to_string(i)));
    }

    auto count = crow::json::load(call(crow::HTTPMethod::Get, "/routes/count").body);
    long long total = count["count"].i();
    EXPECT_EQ(total, 3);

    auto list = crow::json::load(call(crow::HTTPMethod::Get, "/routes?limit=" + std::to_string(total)).body);
    EXPECT_EQ(static_cast<long long>(list["routes"].size()), total);
}

TEST_F(RoutesApiTest, LimitAboveDefaultIsNotCapped) {
    for (int i = 0; i < 3; i++) {
        create(routeWith("City " + std::to_string(i)));
    }

    auto res = call(crow::HTTPMethod::Get, "/routes?limit=5000");
    ASSERT_EQ(res.code, 200);
    auto body = crow::json::load(res.body);
    EXPECT_EQ(body["limit"].i(), 5000);
    EXPECT_EQ(body["routes"].size(), 3u);
}

TEST_F(RoutesApiTest, PatchChangesOnlyGivenFields) {
    std::string id = create();

    auto res = call(crow::HTTPMethod::Patch, "/routes/" + id, R"({"origin": "Cali", "capacity": 6})");
    ASSERT_EQ(res.code, 200) << res.body;

    auto route = crow::json::load(call(crow::HTTPMethod::Get, "/routes/" + id).body);
    EXPECT_EQ(std::string(route["origin"].s()), "Cali");
    EXPECT_EQ(route["capacity"].i(), 6);
    EXPECT_EQ(std::string(route["destination"].s()), "B");
    EXPECT_EQ(std::string(route["departure_date"].s()), "2025-01-01T00:00:00Z");
    EXPECT_EQ(std::string(route["arrival_date"].s()), "2025-01-02T00:00:00Z");
}

TEST_F(RoutesApiTest, PutBehavesLikePatch) {
    std::string id = create();

    auto res = call(crow::HTTPMethod::Put, "/routes/" + id, R"({"description": "night trip"})");
    ASSERT_EQ(res.code, 200) << res.body;

    auto route = crow::json::load(res.body);
    EXPECT_EQ(std::string(route["description"].s()), "night trip");
    EXPECT_EQ(std::string(route["origin"].s()), "A");
}

TEST_F(RoutesApiTest, PatchRevalidatesMergedDates) {
    std::string id = create();

    auto res = call(crow::HTTPMethod::Patch, "/routes/" + id, R"({"departure_date": "2025-01-03T00:00Z"})");
    EXPECT_EQ(res.code, 422);

    auto route = crow::json::load(call(crow::HTTPMethod::Get, "/routes/" + id).body);
    EXPECT_EQ(std::string(route["departure_date"].s()), "2025-01-01T00:00:00Z");
}

TEST_F(RoutesApiTest, UpdateKeepsConcurrentChangesToOtherFields) {
    std::string id = create();

    // Патчи по разным полям не перетирают друг друга
    RoutePatch capacityPatch;
    capacityPatch.capacity = 42;
    RoutePatch originPatch;
    originPatch.origin = std::string("Cali");

    db->updateRoute(id, capacityPatch);
    auto updated = db->updateRoute(id, originPatch);

    EXPECT_EQ(updated.capacity, 42);
    EXPECT_EQ(updated.origin, "Cali");
    EXPECT_EQ(updated.destination, "B");
}

TEST_F(RoutesApiTest, UpdateRejectedByScheduleConstraint) {
    std::string id = create();

    RoutePatch patch;
    patch.departure_date = timestampFromMicros(1735776000LL * 1000000 + 3600LL * 1000000);
    try {
        db->updateRoute(id, patch);
        FAIL() << "update with departure after arrival must fail";
    } catch (const DbError& e) {
        EXPECT_TRUE(e.isCheckViolation());
        EXPECT_EQ(e.constraintName(), "routes_schedule_order");

        auto res = dbFailed(e);
        EXPECT_EQ(res.code, 422);
        EXPECT_EQ(std::string(crow::json::load(res.body)["detail"][0]["field"].s()), "arrival_date");
    }

    auto route = crow::json::load(call(crow::HTTPMethod::Get, "/routes/" + id).body);
    EXPECT_EQ(std::string(route["departure_date"].s()), "2025-01-01T00:00:00Z");
}

TEST_F(RoutesApiTest, UpdateUnknownIdReturnsEmptyRoute) {
    RoutePatch patch;
    patch.origin = std::string("X");

    EXPECT_TRUE(db->updateRoute("6f1c1f0e-9a4b-4c1e-8d3a-2b7e5f0a9c11", patch).id.empty());
}

TEST_F(RoutesApiTest, PatchNullClearsFlightIdAndDescription) {
    std::string id = create(R"({
        "flight_id": "AV77", "origin": "A", "destination": "B",
        "departure_date": "2025-01-01T00:00Z", "arrival_date": "2025-01-02T00:00Z",
        "capacity": 10, "description": "night trip"
    })");

    auto res = call(crow::HTTPMethod::Patch, "/routes/" + id, R"({"flight_id": null, "description": null})");
    ASSERT_EQ(res.code, 200) << res.body;

    auto route = crow::json::load(call(crow::HTTPMethod::Get, "/routes/" + id).body);
    EXPECT_EQ(route["flight_id"].t(), crow::json::type::Null);
    EXPECT_EQ(std::string(route["description"].s()), "");
    EXPECT_EQ(std::string(route["origin"].s()), "A");

    // Освобождённый номер рейса можно занять снова
    create(routeWith("C", "AV77"));
}

TEST_F(RoutesApiTest, PatchErrors) {
    std::string id = create();

    EXPECT_EQ(call(crow::HTTPMethod::Patch, "/routes/" + id, "{}").code, 400);
    EXPECT_EQ(call(crow::HTTPMethod::Patch, "/routes/" + id, R"({"capacity": 0})").code, 422);
    EXPECT_EQ(call(crow::HTTPMethod::Patch, "/routes/6f1c1f0e-9a4b-4c1e-8d3a-2b7e5f0a9c11", R"({"origin": "X"})").code, 404);
    EXPECT_EQ(call(crow::HTTPMethod::Patch, "/routes/nope", R"({"origin": "X"})").code, 400);
}

TEST_F(RoutesApiTest, DeleteThenGetIsNotFound) {
    std::string id = create();

    auto res = call(crow::HTTPMethod::Delete, "/routes/" + id);
    EXPECT_EQ(res.code, 204);
    EXPECT_TRUE(res.body.empty());

    EXPECT_EQ(call(crow::HTTPMethod::Get, "/routes/" + id).code, 404);
    EXPECT_EQ(call(crow::HTTPMethod::Delete, "/routes/" + id).code, 404);
}

TEST_F(RoutesApiTest, ResetClearsTable) {
    create();
    create(routeWith("C"));

    auto res = call(crow::HTTPMethod::Post, "/routes/reset");
    EXPECT_EQ(res.code, 200);
    EXPECT_EQ(std::string(crow::json::load(res.body)["status"].s()), "ok");
    EXPECT_EQ(call(crow::HTTPMethod::Get, "/routes/count").body, R"({"count":0})");
}
