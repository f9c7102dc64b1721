#pragma once
#include "crow.h"
#include <string>
#include <vector>
#include "route.h"

// Ошибка валидации конкретного поля
struct FieldError {
    std::string field;
    std::string message;
};

constexpr long long kDefaultPageLimit = 100;

// Параметры постраничной выдачи
struct Paging {
    long long offset = 0;
    long long limit = kDefaultPageLimit;
    std::string flight;
};

// Разбор тела POST /routes. Возвращает все найденные ошибки
std::vector<FieldError> parseRouteDraft(const crow::json::rvalue& body, RouteDraft& draft);

// Разбор тела PATCH/PUT /routes/<id>. Проверяет только переданные поля,
// null у flight_id и description очищает их
std::vector<FieldError> parseRoutePatch(const crow::json::rvalue& body, RoutePatch& patch);

// Применение частичного обновления к текущей записи
Route applyPatch(const Route& current, const RoutePatch& patch);

// Проверка инвариантов итоговой записи (вместимость и порядок дат)
std::vector<FieldError> validateRoute(const Route& route);

// Разбор offset/skip, limit и flight из строки запроса
std::vector<FieldError> parsePaging(const crow::query_string& params, Paging& paging);

// Проверка формата идентификатора (UUID 8-4-4-4-12)
bool isRouteId(const std::string& id);

crow::json::wvalue fieldErrorsToJson(const std::vector<FieldError>& errors);
