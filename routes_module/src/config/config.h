#pragma once
#include "crow.h"
#include <string>

// Настройки сервиса из переменных окружения
struct Config {
    std::string db_host = "routes-db-service";
    int db_port = 5432;
    std::string db_user = "postgres";
    std::string db_password = "postgres";
    std::string db_name = "routes_db";
    int db_connect_timeout = 5;
    std::string db_conninfo;

    int app_port = 8000;
    int app_threads = 0;
    crow::LogLevel log_level = crow::LogLevel::Info;

    // Строка подключения libpq. DB_CONNINFO имеет приоритет над DB_*
    std::string conninfo() const;
    // То же без пароля, для логов
    std::string describe() const;
};

Config loadConfig();

crow::LogLevel parseLogLevel(const std::string& name, crow::LogLevel fallback);

// Значение в кавычках по правилам libpq: 'a\'b'
std::string quoteConninfoValue(const std::string& value);
