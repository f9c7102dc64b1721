#include "config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

static std::string getenv_or(const char* key, const std::string& def) {
    if (const char* v = std::getenv(key)) return std::string(v);
    return def;
}

static int getenv_int(const char* key, int def) {
    if (const char* v = std::getenv(key)) {
        try {
            size_t used = 0;
            int value = std::stoi(v, &used);
            return used == std::string(v).size() ? value : def;
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

Config loadConfig() {
    Config c;
    c.db_host = getenv_or("DB_HOST", c.db_host);
    c.db_port = getenv_int("DB_PORT", c.db_port);
    c.db_user = getenv_or("DB_USER", c.db_user);
    c.db_password = getenv_or("DB_PASSWORD", c.db_password);
    c.db_name = getenv_or("DB_NAME", c.db_name);
    c.db_connect_timeout = getenv_int("DB_CONNECT_TIMEOUT", c.db_connect_timeout);
    c.db_conninfo = getenv_or("DB_CONNINFO", "");

    c.app_port = getenv_int("APP_PORT", c.app_port);
    c.app_threads = getenv_int("APP_THREADS", c.app_threads);
    c.log_level = parseLogLevel(getenv_or("LOG_LEVEL", "info"), crow::LogLevel::Info);
    return c;
}

std::string Config::conninfo() const {
    if (!db_conninfo.empty()) {
        return db_conninfo;
    }
    return "host=" + quoteConninfoValue(db_host) +
           " port=" + std::to_string(db_port) +
           " user=" + quoteConninfoValue(db_user) +
           " password=" + quoteConninfoValue(db_password) +
           " dbname=" + quoteConninfoValue(db_name) +
           " connect_timeout=" + std::to_string(db_connect_timeout);
}

std::string Config::describe() const {
    if (!db_conninfo.empty()) {
        return "DB_CONNINFO (from environment)";
    }
    return "host=" + db_host + " port=" + std::to_string(db_port) +
           " user=" + db_user + " dbname=" + db_name;
}

crow::LogLevel parseLogLevel(const std::string& name, crow::LogLevel fallback) {
    std::string level = name;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (level == "debug") return crow::LogLevel::Debug;
    if (level == "info") return crow::LogLevel::Info;
    if (level == "warning" || level == "warn") return crow::LogLevel::Warning;
    if (level == "error") return crow::LogLevel::Error;
    if (level == "critical") return crow::LogLevel::Critical;
    return fallback;
}

std::string quoteConninfoValue(const std::string& value) {
    std::string out = "'";
    for (char ch : value) {
        if (ch == '\'' || ch == '\\') out += '\\';
        out += ch;
    }
    out += "'";
    return out;
}
