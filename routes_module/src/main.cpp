#include "crow.h"
#include "config/config.h"
#include "db/db.h"
#include "handlers/base_handler.h"
#include <iostream>

int main() {
    Config config = loadConfig();
    crow::logger::setLogLevel(config.log_level);

    DB db(config.conninfo());
    CROW_LOG_INFO << "Database: " << config.describe();

    // Таблица создаётся при старте, если её ещё нет
    try {
        db.ensureSchema();
    } catch (const DbError& e) {
        std::cerr << "CRITICAL ERROR: cannot prepare database schema: " << e.what() << std::endl;
        return 1;
    }

    crow::SimpleApp app;
    registerRoutes(app, db);

    app.port(config.app_port);
    if (config.app_threads > 0) {
        app.concurrency(config.app_threads).run();
    } else {
        app.multithreaded().run();
    }
}
