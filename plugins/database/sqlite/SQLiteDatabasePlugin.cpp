#include "SQLiteDatabase.hpp"
#include <iostream>
#include <boost/program_options.hpp>

#ifdef _WIN32
#define PLUGIN_API __declspec(dllexport)
#else
#define PLUGIN_API __attribute__((visibility("default")))
#endif

namespace po = boost::program_options;

extern "C" {

// ═══════════════════════════════════════════════════════════════════════════════
// Command Line Options Metadata
// ═══════════════════════════════════════════════════════════════════════════════

// Возвращает указатель на статически размещенный options_description
// Вызывающая сторона НЕ должна удалять возвращенный указатель
PLUGIN_API const po::options_description* getCommandLineOptions() {
    static po::options_description* sqliteOptions = nullptr;

    if (!sqliteOptions) {
        sqliteOptions = new po::options_description("SQLite Database Options");
        sqliteOptions->add_options()
            ("sqlite-path", po::value<std::string>()->required(),
             "Path to SQLite ledger file. "
             "File will be created if it doesn't exist. "
             "Example: --sqlite-path ./ledger.db");
    }

    return sqliteOptions;
}

PLUGIN_API const char* getPluginDescription() {
    return "Persistent ledger in a SQLite file with transactional writes "
           "and foreign-key protected realized gains";
}

// Примеры разделены '\n'
PLUGIN_API const char* getPluginExamples() {
    return
        "# Record an acquisition in a new ledger file:\n"
        "lotledger acquire -t INFY -q 10 -p 1450 -d 2024-01-15 "
        "--db sqlite_db --sqlite-path ./ledger.db\n"
        "\n"
        "# Dispose with FIFO matching:\n"
        "lotledger dispose -t INFY -q 4 -p 1600 -d 2024-06-01 "
        "--db sqlite_db --sqlite-path ./ledger.db\n"
        "\n"
        "# Fiscal year report:\n"
        "lotledger report --fy 2024 --db sqlite_db --sqlite-path ./ledger.db";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Creation Functions
// ═══════════════════════════════════════════════════════════════════════════════

PLUGIN_API lotledger::ILedgerDatabase* createDatabase(const char* config) {
    try {
        // Пустой config: база инициализируется через initializeFromOptions()
        if (!config || std::string(config).empty()) {
            return new lotledger::SQLiteDatabase("");
        }
        return new lotledger::SQLiteDatabase(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create SQLiteDatabase: " << e.what() << std::endl;
        return nullptr;
    }
}

PLUGIN_API void destroyDatabase(lotledger::ILedgerDatabase* db) {
    delete db;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Metadata Functions
// ═══════════════════════════════════════════════════════════════════════════════

PLUGIN_API const char* getPluginName() {
    return "SQLiteDatabase";
}

PLUGIN_API const char* getPluginVersion() {
    return "1.0.0";
}

PLUGIN_API const char* getPluginType() {
    return "database";
}

// Системное имя плагина (используется в --db)
PLUGIN_API const char* getPluginSystemName() {
    return "sqlite_db";
}

}  // extern "C"
