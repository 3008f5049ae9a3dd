#include "InMemoryDatabase.hpp"
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

// InMemory база не имеет опций, но функция нужна для единообразия
PLUGIN_API const po::options_description* getCommandLineOptions() {
    static po::options_description inmemoryOptions("In-Memory Database Options");
    return &inmemoryOptions;
}

PLUGIN_API const char* getPluginDescription() {
    return "Volatile in-memory ledger for trying out commands and for tests. "
           "Every process starts with an empty ledger.";
}

PLUGIN_API const char* getPluginExamples() {
    return
        "# Record a lot and dispose part of it in one session-less run:\n"
        "lotledger acquire -t INFY -q 10 -p 100 -d 2024-01-01 --db inmemory_db\n"
        "\n"
        "# Inspect lots (always empty in a fresh process):\n"
        "lotledger lots -t INFY --db inmemory_db";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Creation Functions
// ═══════════════════════════════════════════════════════════════════════════════

PLUGIN_API lotledger::ILedgerDatabase* createDatabase(const char* /* config */) {
    try {
        return new lotledger::InMemoryDatabase();
    } catch (const std::exception& e) {
        std::cerr << "Failed to create InMemoryDatabase: " << e.what() << std::endl;
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
    return "InMemoryDatabase";
}

PLUGIN_API const char* getPluginVersion() {
    return "1.0.0";
}

PLUGIN_API const char* getPluginType() {
    return "database";
}

// Системное имя плагина (используется в --db)
PLUGIN_API const char* getPluginSystemName() {
    return "inmemory_db";
}

}  // extern "C"
