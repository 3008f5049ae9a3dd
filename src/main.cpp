#include "CommandExecutor.hpp"
#include "CommandLineParser.hpp"
#include "ILedgerDatabase.hpp"
#include "PluginManager.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>

using namespace lotledger;

int main(int argc, char** argv)
{
    try {
        // ═════════════════════════════════════════════════════════════════════
        // Инициализация PluginManager для баз данных
        // ═════════════════════════════════════════════════════════════════════

        const char* pluginPath = std::getenv("LOTLEDGER_PLUGIN_PATH");
        std::string searchPath = pluginPath ? pluginPath : "./plugins";

        auto databasePluginManager = std::make_shared<DatabasePluginManager>(searchPath);

        auto parser = std::make_shared<CommandLineParser>(databasePluginManager);

        auto parseResult = parser->parse(argc, argv);

        if (!parseResult) {
            std::cerr << "Parse error: " << parseResult.error() << std::endl;
            return 1;
        }

        const auto& cmd = parseResult.value();

        // Executor объявлен после менеджера: экземпляр плагина
        // уничтожается до закрытия библиотек
        CommandExecutor executor(databasePluginManager);
        executor.setCommandLineParser(parser);

        auto execResult = executor.execute(cmd);

        if (!execResult) {
            std::cerr << "Error: " << execResult.error() << std::endl;
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
}
