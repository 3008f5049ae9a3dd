#pragma once

#include <boost/program_options.hpp>
#include <expected>
#include <memory>
#include <string>
#include <vector>
#include "ILedgerDatabase.hpp"
#include "PluginManager.hpp"

namespace po = boost::program_options;

namespace lotledger {

struct ParsedCommand {
    std::string command;
    std::string subcommand;
    po::variables_map options;
    std::vector<std::string> positional;
};

class CommandLineParser {
public:
    explicit CommandLineParser(
        std::shared_ptr<DatabasePluginManager> databasePluginManager = nullptr);

    std::expected<ParsedCommand, std::string> parse(int argc, char* argv[]);

    // Базовые описания опций (без опций плагинов)
    po::options_description createAcquireOptions();
    po::options_description createDisposeOptions();
    po::options_description createLotsOptions();
    po::options_description createGainsOptions();
    po::options_description createEditOptions();
    po::options_description createDeleteOptions();
    po::options_description createHistoryOptions();
    po::options_description createReportOptions();
    po::options_description createPluginOptions();

    // Описание опций команды; nullopt для неизвестной команды
    std::optional<po::options_description> optionsFor(std::string_view command);

    static bool isLedgerCommand(std::string_view command) noexcept;

private:
    std::shared_ptr<DatabasePluginManager> databasePluginManager_;

    po::options_description createDatabaseOptions();
    po::options_description createTaxOptions();

    // Значение --db до разбора (нужно, чтобы подключить опции плагина)
    static std::string findDatabasePlugin(const std::vector<std::string>& args);
};

}  // namespace lotledger
