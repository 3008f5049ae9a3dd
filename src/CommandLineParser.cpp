#include "CommandLineParser.hpp"
#include <sstream>

namespace lotledger {

CommandLineParser::CommandLineParser(
    std::shared_ptr<DatabasePluginManager> databasePluginManager)
    : databasePluginManager_(std::move(databasePluginManager)) {
}

bool CommandLineParser::isLedgerCommand(std::string_view command) noexcept {
    return command == "acquire" || command == "dispose" || command == "lots" ||
           command == "gains" || command == "edit" || command == "delete" ||
           command == "history" || command == "report";
}

std::string CommandLineParser::findDatabasePlugin(const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--db" && i + 1 < args.size()) {
            return args[i + 1];
        }
        if (args[i].rfind("--db=", 0) == 0) {
            return args[i].substr(5);
        }
    }
    return {};
}

std::expected<ParsedCommand, std::string> CommandLineParser::parse(
    int argc,
    char* argv[]) {

    if (argc < 2) {
        return std::unexpected(
            "No command specified. Use 'lotledger help' for usage information.");
    }

    ParsedCommand result;
    result.command = argv[1];

    // ═════════════════════════════════════════════════════════════════════════
    // help / version: остальные аргументы позиционные
    // ═════════════════════════════════════════════════════════════════════════

    if (result.command == "--help" || result.command == "-h") {
        result.command = "help";
    }
    if (result.command == "--version") {
        result.command = "version";
    }

    if (result.command == "help" || result.command == "version") {
        for (int i = 2; i < argc; ++i) {
            result.positional.push_back(argv[i]);
        }
        return result;
    }

    int startIdx = 2;
    if (result.command == "plugin" && argc > 2 && argv[2][0] != '-') {
        result.subcommand = argv[2];
        startIdx = 3;
    }

    std::vector<std::string> args(argv + startIdx, argv + argc);

    // "<command> --help" -> справка по команде
    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            result.positional.push_back(result.command);
            result.command = "help";
            return result;
        }
    }

    auto desc = optionsFor(result.command);
    if (!desc) {
        std::ostringstream oss;
        oss << "Unknown command: " << result.command;
        return std::unexpected(oss.str());
    }

    try {
        // Опции выбранного плагина хранилища
        if (isLedgerCommand(result.command) && databasePluginManager_) {
            std::string pluginName = findDatabasePlugin(args);
            if (!pluginName.empty()) {
                auto metadata = databasePluginManager_->getPluginCommandLineMetadata(pluginName);
                if (!metadata) {
                    return std::unexpected("Unknown database plugin '" + pluginName +
                                           "': " + metadata.error());
                }
                if (metadata->commandLineOptions) {
                    desc->add(*metadata->commandLineOptions);
                }
            }
        }

        po::store(po::command_line_parser(args).options(*desc).run(), result.options);
        po::notify(result.options);

    } catch (const po::error& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }

    return result;
}

std::optional<po::options_description> CommandLineParser::optionsFor(std::string_view command) {
    if (command == "acquire") return createAcquireOptions();
    if (command == "dispose") return createDisposeOptions();
    if (command == "lots") return createLotsOptions();
    if (command == "gains") return createGainsOptions();
    if (command == "edit") return createEditOptions();
    if (command == "delete") return createDeleteOptions();
    if (command == "history") return createHistoryOptions();
    if (command == "report") return createReportOptions();
    if (command == "plugin") return createPluginOptions();
    return std::nullopt;
}

// ═════════════════════════════════════════════════════════════════════════════
// Общие группы опций
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createDatabaseOptions() {
    po::options_description desc("Storage options");
    desc.add_options()
        ("db", po::value<std::string>(),
         "Database plugin name (e.g., sqlite_db, inmemory_db)")

        ("help,h", "Show help message");
    return desc;
}

po::options_description CommandLineParser::createTaxOptions() {
    po::options_description desc("Tax options");
    desc.add_options()
        ("short-rate", po::value<double>()->default_value(0.20),
         "Short-term capital gains rate")

        ("long-rate", po::value<double>()->default_value(0.10),
         "Long-term capital gains rate")

        ("long-exemption", po::value<double>()->default_value(100000.0),
         "Long-term gains exempt per fiscal year")

        ("fy-start-month", po::value<unsigned>()->default_value(4),
         "First month of the fiscal year (1-12)");
    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Опции команд
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createAcquireOptions() {
    po::options_description desc("Acquire options");
    desc.add_options()
        ("instrument-id,t", po::value<std::string>()->required(),
         "Instrument ID")

        ("quantity,q", po::value<double>()->required(),
         "Quantity acquired")

        ("price,p", po::value<double>()->required(),
         "Unit price")

        ("date,d", po::value<std::string>()->required(),
         "Trade date (YYYY-MM-DD)")

        ("notes", po::value<std::string>()->default_value(""),
         "Free-text notes");

    desc.add(createDatabaseOptions());
    return desc;
}

po::options_description CommandLineParser::createDisposeOptions() {
    po::options_description desc("Dispose options");
    desc.add_options()
        ("instrument-id,t", po::value<std::string>()->required(),
         "Instrument ID")

        ("quantity,q", po::value<double>()->required(),
         "Quantity disposed")

        ("price,p", po::value<double>()->required(),
         "Unit price (already resolved market price)")

        ("date,d", po::value<std::string>()->required(),
         "Trade date (YYYY-MM-DD)")

        ("notes", po::value<std::string>()->default_value(""),
         "Free-text notes");

    desc.add(createTaxOptions());
    desc.add(createDatabaseOptions());
    return desc;
}

po::options_description CommandLineParser::createLotsOptions() {
    po::options_description desc("Lots options");
    desc.add_options()
        ("instrument-id,t", po::value<std::string>()->required(),
         "Instrument ID")

        ("all", po::bool_switch()->default_value(false),
         "Include fully consumed lots");

    desc.add(createDatabaseOptions());
    return desc;
}

po::options_description CommandLineParser::createGainsOptions() {
    po::options_description desc("Gains options");
    desc.add_options()
        ("instrument-id,t", po::value<std::string>(),
         "Instrument ID (all instruments if omitted)");

    desc.add(createDatabaseOptions());
    return desc;
}

po::options_description CommandLineParser::createEditOptions() {
    po::options_description desc("Edit options");
    desc.add_options()
        ("id", po::value<RecordId>()->required(),
         "Transaction ID")

        ("date,d", po::value<std::string>(),
         "New trade date (YYYY-MM-DD)")

        ("quantity,q", po::value<double>(),
         "New quantity")

        ("price,p", po::value<double>(),
         "New unit price")

        ("type", po::value<std::string>(),
         "New type (acquisition or disposal)")

        ("instrument", po::value<std::string>(),
         "New instrument ID")

        ("notes", po::value<std::string>(),
         "New notes")

        ("dry-run", po::bool_switch()->default_value(false),
         "Validate only, do not commit");

    desc.add(createDatabaseOptions());
    return desc;
}

po::options_description CommandLineParser::createDeleteOptions() {
    po::options_description desc("Delete options");
    desc.add_options()
        ("id", po::value<RecordId>()->required(),
         "Transaction ID");

    desc.add(createDatabaseOptions());
    return desc;
}

po::options_description CommandLineParser::createHistoryOptions() {
    po::options_description desc("History options");
    desc.add_options()
        ("id", po::value<RecordId>()->required(),
         "Transaction ID");

    desc.add(createDatabaseOptions());
    return desc;
}

po::options_description CommandLineParser::createReportOptions() {
    po::options_description desc("Report options");
    desc.add_options()
        ("fy", po::value<int>()->required(),
         "Fiscal year by its starting calendar year (2024 = FY 2024-25)")

        ("instrument-id,t", po::value<std::string>(),
         "Restrict the report to one instrument");

    desc.add(createTaxOptions());
    desc.add(createDatabaseOptions());
    return desc;
}

po::options_description CommandLineParser::createPluginOptions() {
    po::options_description desc("Plugin options");
    desc.add_options()
        ("help,h", "Show help message");
    return desc;
}

}  // namespace lotledger
