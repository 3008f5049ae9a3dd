#pragma once

#include "AuditLogger.hpp"
#include "CapitalGainsReport.hpp"
#include "CommandLineParser.hpp"
#include "DisposalOrchestrator.hpp"
#include "EditValidator.hpp"
#include "ILedgerDatabase.hpp"
#include "PluginManager.hpp"
#include "TransactionEditor.hpp"
#include <expected>
#include <iostream>
#include <memory>
#include <sstream>

namespace lotledger {

class CommandExecutor {
public:
    explicit CommandExecutor(
        std::shared_ptr<DatabasePluginManager> databasePluginManager = nullptr);

    // Готовое хранилище: --db не требуется (тесты, встраивание)
    explicit CommandExecutor(std::shared_ptr<ILedgerDatabase> database);

    ~CommandExecutor();

    Result execute(const ParsedCommand& cmd);

    // Загружает плагин --db и передает ему опции командной строки.
    // Ничего не делает, если хранилище уже есть.
    Result ensureDatabase(const ParsedCommand& cmd);

    void setCommandLineParser(std::shared_ptr<CommandLineParser> parser) noexcept {
        parser_ = std::move(parser);
    }

private:
    std::shared_ptr<ILedgerDatabase> database_;
    std::shared_ptr<DatabasePluginManager> databasePluginManager_;
    std::shared_ptr<CommandLineParser> parser_;

    // Help & Version
    Result executeHelp(const ParsedCommand& cmd);
    Result executeVersion(const ParsedCommand& cmd);
    void printHelp() const;
    void printCommandHelp(std::string_view command);
    void printVersion() const;

    // Ledger
    Result executeAcquire(const ParsedCommand& cmd);
    Result executeDispose(const ParsedCommand& cmd);
    Result executeLots(const ParsedCommand& cmd);
    Result executeGains(const ParsedCommand& cmd);

    // Edit & Audit
    Result executeEdit(const ParsedCommand& cmd);
    Result executeDelete(const ParsedCommand& cmd);
    Result executeHistory(const ParsedCommand& cmd);

    // Reports
    Result executeReport(const ParsedCommand& cmd);

    // Plugin Management
    Result executePlugin(const ParsedCommand& cmd);
    Result executePluginList(const ParsedCommand& cmd);

    // Utility methods
    template<typename T>
    std::expected<T, std::string> getRequiredOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;

    std::expected<Date, std::string> getDateOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;

    static TaxSettings taxSettingsFrom(const ParsedCommand& cmd);
    std::expected<EditRequest, std::string> editRequestFrom(const ParsedCommand& cmd) const;

    void printTransaction(const TransactionRecord& record) const;
    void printGains(const std::vector<RealizedGain>& gains) const;
    void printDisposalResult(const DisposalResult& result) const;
    void printRejection(const EditRejection& rejection) const;
    void printReport(const CapitalGainsReport& report) const;
};

// Template implementation
template<typename T>
std::expected<T, std::string> CommandExecutor::getRequiredOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const {

    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return std::unexpected(
            "Required option '" + optName + "' is missing");
    }

    try {
        return cmd.options.at(optName).as<T>();
    } catch (const std::exception& e) {
        return std::unexpected(
            "Invalid value for option '" + optName + "': " + e.what());
    }
}

}  // namespace lotledger
