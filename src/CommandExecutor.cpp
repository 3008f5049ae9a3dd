#include "CommandExecutor.hpp"
#include "LotLedger.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace lotledger {

namespace {

constexpr const char* kVersion = "1.0.0";

std::string fieldLabel(std::string_view text, std::size_t width = 22)
{
    std::string label(text);
    if (label.size() < width) {
        label.append(width - label.size(), ' ');
    }
    return label;
}

}  // namespace

CommandExecutor::CommandExecutor(std::shared_ptr<DatabasePluginManager> databasePluginManager)
    : databasePluginManager_(std::move(databasePluginManager))
{
}

CommandExecutor::CommandExecutor(std::shared_ptr<ILedgerDatabase> database)
    : database_(std::move(database))
{
}

CommandExecutor::~CommandExecutor()
{
    // Экземпляр плагина уничтожается раньше, чем менеджер закроет библиотеку
    database_.reset();
}

Result CommandExecutor::execute(const ParsedCommand& cmd)
{
    if (cmd.command == "help") {
        return executeHelp(cmd);
    }
    if (cmd.command == "version") {
        return executeVersion(cmd);
    }
    if (cmd.command == "acquire") {
        return executeAcquire(cmd);
    }
    if (cmd.command == "dispose") {
        return executeDispose(cmd);
    }
    if (cmd.command == "lots") {
        return executeLots(cmd);
    }
    if (cmd.command == "gains") {
        return executeGains(cmd);
    }
    if (cmd.command == "edit") {
        return executeEdit(cmd);
    }
    if (cmd.command == "delete") {
        return executeDelete(cmd);
    }
    if (cmd.command == "history") {
        return executeHistory(cmd);
    }
    if (cmd.command == "report") {
        return executeReport(cmd);
    }
    if (cmd.command == "plugin") {
        return executePlugin(cmd);
    }

    return std::unexpected("Unknown command: " + cmd.command);
}

// ═════════════════════════════════════════════════════════════════════════════
// Database
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::ensureDatabase(const ParsedCommand& cmd)
{
    if (database_) {
        return {};
    }

    if (!cmd.options.count("db")) {
        return std::unexpected(
            "Option '--db' is required (e.g., --db sqlite_db --sqlite-path ./ledger.db)");
    }

    if (!databasePluginManager_) {
        return std::unexpected("Database plugin manager is not configured");
    }

    std::string pluginName = cmd.options.at("db").as<std::string>();

    auto dbResult = databasePluginManager_->load(pluginName);
    if (!dbResult) {
        std::string errorMsg = "Failed to load database plugin '" + pluginName +
                               "': " + dbResult.error();

        auto availablePlugins = databasePluginManager_->scanAvailablePlugins();
        if (!availablePlugins.empty()) {
            errorMsg += "\n\nAvailable database plugins:";
            for (const auto& p : availablePlugins) {
                errorMsg += "\n  - " + p.displayName + " v" + p.version +
                            " (use: --db " + p.systemName + ")";
            }
        } else {
            errorMsg += "\n\nNo database plugins found in: " +
                        databasePluginManager_->getPluginPath();
            errorMsg += "\nPlease check LOTLEDGER_PLUGIN_PATH environment variable.";
        }

        return std::unexpected(errorMsg);
    }

    auto initResult = (*dbResult)->initializeFromOptions(cmd.options);
    if (!initResult) {
        return std::unexpected(
            "Failed to initialize database plugin '" + pluginName + "': " +
            initResult.error());
    }

    database_ = *dbResult;
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═════════════════════════════════════════════════════════════════════════════

std::expected<Date, std::string> CommandExecutor::getDateOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const
{
    auto text = getRequiredOption<std::string>(cmd, optionName);
    if (!text) {
        return std::unexpected(text.error());
    }
    return parseDate(*text);
}

TaxSettings CommandExecutor::taxSettingsFrom(const ParsedCommand& cmd)
{
    TaxSettings settings;
    if (cmd.options.count("short-rate")) {
        settings.shortRate = cmd.options.at("short-rate").as<double>();
    }
    if (cmd.options.count("long-rate")) {
        settings.longRate = cmd.options.at("long-rate").as<double>();
    }
    if (cmd.options.count("long-exemption")) {
        settings.longExemptionThreshold = cmd.options.at("long-exemption").as<double>();
    }
    if (cmd.options.count("fy-start-month")) {
        settings.fiscalYearStartMonth = cmd.options.at("fy-start-month").as<unsigned>();
    }
    return settings;
}

std::expected<EditRequest, std::string> CommandExecutor::editRequestFrom(
    const ParsedCommand& cmd) const
{
    EditRequest request;

    if (cmd.options.count("date")) {
        auto date = getDateOption(cmd, "date");
        if (!date) {
            return std::unexpected(date.error());
        }
        request.date = *date;
    }

    if (cmd.options.count("quantity")) {
        request.quantity = cmd.options.at("quantity").as<double>();
    }

    if (cmd.options.count("price")) {
        request.unitPrice = cmd.options.at("price").as<double>();
    }

    if (cmd.options.count("type")) {
        auto type = parseTransactionType(cmd.options.at("type").as<std::string>());
        if (!type) {
            return std::unexpected(type.error());
        }
        request.type = *type;
    }

    if (cmd.options.count("instrument")) {
        request.instrumentId = cmd.options.at("instrument").as<std::string>();
    }

    if (cmd.options.count("notes")) {
        request.notes = cmd.options.at("notes").as<std::string>();
    }

    if (request.empty()) {
        return std::unexpected(
            "Nothing to edit: specify at least one of --date, --quantity, "
            "--price, --type, --instrument, --notes");
    }

    return request;
}

void CommandExecutor::printTransaction(const TransactionRecord& record) const
{
    std::cout << "  #" << record.id << "  " << formatDate(record.date)
              << "  " << std::left << std::setw(12) << toString(record.type)
              << std::right << std::setw(10) << record.instrumentId
              << "  qty " << std::fixed << std::setprecision(4) << record.quantity
              << "  @ " << std::setprecision(2) << record.unitPrice;
    if (!record.notes.empty()) {
        std::cout << "  (" << record.notes << ")";
    }
    std::cout << std::endl;
}

void CommandExecutor::printGains(const std::vector<RealizedGain>& gains) const
{
    std::cout << std::left
              << std::setw(8) << "Acq"
              << std::setw(8) << "Disp"
              << std::setw(12) << "Instrument"
              << std::right
              << std::setw(12) << "Quantity"
              << std::setw(12) << "Cost/unit"
              << std::setw(12) << "Sale/unit"
              << std::setw(8) << "Days"
              << std::setw(7) << "Type"
              << std::setw(14) << "Gain" << std::endl;
    std::cout << std::string(93, '-') << std::endl;

    for (const auto& gain : gains) {
        std::cout << std::left
                  << std::setw(8) << gain.acquisitionId
                  << std::setw(8) << gain.disposalId
                  << std::setw(12) << gain.instrumentId
                  << std::right << std::fixed
                  << std::setw(12) << std::setprecision(4) << gain.quantity
                  << std::setw(12) << std::setprecision(2) << gain.unitCostBasis
                  << std::setw(12) << gain.unitProceeds
                  << std::setw(8) << gain.holdingPeriodDays
                  << std::setw(7) << toString(gain.bucket)
                  << std::setw(14) << gain.gainAmount << std::endl;
    }
}

void CommandExecutor::printDisposalResult(const DisposalResult& result) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "DISPOSAL #" << result.disposal.id << ": "
              << result.disposal.instrumentId << " on "
              << formatDate(result.disposal.date) << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Matched lots:" << std::endl;
    for (const auto& lot : result.match.matchedLots) {
        std::cout << "  Lot #" << lot.acquisitionId << " ("
                  << formatDate(lot.acquisitionDate) << "): "
                  << std::setprecision(4) << lot.quantity
                  << std::setprecision(2) << " x " << lot.unitCostBasis
                  << " -> " << lot.unitProceeds
                  << ", held " << lot.holdingPeriodDays << " days"
                  << ", gain " << lot.gain() << std::endl;
    }
    std::cout << std::endl;

    std::cout << "Totals:" << std::endl;
    std::cout << "  " << fieldLabel("Cost basis:") << result.match.totalCost << std::endl;
    std::cout << "  " << fieldLabel("Proceeds:") << result.match.totalProceeds << std::endl;
    std::cout << "  " << fieldLabel("Short-term gain:") << result.shortTermGain << std::endl;
    std::cout << "  " << fieldLabel("Long-term gain:") << result.longTermGain << std::endl;
    std::cout << std::endl;

    std::cout << "Tax preview (" << result.fiscalYearLabel << "):" << std::endl;
    std::cout << "  " << fieldLabel("Short-term tax:") << result.taxPreview.shortTax << std::endl;
    std::cout << "  " << fieldLabel("Long-term tax:") << result.taxPreview.longTax << std::endl;
    std::cout << "  " << fieldLabel("Exemption applied:")
              << result.taxPreview.exemptionApplied << std::endl;
    std::cout << "  " << fieldLabel("Total tax:") << result.taxPreview.totalTax() << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void CommandExecutor::printRejection(const EditRejection& rejection) const
{
    std::cout << "Edit rejected: " << toString(rejection.rule) << std::endl;
    std::cout << "  " << rejection.message << std::endl;
    if (!rejection.field.empty()) {
        std::cout << "  Field: " << rejection.field << std::endl;
    }
    if (rejection.boundDate) {
        std::cout << "  Bound: " << formatDate(*rejection.boundDate) << std::endl;
    } else {
        std::cout << "  Bound: " << rejection.bound << std::endl;
    }
    if (!rejection.conflictingRecords.empty()) {
        std::cout << "  Conflicting records:";
        for (auto id : rejection.conflictingRecords) {
            std::cout << " #" << id;
        }
        std::cout << std::endl;
    }
}

void CommandExecutor::printReport(const CapitalGainsReport& report) const
{
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "CAPITAL GAINS REPORT " << report.year.label()
              << " (" << formatDate(report.year.firstDay()) << " .. "
              << formatDate(report.year.lastDay()) << ")" << std::endl;
    if (!report.instrumentFilter.empty()) {
        std::cout << "Instrument: " << report.instrumentFilter << std::endl;
    }
    std::cout << std::string(70, '=') << std::endl << std::endl;

    std::cout << "Short-term gains (" << report.shortTermGains.size() << "):" << std::endl;
    if (!report.shortTermGains.empty()) {
        printGains(report.shortTermGains);
    }
    std::cout << std::endl;

    std::cout << "Long-term gains (" << report.longTermGains.size() << "):" << std::endl;
    if (!report.longTermGains.empty()) {
        printGains(report.longTermGains);
    }
    std::cout << std::endl;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Summary:" << std::endl;
    std::cout << "  " << fieldLabel("Total cost:") << report.totalCost << std::endl;
    std::cout << "  " << fieldLabel("Total proceeds:") << report.totalProceeds << std::endl;
    std::cout << "  " << fieldLabel("Short-term net:") << report.shortTermTotal << std::endl;
    std::cout << "  " << fieldLabel("Long-term net:") << report.longTermTotal << std::endl;
    std::cout << "  " << fieldLabel("Net gain:") << report.netGain() << std::endl;
    std::cout << std::endl;

    std::cout << "Tax estimate:" << std::endl;
    std::cout << "  " << fieldLabel("Taxable short-term:") << report.tax.taxableShortTerm << std::endl;
    std::cout << "  " << fieldLabel("Taxable long-term:") << report.tax.taxableLongTerm << std::endl;
    std::cout << "  " << fieldLabel("Exemption applied:") << report.tax.exemptionApplied << std::endl;
    std::cout << "  " << fieldLabel("Short-term tax:") << report.tax.shortTax << std::endl;
    std::cout << "  " << fieldLabel("Long-term tax:") << report.tax.longTax << std::endl;
    std::cout << "  " << fieldLabel("Total tax:") << report.tax.totalTax() << std::endl;
    if (!report.instrumentFilter.empty()) {
        std::cout << "  " << fieldLabel("Fiscal year tax:") << report.periodTax.totalTax()
                  << " (all instruments)" << std::endl;
    }
    std::cout << std::string(70, '=') << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Help & Version
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeHelp(const ParsedCommand& cmd)
{
    if (!cmd.positional.empty()) {
        printCommandHelp(cmd.positional.front());
    } else {
        printHelp();
    }
    return {};
}

Result CommandExecutor::executeVersion([[maybe_unused]] const ParsedCommand& cmd)
{
    printVersion();
    return {};
}

void CommandExecutor::printVersion() const
{
    std::cout << "lotledger version " << kVersion << std::endl;
    std::cout << "FIFO lot matching and capital gains ledger" << std::endl;
}

void CommandExecutor::printHelp() const
{
    std::cout << "Usage: lotledger <command> [options]\n\n"
              << "Ledger commands:\n"
              << "  acquire    Record an acquisition (a new lot)\n"
              << "  dispose    Record a disposal, FIFO-match it and preview tax\n"
              << "  lots       Show lots of an instrument and what is left of them\n"
              << "  gains      List realized gains\n"
              << "\n"
              << "Edit commands:\n"
              << "  edit       Validate and apply an edit to a recorded transaction\n"
              << "  delete     Delete an unmatched acquisition\n"
              << "  history    Show the edit history of a transaction\n"
              << "\n"
              << "Reports:\n"
              << "  report     Capital gains and tax estimate for a fiscal year\n"
              << "\n"
              << "Other:\n"
              << "  plugin list   List database plugins\n"
              << "  help [cmd]    Show help (for a command)\n"
              << "  version       Show version\n"
              << "\n"
              << "Every ledger command needs a storage plugin:\n"
              << "  --db sqlite_db --sqlite-path ./ledger.db\n"
              << "\n"
              << "Plugins are searched in $LOTLEDGER_PLUGIN_PATH (default ./plugins).\n";
}

void CommandExecutor::printCommandHelp(std::string_view command)
{
    if (!parser_) {
        printHelp();
        return;
    }

    auto desc = parser_->optionsFor(command);
    if (!desc) {
        std::cout << "Unknown command: " << command << "\n\n";
        printHelp();
        return;
    }

    std::cout << "Usage: lotledger " << command << " [options]\n\n" << *desc << std::endl;

    // Опции плагинов хранилища
    if (CommandLineParser::isLedgerCommand(command) && databasePluginManager_) {
        for (const auto& plugin : databasePluginManager_->scanAvailablePlugins()) {
            if (plugin.commandLineOptions) {
                std::cout << "[--db " << plugin.systemName << "]\n"
                          << *plugin.commandLineOptions << std::endl;
            }
        }
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Ledger Commands
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeAcquire(const ParsedCommand& cmd)
{
    auto dbResult = ensureDatabase(cmd);
    if (!dbResult) {
        return std::unexpected(dbResult.error());
    }

    auto instrumentId = getRequiredOption<std::string>(cmd, "instrument-id");
    if (!instrumentId) {
        return std::unexpected(instrumentId.error());
    }
    auto quantity = getRequiredOption<double>(cmd, "quantity");
    if (!quantity) {
        return std::unexpected(quantity.error());
    }
    auto price = getRequiredOption<double>(cmd, "price");
    if (!price) {
        return std::unexpected(price.error());
    }
    auto date = getDateOption(cmd, "date");
    if (!date) {
        return std::unexpected(date.error());
    }
    std::string notes = cmd.options.count("notes")
        ? cmd.options.at("notes").as<std::string>() : "";

    DisposalOrchestrator orchestrator(database_);
    auto record = orchestrator.recordAcquisition(*instrumentId, *quantity, *price, *date, notes);
    if (!record) {
        return std::unexpected(record.error().describe());
    }

    std::cout << "✓ Acquisition recorded" << std::endl;
    printTransaction(*record);
    return {};
}

Result CommandExecutor::executeDispose(const ParsedCommand& cmd)
{
    auto dbResult = ensureDatabase(cmd);
    if (!dbResult) {
        return std::unexpected(dbResult.error());
    }

    auto instrumentId = getRequiredOption<std::string>(cmd, "instrument-id");
    if (!instrumentId) {
        return std::unexpected(instrumentId.error());
    }
    auto quantity = getRequiredOption<double>(cmd, "quantity");
    if (!quantity) {
        return std::unexpected(quantity.error());
    }
    auto price = getRequiredOption<double>(cmd, "price");
    if (!price) {
        return std::unexpected(price.error());
    }
    auto date = getDateOption(cmd, "date");
    if (!date) {
        return std::unexpected(date.error());
    }
    std::string notes = cmd.options.count("notes")
        ? cmd.options.at("notes").as<std::string>() : "";

    TaxSettings settings = taxSettingsFrom(cmd);
    auto valid = settings.validate();
    if (!valid) {
        return std::unexpected(valid.error().describe());
    }

    DisposalOrchestrator orchestrator(database_, settings);
    auto result = orchestrator.recordDisposal(*instrumentId, *quantity, *price, *date, notes);
    if (!result) {
        return std::unexpected(result.error().describe());
    }

    std::cout << "✓ Disposal recorded" << std::endl;
    printDisposalResult(*result);
    return {};
}

Result CommandExecutor::executeLots(const ParsedCommand& cmd)
{
    auto dbResult = ensureDatabase(cmd);
    if (!dbResult) {
        return std::unexpected(dbResult.error());
    }

    auto instrumentId = getRequiredOption<std::string>(cmd, "instrument-id");
    if (!instrumentId) {
        return std::unexpected(instrumentId.error());
    }
    bool showAll = cmd.options.count("all") && cmd.options.at("all").as<bool>();

    LotLedger ledger(database_);
    auto positions = ledger.lotPositions(*instrumentId);
    if (!positions) {
        return std::unexpected(positions.error().describe());
    }

    if (positions->empty()) {
        std::cout << "No lots found for " << *instrumentId << "." << std::endl;
        return {};
    }

    std::cout << "Lots of " << *instrumentId << ":" << std::endl;
    std::cout << std::left
              << std::setw(8) << "Lot"
              << std::setw(12) << "Date"
              << std::right
              << std::setw(12) << "Price"
              << std::setw(14) << "Quantity"
              << std::setw(14) << "Consumed"
              << std::setw(14) << "Available" << std::endl;
    std::cout << std::string(74, '-') << std::endl;

    double totalAvailable = 0.0;
    std::size_t shown = 0;
    for (const auto& lot : *positions) {
        if (!showAll && lot.available() <= kQuantityEpsilon) {
            continue;
        }
        std::cout << std::left
                  << std::setw(8) << lot.acquisitionId
                  << std::setw(12) << formatDate(lot.date)
                  << std::right << std::fixed
                  << std::setw(12) << std::setprecision(2) << lot.unitPrice
                  << std::setw(14) << std::setprecision(4) << lot.quantity
                  << std::setw(14) << lot.consumed
                  << std::setw(14) << lot.available() << std::endl;
        if (lot.available() > kQuantityEpsilon) {
            totalAvailable += lot.available();
        }
        ++shown;
    }

    std::cout << std::string(74, '-') << std::endl;
    std::cout << shown << " lot(s), available " << std::fixed << std::setprecision(4)
              << totalAvailable << std::endl;
    return {};
}

Result CommandExecutor::executeGains(const ParsedCommand& cmd)
{
    auto dbResult = ensureDatabase(cmd);
    if (!dbResult) {
        return std::unexpected(dbResult.error());
    }

    std::vector<std::string> instruments;
    if (cmd.options.count("instrument-id")) {
        instruments.push_back(cmd.options.at("instrument-id").as<std::string>());
    } else {
        auto all = database_->listInstruments();
        if (!all) {
            return std::unexpected(all.error());
        }
        instruments = std::move(*all);
    }

    std::vector<RealizedGain> gains;
    for (const auto& instrumentId : instruments) {
        auto result = database_->listGainsForInstrument(instrumentId);
        if (!result) {
            return std::unexpected(result.error());
        }
        gains.insert(gains.end(), result->begin(), result->end());
    }

    if (gains.empty()) {
        std::cout << "No realized gains." << std::endl;
        return {};
    }

    printGains(gains);

    double total = 0.0;
    for (const auto& gain : gains) {
        total += gain.gainAmount;
    }
    std::cout << std::string(93, '-') << std::endl;
    std::cout << gains.size() << " gain(s), net " << std::fixed << std::setprecision(2)
              << total << std::endl;
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Edit Commands
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeEdit(const ParsedCommand& cmd)
{
    auto dbResult = ensureDatabase(cmd);
    if (!dbResult) {
        return std::unexpected(dbResult.error());
    }

    auto id = getRequiredOption<RecordId>(cmd, "id");
    if (!id) {
        return std::unexpected(id.error());
    }

    auto request = editRequestFrom(cmd);
    if (!request) {
        return std::unexpected(request.error());
    }

    bool dryRun = cmd.options.count("dry-run") && cmd.options.at("dry-run").as<bool>();

    TransactionEditor editor(database_);

    if (dryRun) {
        auto decision = editor.proposeEdit(*id, *request);
        if (!decision) {
            return std::unexpected(decision.error().describe());
        }
        if (!decision->accepted()) {
            printRejection(*decision->rejection);
            return std::unexpected("Edit of #" + std::to_string(*id) + " would be rejected");
        }

        std::cout << "✓ Edit of #" << *id << " would be accepted (dry run)" << std::endl;
        std::cout << "Before:" << std::endl;
        printTransaction(decision->original);
        std::cout << "After:" << std::endl;
        printTransaction(decision->proposed);
        return {};
    }

    auto outcome = editor.commitEdit(*id, *request);
    if (!outcome) {
        if (outcome.error().rejection) {
            printRejection(*outcome.error().rejection);
        }
        return std::unexpected(outcome.error().describe());
    }

    std::cout << "✓ Transaction #" << *id << " updated" << std::endl;
    std::cout << "Before:" << std::endl;
    printTransaction(outcome->before);
    std::cout << "After:" << std::endl;
    printTransaction(outcome->after);

    if (!outcome->recomputedGains.empty()) {
        std::cout << "\nRecomputed gains:" << std::endl;
        printGains(outcome->recomputedGains);
    }
    if (!outcome->createdGains.empty()) {
        std::cout << "\nRe-matched gains:" << std::endl;
        printGains(outcome->createdGains);
    }

    std::cout << "\nAudit entries written: " << outcome->auditEntries.size() << std::endl;
    return {};
}

Result CommandExecutor::executeDelete(const ParsedCommand& cmd)
{
    auto dbResult = ensureDatabase(cmd);
    if (!dbResult) {
        return std::unexpected(dbResult.error());
    }

    auto id = getRequiredOption<RecordId>(cmd, "id");
    if (!id) {
        return std::unexpected(id.error());
    }

    TransactionEditor editor(database_);
    auto result = editor.deleteTransaction(*id);
    if (!result) {
        if (result.error().rejection) {
            printRejection(*result.error().rejection);
        }
        return std::unexpected(result.error().describe());
    }

    std::cout << "✓ Transaction #" << *id << " deleted" << std::endl;
    return {};
}

Result CommandExecutor::executeHistory(const ParsedCommand& cmd)
{
    auto dbResult = ensureDatabase(cmd);
    if (!dbResult) {
        return std::unexpected(dbResult.error());
    }

    auto id = getRequiredOption<RecordId>(cmd, "id");
    if (!id) {
        return std::unexpected(id.error());
    }

    AuditLogger auditLogger(database_);

    auto history = auditLogger.getHistory(*id);
    if (!history) {
        return std::unexpected(history.error().describe());
    }
    auto summary = auditLogger.getEditSummary(*id);
    if (!summary) {
        return std::unexpected(summary.error().describe());
    }

    std::cout << "History of transaction #" << *id << ":" << std::endl;

    if (history->empty()) {
        std::cout << "  (never edited)" << std::endl;
        return {};
    }

    for (const auto& entry : *history) {
        std::cout << "  " << formatTimestamp(entry.timestamp) << "  "
                  << std::left << std::setw(14) << entry.fieldName << std::right
                  << entry.oldValue << " -> " << entry.newValue << std::endl;
    }

    std::cout << std::endl;
    std::cout << "Edits:         " << summary->editCount << std::endl;
    std::cout << "Changes:       " << summary->totalChanges << std::endl;
    if (summary->lastModified) {
        std::cout << "Last modified: " << formatTimestamp(*summary->lastModified) << std::endl;
    }
    std::cout << "Fields:       ";
    for (const auto& field : summary->fieldsChanged) {
        std::cout << " " << field;
    }
    std::cout << std::endl;
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Reports
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executeReport(const ParsedCommand& cmd)
{
    auto dbResult = ensureDatabase(cmd);
    if (!dbResult) {
        return std::unexpected(dbResult.error());
    }

    auto fy = getRequiredOption<int>(cmd, "fy");
    if (!fy) {
        return std::unexpected(fy.error());
    }

    std::string instrumentFilter = cmd.options.count("instrument-id")
        ? cmd.options.at("instrument-id").as<std::string>() : "";

    CapitalGainsReporter reporter(database_, taxSettingsFrom(cmd));
    auto report = reporter.generate(*fy, instrumentFilter);
    if (!report) {
        return std::unexpected(report.error().describe());
    }

    printReport(*report);
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Plugin Management
// ═════════════════════════════════════════════════════════════════════════════

Result CommandExecutor::executePlugin(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty() || cmd.subcommand == "list") {
        return executePluginList(cmd);
    }
    return std::unexpected("Unknown plugin subcommand: " + cmd.subcommand);
}

Result CommandExecutor::executePluginList([[maybe_unused]] const ParsedCommand& cmd)
{
    if (!databasePluginManager_) {
        return std::unexpected("Database plugin manager is not configured");
    }

    auto plugins = databasePluginManager_->scanAvailablePlugins();

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "DATABASE PLUGINS (" << databasePluginManager_->getPluginPath() << ")" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    if (plugins.empty()) {
        std::cout << "No database plugins found." << std::endl;
        std::cout << "Please check LOTLEDGER_PLUGIN_PATH environment variable." << std::endl;
        return {};
    }

    for (const auto& plugin : plugins) {
        std::cout << "\n" << plugin.displayName << " v" << plugin.version
                  << " (use: --db " << plugin.systemName << ")" << std::endl;
        if (!plugin.description.empty()) {
            std::cout << "  " << plugin.description << std::endl;
        }
        if (plugin.commandLineOptions) {
            std::ostringstream oss;
            oss << *plugin.commandLineOptions;
            std::istringstream iss(oss.str());
            std::string line;
            while (std::getline(iss, line)) {
                if (!line.empty()) {
                    std::cout << "  " << line << std::endl;
                }
            }
        }
        if (!plugin.examples.empty()) {
            std::cout << "  Examples:" << std::endl;
            for (const auto& example : plugin.examples) {
                if (example[0] == '#') {
                    std::cout << "    " << example << std::endl;
                } else {
                    std::cout << "    $ " << example << std::endl;
                }
            }
        }
    }

    std::cout << std::string(70, '=') << std::endl;
    return {};
}

}  // namespace lotledger
