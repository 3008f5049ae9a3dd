#pragma once

#include "FifoMatcher.hpp"
#include "GainClassifier.hpp"
#include "ILedgerDatabase.hpp"
#include "LedgerError.hpp"
#include "LotLedger.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lotledger {

// Возвращается вместо глобального сигнала "портфель изменился"
struct DisposalResult {
    TransactionRecord disposal;
    std::vector<RealizedGain> gains;
    MatchResult match;
    double shortTermGain = 0.0;
    double longTermGain = 0.0;
    TaxEstimate taxPreview;       // Прирост налога за счет этой продажи
    std::string fiscalYearLabel;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Disposal Orchestrator
// ═══════════════════════════════════════════════════════════════════════════════

class DisposalOrchestrator {
public:
    explicit DisposalOrchestrator(
        std::shared_ptr<ILedgerDatabase> database,
        TaxSettings settings = {});

    LedgerResult<TransactionRecord> recordAcquisition(
        std::string_view instrumentId,
        double quantity,
        double unitPrice,
        const Date& date,
        std::string_view notes = "");

    // Вставка продажи, сопоставление и все реализованные доходы -
    // одна атомарная операция
    LedgerResult<DisposalResult> recordDisposal(
        std::string_view instrumentId,
        double quantity,
        double unitPrice,
        const Date& date,
        std::string_view notes = "");

    // Заново сопоставляет уже сохраненную продажу: удаляет ее доходы
    // и создает новые. Вызывается внутри внешней транзакции.
    LedgerResult<std::vector<RealizedGain>> rematchDisposal(
        const TransactionRecord& disposal);

    const TaxSettings& settings() const noexcept { return settings_; }

private:
    std::shared_ptr<ILedgerDatabase> database_;
    LotLedger ledger_;
    TaxSettings settings_;

    static LedgerStatus validateInput(
        std::string_view instrumentId,
        double quantity,
        double unitPrice);

    LedgerResult<MatchResult> matchAgainstLots(const TransactionRecord& disposal);

    LedgerResult<std::vector<RealizedGain>> persistMatches(
        const TransactionRecord& disposal,
        const MatchResult& match);

    // Σ положительных долгосрочных доходов финансового года,
    // реализованных не позднее date
    LedgerResult<double> priorLongTermGains(const Date& date);
};

}  // namespace lotledger
