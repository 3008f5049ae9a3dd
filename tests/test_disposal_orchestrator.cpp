#include <gtest/gtest.h>
#include "DisposalOrchestrator.hpp"
#include "InMemoryDatabase.hpp"
#include <memory>

using namespace lotledger;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class DisposalOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = std::make_shared<InMemoryDatabase>();
        orchestrator = std::make_unique<DisposalOrchestrator>(db);
    }

    RecordId acquire(double quantity, double price, Date date,
                     std::string_view instrument = "INFY") {
        auto record = orchestrator->recordAcquisition(instrument, quantity, price, date);
        EXPECT_TRUE(record.has_value());
        return record ? record->id : 0;
    }

    std::shared_ptr<InMemoryDatabase> db;
    std::unique_ptr<DisposalOrchestrator> orchestrator;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Покупка
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(DisposalOrchestratorTest, RecordAcquisition) {
    auto record = orchestrator->recordAcquisition(
        "INFY", 10.0, 1450.0, makeDate(2024, 1, 15), "first lot");
    ASSERT_TRUE(record.has_value());

    EXPECT_GT(record->id, 0);
    EXPECT_TRUE(record->isAcquisition());
    EXPECT_EQ(record->notes, "first lot");

    auto stored = db->getTransaction(record->id);
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->has_value());
    EXPECT_DOUBLE_EQ((*stored)->quantity, 10.0);
}

TEST_F(DisposalOrchestratorTest, AcquisitionRejectsInvalidInput) {
    auto zero = orchestrator->recordAcquisition("INFY", 0.0, 100.0, makeDate(2024, 1, 1));
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().kind, ErrorKind::InvalidArgument);

    auto price = orchestrator->recordAcquisition("INFY", 1.0, -5.0, makeDate(2024, 1, 1));
    ASSERT_FALSE(price.has_value());
    EXPECT_EQ(price.error().kind, ErrorKind::InvalidArgument);

    auto instrument = orchestrator->recordAcquisition("", 1.0, 5.0, makeDate(2024, 1, 1));
    ASSERT_FALSE(instrument.has_value());
    EXPECT_EQ(instrument.error().kind, ErrorKind::InvalidArgument);

    EXPECT_EQ(db->transactionCount(), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Продажа
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(DisposalOrchestratorTest, DisposalCreatesGainPerMatchedLot) {
    RecordId january = acquire(10.0, 100.0, makeDate(2024, 1, 1));
    RecordId march = acquire(10.0, 120.0, makeDate(2024, 3, 1));

    auto result = orchestrator->recordDisposal("INFY", 12.0, 150.0, makeDate(2024, 6, 1));
    ASSERT_TRUE(result.has_value()) << result.error().describe();

    EXPECT_TRUE(result->disposal.isDisposal());
    ASSERT_EQ(result->gains.size(), 2u);

    EXPECT_EQ(result->gains[0].acquisitionId, january);
    EXPECT_DOUBLE_EQ(result->gains[0].quantity, 10.0);
    EXPECT_DOUBLE_EQ(result->gains[0].gainAmount, 500.0);
    EXPECT_EQ(result->gains[0].disposalId, result->disposal.id);

    EXPECT_EQ(result->gains[1].acquisitionId, march);
    EXPECT_DOUBLE_EQ(result->gains[1].quantity, 2.0);
    EXPECT_DOUBLE_EQ(result->gains[1].gainAmount, 60.0);

    EXPECT_DOUBLE_EQ(result->shortTermGain, 560.0);
    EXPECT_DOUBLE_EQ(result->longTermGain, 0.0);
    EXPECT_DOUBLE_EQ(result->taxPreview.shortTax, 112.0);
    EXPECT_EQ(result->fiscalYearLabel, "FY 2024-25");

    EXPECT_EQ(db->realizedGainCount(), 2u);
    EXPECT_EQ(db->transactionCount(), 3u);
}

TEST_F(DisposalOrchestratorTest, InsufficientInventoryWritesNothing) {
    acquire(10.0, 100.0, makeDate(2024, 1, 1));
    acquire(2.0, 120.0, makeDate(2024, 3, 1));

    auto result = orchestrator->recordDisposal("INFY", 15.0, 150.0, makeDate(2024, 6, 1));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InsufficientInventory);
    EXPECT_DOUBLE_EQ(result.error().shortfall, 3.0);

    EXPECT_EQ(db->realizedGainCount(), 0u);
    EXPECT_EQ(db->transactionCount(), 2u);
}

TEST_F(DisposalOrchestratorTest, LaterAcquisitionsAreNotEligible) {
    acquire(5.0, 100.0, makeDate(2024, 1, 1));
    acquire(10.0, 120.0, makeDate(2024, 7, 1));

    auto result = orchestrator->recordDisposal("INFY", 8.0, 150.0, makeDate(2024, 6, 1));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InsufficientInventory);
    EXPECT_DOUBLE_EQ(result.error().shortfall, 3.0);
}

TEST_F(DisposalOrchestratorTest, SameDayAcquisitionIsEligible) {
    acquire(5.0, 100.0, makeDate(2024, 6, 1));

    auto result = orchestrator->recordDisposal("INFY", 5.0, 110.0, makeDate(2024, 6, 1));
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(result->gains.size(), 1u);
    EXPECT_EQ(result->gains[0].holdingPeriodDays, 0);
}

TEST_F(DisposalOrchestratorTest, NoAcquisitionsIsInsufficientInventory) {
    auto result = orchestrator->recordDisposal("INFY", 1.0, 150.0, makeDate(2024, 6, 1));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InsufficientInventory);
    EXPECT_EQ(db->transactionCount(), 0u);
}

TEST_F(DisposalOrchestratorTest, ClassificationBoundary) {
    acquire(1.0, 100.0, makeDate(2023, 1, 1));
    acquire(1.0, 100.0, makeDate(2023, 1, 2));

    // 2023-01-02 .. 2024-01-02 = 365 дней, 2023-01-01 .. = 366
    auto result = orchestrator->recordDisposal("INFY", 2.0, 200.0, makeDate(2024, 1, 2));
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->gains.size(), 2u);

    EXPECT_EQ(result->gains[0].holdingPeriodDays, 366);
    EXPECT_EQ(result->gains[0].bucket, GainBucket::Long);
    EXPECT_EQ(result->gains[1].holdingPeriodDays, 365);
    EXPECT_EQ(result->gains[1].bucket, GainBucket::Short);

    EXPECT_DOUBLE_EQ(result->longTermGain, 100.0);
    EXPECT_DOUBLE_EQ(result->shortTermGain, 100.0);
}

TEST_F(DisposalOrchestratorTest, TaxPreviewConsumesExemptionAcrossFiscalYear) {
    TaxSettings settings;
    settings.longExemptionThreshold = 1000.0;
    orchestrator = std::make_unique<DisposalOrchestrator>(db, settings);

    acquire(20.0, 100.0, makeDate(2022, 1, 1));

    // Первая продажа: 800 долгосрочного дохода, порог не исчерпан
    auto first = orchestrator->recordDisposal("INFY", 10.0, 180.0, makeDate(2024, 5, 1));
    ASSERT_TRUE(first.has_value());
    EXPECT_DOUBLE_EQ(first->taxPreview.longTax, 0.0);

    // Вторая: еще 800, из них 600 сверх порога
    auto second = orchestrator->recordDisposal("INFY", 10.0, 180.0, makeDate(2024, 6, 1));
    ASSERT_TRUE(second.has_value());
    EXPECT_DOUBLE_EQ(second->taxPreview.exemptionApplied, 200.0);
    EXPECT_DOUBLE_EQ(second->taxPreview.taxableLongTerm, 600.0);
    EXPECT_DOUBLE_EQ(second->taxPreview.longTax, 60.0);
}

TEST_F(DisposalOrchestratorTest, ExemptionResetsInNewFiscalYear) {
    TaxSettings settings;
    settings.longExemptionThreshold = 1000.0;
    orchestrator = std::make_unique<DisposalOrchestrator>(db, settings);

    acquire(20.0, 100.0, makeDate(2022, 1, 1));

    ASSERT_TRUE(orchestrator->recordDisposal("INFY", 10.0, 180.0, makeDate(2024, 3, 1)));

    auto next = orchestrator->recordDisposal("INFY", 10.0, 180.0, makeDate(2024, 4, 1));
    ASSERT_TRUE(next.has_value());
    EXPECT_DOUBLE_EQ(next->taxPreview.longTax, 0.0);
    EXPECT_EQ(next->fiscalYearLabel, "FY 2024-25");
}

TEST_F(DisposalOrchestratorTest, InvalidDisposalInput) {
    acquire(10.0, 100.0, makeDate(2024, 1, 1));

    auto zero = orchestrator->recordDisposal("INFY", 0.0, 150.0, makeDate(2024, 6, 1));
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().kind, ErrorKind::InvalidArgument);

    auto price = orchestrator->recordDisposal("INFY", 1.0, 0.0, makeDate(2024, 6, 1));
    ASSERT_FALSE(price.has_value());
    EXPECT_EQ(price.error().kind, ErrorKind::InvalidArgument);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Атомарность
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(DisposalOrchestratorTest, StorageFailureRollsBackEverything) {
    acquire(10.0, 100.0, makeDate(2024, 1, 1));
    acquire(10.0, 120.0, makeDate(2024, 3, 1));

    // Первый доход записан, второй - отказ хранилища
    db->failOn("insertRealizedGain", 1);

    auto result = orchestrator->recordDisposal("INFY", 12.0, 150.0, makeDate(2024, 6, 1));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::PersistenceFailure);

    EXPECT_EQ(db->realizedGainCount(), 0u);
    EXPECT_EQ(db->transactionCount(), 2u);
    EXPECT_FALSE(db->inTransaction());
}

TEST_F(DisposalOrchestratorTest, RetryAfterStorageFailureSucceeds) {
    acquire(10.0, 100.0, makeDate(2024, 1, 1));
    db->failOn("insertTransaction");

    auto failed = orchestrator->recordDisposal("INFY", 4.0, 150.0, makeDate(2024, 6, 1));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, ErrorKind::PersistenceFailure);

    auto retried = orchestrator->recordDisposal("INFY", 4.0, 150.0, makeDate(2024, 6, 1));
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(db->realizedGainCount(), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Повторное сопоставление
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(DisposalOrchestratorTest, RematchReplacesGains) {
    acquire(10.0, 100.0, makeDate(2024, 1, 1));
    acquire(10.0, 120.0, makeDate(2024, 3, 1));

    auto result = orchestrator->recordDisposal("INFY", 4.0, 150.0, makeDate(2024, 6, 1));
    ASSERT_TRUE(result.has_value());

    TransactionRecord disposal = result->disposal;
    disposal.quantity = 12.0;
    ASSERT_TRUE(db->updateTransaction(disposal).has_value());

    auto rematched = orchestrator->rematchDisposal(disposal);
    ASSERT_TRUE(rematched.has_value()) << rematched.error().describe();

    ASSERT_EQ(rematched->size(), 2u);
    EXPECT_DOUBLE_EQ((*rematched)[0].quantity, 10.0);
    EXPECT_DOUBLE_EQ((*rematched)[1].quantity, 2.0);
    EXPECT_EQ(db->realizedGainCount(), 2u);
}

TEST_F(DisposalOrchestratorTest, RematchRejectsAcquisition) {
    auto record = orchestrator->recordAcquisition("INFY", 1.0, 1.0, makeDate(2024, 1, 1));
    ASSERT_TRUE(record.has_value());

    auto rematched = orchestrator->rematchDisposal(*record);

    ASSERT_FALSE(rematched.has_value());
    EXPECT_EQ(rematched.error().kind, ErrorKind::InvalidArgument);
}
