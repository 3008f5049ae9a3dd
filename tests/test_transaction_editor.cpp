#include <gtest/gtest.h>
#include "DisposalOrchestrator.hpp"
#include "InMemoryDatabase.hpp"
#include "LotLedger.hpp"
#include "TransactionEditor.hpp"
#include <memory>

using namespace lotledger;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class TransactionEditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = std::make_shared<InMemoryDatabase>();
        orchestrator = std::make_unique<DisposalOrchestrator>(db);
        editor = std::make_unique<TransactionEditor>(db);

        auto a = orchestrator->recordAcquisition("INFY", 10.0, 100.0, makeDate(2024, 1, 1));
        ASSERT_TRUE(a.has_value());
        acquisitionId = a->id;

        auto d = orchestrator->recordDisposal("INFY", 6.0, 150.0, makeDate(2024, 2, 1));
        ASSERT_TRUE(d.has_value());
        disposalId = d->disposal.id;
    }

    TransactionRecord load(RecordId id) {
        auto record = db->getTransaction(id);
        EXPECT_TRUE(record.has_value() && record->has_value());
        return (record && *record) ? **record : TransactionRecord{};
    }

    std::vector<RealizedGain> gainsOf(RecordId disposal) {
        auto gains = db->listGainsForDisposal(disposal);
        EXPECT_TRUE(gains.has_value());
        return gains ? *gains : std::vector<RealizedGain>{};
    }

    TimePoint at(int hour) {
        return Date{makeDate(2024, 7, 1)} + std::chrono::hours{hour};
    }

    std::shared_ptr<InMemoryDatabase> db;
    std::unique_ptr<DisposalOrchestrator> orchestrator;
    std::unique_ptr<TransactionEditor> editor;

    RecordId acquisitionId = 0;
    RecordId disposalId = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Предложение правки
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TransactionEditorTest, ProposeDoesNotWrite) {
    EditRequest request;
    request.unitPrice = 80.0;

    auto decision = editor->proposeEdit(acquisitionId, request);
    ASSERT_TRUE(decision.has_value());
    EXPECT_TRUE(decision->accepted());

    EXPECT_DOUBLE_EQ(load(acquisitionId).unitPrice, 100.0);
    EXPECT_EQ(db->auditEntryCount(), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Пересчет зависимых доходов
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TransactionEditorTest, AcquisitionPriceEditRecomputesGains) {
    EditRequest request;
    request.unitPrice = 80.0;

    auto outcome = editor->commitEdit(acquisitionId, request, at(10));
    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();

    ASSERT_EQ(outcome->recomputedGains.size(), 1u);
    EXPECT_DOUBLE_EQ(outcome->recomputedGains[0].unitCostBasis, 80.0);
    EXPECT_DOUBLE_EQ(outcome->recomputedGains[0].gainAmount, 420.0);
    EXPECT_TRUE(outcome->createdGains.empty());

    auto stored = gainsOf(disposalId);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_DOUBLE_EQ(stored[0].gainAmount, 420.0);

    EXPECT_DOUBLE_EQ(load(acquisitionId).unitPrice, 80.0);
}

TEST_F(TransactionEditorTest, AcquisitionDateEditReclassifiesGains) {
    // 2022-12-01 .. 2024-02-01 > 365 дней
    EditRequest request;
    request.date = makeDate(2022, 12, 1);

    auto outcome = editor->commitEdit(acquisitionId, request, at(10));
    ASSERT_TRUE(outcome.has_value());

    auto stored = gainsOf(disposalId);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].holdingPeriodDays, 427);
    EXPECT_EQ(stored[0].bucket, GainBucket::Long);
}

TEST_F(TransactionEditorTest, DisposalPriceEditRecomputesGains) {
    EditRequest request;
    request.unitPrice = 90.0;

    auto outcome = editor->commitEdit(disposalId, request, at(10));
    ASSERT_TRUE(outcome.has_value());

    auto stored = gainsOf(disposalId);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_DOUBLE_EQ(stored[0].unitProceeds, 90.0);
    EXPECT_DOUBLE_EQ(stored[0].gainAmount, -60.0);
}

TEST_F(TransactionEditorTest, DisposalDateEditReclassifiesGains) {
    // 2024-01-01 .. 2025-03-01 = 425 дней
    EditRequest request;
    request.date = makeDate(2025, 3, 1);

    auto outcome = editor->commitEdit(disposalId, request, at(10));
    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();

    ASSERT_EQ(outcome->recomputedGains.size(), 1u);
    EXPECT_TRUE(outcome->createdGains.empty());

    auto stored = gainsOf(disposalId);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].holdingPeriodDays, 425);
    EXPECT_EQ(stored[0].bucket, GainBucket::Long);
    EXPECT_EQ(load(disposalId).date, makeDate(2025, 3, 1));
}

TEST_F(TransactionEditorTest, NotesEditWithInvalidUtf8ReturnsResult) {
    EditRequest request;
    request.notes = "caf\xe9";

    LedgerResult<EditOutcome> outcome = std::unexpected(LedgerError::invalidArgument("unset"));
    EXPECT_NO_THROW(outcome = editor->commitEdit(acquisitionId, request, at(10)));
    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();

    ASSERT_EQ(outcome->auditEntries.size(), 1u);
    EXPECT_EQ(outcome->auditEntries[0].fieldName, "notes");
    EXPECT_EQ(load(acquisitionId).notes, "caf\xe9");
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Повторное сопоставление
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TransactionEditorTest, DisposalQuantityEditRematches) {
    auto b = orchestrator->recordAcquisition("INFY", 5.0, 120.0, makeDate(2024, 1, 15));
    ASSERT_TRUE(b.has_value());

    EditRequest request;
    request.quantity = 12.0;

    auto outcome = editor->commitEdit(disposalId, request, at(10));
    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();

    ASSERT_EQ(outcome->createdGains.size(), 2u);
    EXPECT_EQ(outcome->createdGains[0].acquisitionId, acquisitionId);
    EXPECT_DOUBLE_EQ(outcome->createdGains[0].quantity, 10.0);
    EXPECT_EQ(outcome->createdGains[1].acquisitionId, b->id);
    EXPECT_DOUBLE_EQ(outcome->createdGains[1].quantity, 2.0);

    EXPECT_EQ(gainsOf(disposalId).size(), 2u);
}

TEST_F(TransactionEditorTest, DisposalQuantityDecreaseRematches) {
    EditRequest request;
    request.quantity = 2.0;

    auto outcome = editor->commitEdit(disposalId, request, at(10));
    ASSERT_TRUE(outcome.has_value());

    auto stored = gainsOf(disposalId);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_DOUBLE_EQ(stored[0].quantity, 2.0);

    LotLedger ledger(db);
    auto lots = ledger.availableLots("INFY");
    ASSERT_TRUE(lots.has_value());
    ASSERT_EQ(lots->size(), 1u);
    EXPECT_DOUBLE_EQ((*lots)[0].available, 8.0);
}

TEST_F(TransactionEditorTest, AcquisitionBecomesDisposal) {
    auto b = orchestrator->recordAcquisition("INFY", 3.0, 130.0, makeDate(2024, 3, 1));
    ASSERT_TRUE(b.has_value());

    EditRequest request;
    request.type = TransactionType::Disposal;

    auto outcome = editor->commitEdit(b->id, request, at(10));
    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();

    ASSERT_EQ(outcome->createdGains.size(), 1u);
    EXPECT_EQ(outcome->createdGains[0].acquisitionId, acquisitionId);
    EXPECT_DOUBLE_EQ(outcome->createdGains[0].quantity, 3.0);
    EXPECT_TRUE(load(b->id).isDisposal());
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Отказы и атомарность
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TransactionEditorTest, RejectedEditReturnsEditRejected) {
    EditRequest request;
    request.quantity = 5.0;

    auto outcome = editor->commitEdit(acquisitionId, request, at(10));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::EditRejected);
    ASSERT_TRUE(outcome.error().rejection.has_value());
    EXPECT_EQ(outcome.error().rejection->rule, EditRule::InsufficientAcquisitionQuantity);
    EXPECT_DOUBLE_EQ(outcome.error().rejection->bound, 6.0);

    EXPECT_DOUBLE_EQ(load(acquisitionId).quantity, 10.0);
    EXPECT_EQ(db->auditEntryCount(), 0u);
}

TEST_F(TransactionEditorTest, AuditFailureRollsBackEdit) {
    EditRequest request;
    request.unitPrice = 80.0;
    request.notes = "fix";

    // Первая запись журнала проходит, вторая - отказ
    db->failOn("insertAuditEntry", 1);

    auto outcome = editor->commitEdit(acquisitionId, request, at(10));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::PersistenceFailure);

    EXPECT_DOUBLE_EQ(load(acquisitionId).unitPrice, 100.0);
    EXPECT_DOUBLE_EQ(gainsOf(disposalId)[0].gainAmount, 300.0);
    EXPECT_EQ(db->auditEntryCount(), 0u);
}

TEST_F(TransactionEditorTest, RematchFailureRollsBackEdit) {
    EditRequest request;
    request.quantity = 8.0;

    db->failOn("insertRealizedGain");

    auto outcome = editor->commitEdit(disposalId, request, at(10));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::PersistenceFailure);

    EXPECT_DOUBLE_EQ(load(disposalId).quantity, 6.0);
    auto stored = gainsOf(disposalId);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_DOUBLE_EQ(stored[0].quantity, 6.0);
}

TEST_F(TransactionEditorTest, UnknownRecordIsNotFound) {
    EditRequest request;
    request.notes = "x";

    auto outcome = editor->commitEdit(4242, request, at(10));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::NotFound);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Журнал правок
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TransactionEditorTest, CommitWritesOneAuditEntryPerChangedField) {
    EditRequest request;
    request.unitPrice = 80.0;
    request.notes = "broker fix";
    request.quantity = 10.0;   // Без изменения

    auto outcome = editor->commitEdit(acquisitionId, request, at(10));
    ASSERT_TRUE(outcome.has_value());

    ASSERT_EQ(outcome->auditEntries.size(), 2u);
    EXPECT_EQ(outcome->auditEntries[0].fieldName, "unit_price");
    EXPECT_EQ(outcome->auditEntries[1].fieldName, "notes");
    EXPECT_EQ(outcome->auditEntries[0].timestamp, at(10));
    EXPECT_EQ(outcome->committedAt, at(10));
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Удаление
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TransactionEditorTest, DeleteUnmatchedAcquisitionRemovesHistory) {
    auto b = orchestrator->recordAcquisition("INFY", 3.0, 130.0, makeDate(2024, 3, 1));
    ASSERT_TRUE(b.has_value());

    EditRequest request;
    request.notes = "typo";
    ASSERT_TRUE(editor->commitEdit(b->id, request, at(10)).has_value());
    EXPECT_EQ(db->auditEntryCount(), 1u);

    auto deleted = editor->deleteTransaction(b->id);
    ASSERT_TRUE(deleted.has_value()) << deleted.error().describe();

    auto record = db->getTransaction(b->id);
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->has_value());
    EXPECT_EQ(db->auditEntryCount(), 0u);
}

TEST_F(TransactionEditorTest, DeleteMatchedAcquisitionIsRejected) {
    auto deleted = editor->deleteTransaction(acquisitionId);

    ASSERT_FALSE(deleted.has_value());
    EXPECT_EQ(deleted.error().kind, ErrorKind::EditRejected);
    ASSERT_TRUE(deleted.error().rejection.has_value());
    EXPECT_EQ(deleted.error().rejection->rule, EditRule::DeleteWithMatches);
    EXPECT_EQ(db->transactionCount(), 2u);
}

TEST_F(TransactionEditorTest, DeleteDisposalIsRejected) {
    auto deleted = editor->deleteTransaction(disposalId);

    ASSERT_FALSE(deleted.has_value());
    EXPECT_EQ(deleted.error().kind, ErrorKind::EditRejected);
}

TEST_F(TransactionEditorTest, DeleteUnknownIsNotFound) {
    auto deleted = editor->deleteTransaction(777);

    ASSERT_FALSE(deleted.has_value());
    EXPECT_EQ(deleted.error().kind, ErrorKind::NotFound);
}
