#include <gtest/gtest.h>
#include "DisposalOrchestrator.hpp"
#include "GainClassifier.hpp"
#include "InMemoryDatabase.hpp"
#include "LotLedger.hpp"
#include "TransactionEditor.hpp"
#include <memory>
#include <random>

using namespace lotledger;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class InventoryPropertiesTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = std::make_shared<InMemoryDatabase>();
        orchestrator = std::make_unique<DisposalOrchestrator>(db);
        editor = std::make_unique<TransactionEditor>(db);
        ledger = std::make_unique<LotLedger>(db);
    }

    // Σ available == Σ покупок − Σ продаж, ни один лот не отрицателен,
    // каждая продажа покрыта доходами ровно на свое количество,
    // срок владения каждого дохода пересчитан по датам
    void checkConservation(const std::string& instrument) {
        auto records = db->listTransactions(instrument);
        ASSERT_TRUE(records.has_value());

        double acquired = 0.0;
        double disposed = 0.0;
        for (const auto& record : *records) {
            if (record.isAcquisition()) {
                acquired += record.quantity;
            } else {
                disposed += record.quantity;

                auto gains = db->listGainsForDisposal(record.id);
                ASSERT_TRUE(gains.has_value());
                double matched = 0.0;
                for (const auto& gain : *gains) {
                    matched += gain.quantity;

                    auto acquisition = db->getTransaction(gain.acquisitionId);
                    ASSERT_TRUE(acquisition.has_value() && acquisition->has_value());
                    EXPECT_LE((*acquisition)->date, record.date);

                    // Срок и корзина соответствуют текущим датам обеих сделок
                    auto days = daysBetween((*acquisition)->date, record.date);
                    EXPECT_EQ(gain.holdingPeriodDays, days);
                    EXPECT_EQ(gain.bucket, GainClassifier::classify(days));
                }
                EXPECT_NEAR(matched, record.quantity, 1e-9);
            }
        }

        auto positions = ledger->lotPositions(instrument);
        ASSERT_TRUE(positions.has_value());

        double available = 0.0;
        for (const auto& lot : *positions) {
            EXPECT_GE(lot.available(), -1e-9);
            available += lot.available();
        }

        EXPECT_NEAR(available, acquired - disposed, 1e-9);
    }

    std::shared_ptr<InMemoryDatabase> db;
    std::unique_ptr<DisposalOrchestrator> orchestrator;
    std::unique_ptr<TransactionEditor> editor;
    std::unique_ptr<LotLedger> ledger;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Сохранение запаса
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(InventoryPropertiesTest, RandomAcquisitionsAndDisposals) {
    std::mt19937 rng(20240401);
    std::uniform_int_distribution<int> action(0, 2);
    std::uniform_int_distribution<int> quantity(1, 20);
    std::uniform_int_distribution<int> price(50, 200);
    std::uniform_int_distribution<int> dayOffset(0, 730);
    std::uniform_int_distribution<int> instrumentPick(0, 2);

    const std::vector<std::string> instruments = {"INFY", "TCS", "WIPRO"};
    const Date start = makeDate(2023, 1, 1);

    int disposals = 0;
    for (int step = 0; step < 300; ++step) {
        const auto& instrument = instruments[instrumentPick(rng)];
        Date date = start + std::chrono::days{dayOffset(rng)};

        if (action(rng) == 0) {
            auto result = orchestrator->recordDisposal(
                instrument, quantity(rng), price(rng), date);
            if (result) {
                ++disposals;
            } else {
                EXPECT_EQ(result.error().kind, ErrorKind::InsufficientInventory);
            }
        } else {
            ASSERT_TRUE(orchestrator->recordAcquisition(
                instrument, quantity(rng), price(rng), date));
        }

        checkConservation(instrument);
    }

    EXPECT_GT(disposals, 0);
}

TEST_F(InventoryPropertiesTest, RandomEditsPreserveInventory) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> quantity(1, 15);
    std::uniform_int_distribution<int> price(50, 200);
    std::uniform_int_distribution<int> dayOffset(0, 365);

    const Date start = makeDate(2024, 1, 1);

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(orchestrator->recordAcquisition(
            "INFY", quantity(rng), price(rng), start + std::chrono::days{dayOffset(rng)}));
    }
    for (int i = 0; i < 10; ++i) {
        auto result = orchestrator->recordDisposal(
            "INFY", quantity(rng), price(rng), start + std::chrono::days{dayOffset(rng)});
        if (!result) {
            EXPECT_EQ(result.error().kind, ErrorKind::InsufficientInventory);
        }
    }
    checkConservation("INFY");

    std::uniform_int_distribution<int> field(0, 3);
    int committed = 0;
    int rejected = 0;

    for (int step = 0; step < 150; ++step) {
        auto records = db->listTransactions("INFY");
        ASSERT_TRUE(records.has_value());
        ASSERT_FALSE(records->empty());

        std::uniform_int_distribution<std::size_t> pick(0, records->size() - 1);
        const auto& target = (*records)[pick(rng)];

        EditRequest request;
        switch (field(rng)) {
        case 0: request.quantity = quantity(rng); break;
        case 1: request.unitPrice = price(rng); break;
        case 2: request.date = start + std::chrono::days{dayOffset(rng)}; break;
        default:
            request.type = target.isAcquisition()
                ? TransactionType::Disposal : TransactionType::Acquisition;
            break;
        }

        auto outcome = editor->commitEdit(target.id, request);
        if (outcome) {
            ++committed;
        } else {
            EXPECT_EQ(outcome.error().kind, ErrorKind::EditRejected)
                << outcome.error().describe();
            ++rejected;
        }

        checkConservation("INFY");
    }

    EXPECT_GT(committed, 0);
    EXPECT_GT(rejected, 0);
}
