#include <gtest/gtest.h>
#include "CapitalGainsReport.hpp"
#include "DisposalOrchestrator.hpp"
#include "InMemoryDatabase.hpp"
#include <memory>

using namespace lotledger;

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixtures
// ═══════════════════════════════════════════════════════════════════════════════

class CapitalGainsReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = std::make_shared<InMemoryDatabase>();
        orchestrator = std::make_unique<DisposalOrchestrator>(db);
    }

    void acquire(std::string_view instrument, double quantity, double price, Date date) {
        ASSERT_TRUE(orchestrator->recordAcquisition(instrument, quantity, price, date));
    }

    void dispose(std::string_view instrument, double quantity, double price, Date date) {
        auto result = orchestrator->recordDisposal(instrument, quantity, price, date);
        ASSERT_TRUE(result.has_value()) << result.error().describe();
    }

    std::shared_ptr<InMemoryDatabase> db;
    std::unique_ptr<DisposalOrchestrator> orchestrator;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Границы финансового года
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CapitalGainsReportTest, OnlyDisposalsInsideYearAreReported) {
    acquire("INFY", 30.0, 100.0, makeDate(2024, 1, 1));

    dispose("INFY", 10.0, 110.0, makeDate(2024, 3, 31));   // FY 2023-24
    dispose("INFY", 10.0, 120.0, makeDate(2024, 4, 1));    // FY 2024-25
    dispose("INFY", 10.0, 130.0, makeDate(2025, 4, 1));    // FY 2025-26

    CapitalGainsReporter reporter(db, TaxSettings{});
    auto report = reporter.generate(2024);
    ASSERT_TRUE(report.has_value()) << report.error().describe();

    EXPECT_EQ(report->year.label(), "FY 2024-25");
    ASSERT_EQ(report->shortTermGains.size(), 1u);
    EXPECT_TRUE(report->longTermGains.empty());
    EXPECT_DOUBLE_EQ(report->shortTermTotal, 200.0);
    EXPECT_DOUBLE_EQ(report->totalCost, 1000.0);
    EXPECT_DOUBLE_EQ(report->totalProceeds, 1200.0);
    EXPECT_DOUBLE_EQ(report->netGain(), 200.0);
}

TEST_F(CapitalGainsReportTest, EmptyYear) {
    CapitalGainsReporter reporter(db, TaxSettings{});
    auto report = reporter.generate(2024);
    ASSERT_TRUE(report.has_value());

    EXPECT_TRUE(report->shortTermGains.empty());
    EXPECT_TRUE(report->longTermGains.empty());
    EXPECT_DOUBLE_EQ(report->tax.totalTax(), 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Налог
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CapitalGainsReportTest, ExemptionAppliedToYearPool) {
    // Два долгосрочных дохода по 75 000 = 150 000, порог 100 000
    acquire("INFY", 2000.0, 100.0, makeDate(2022, 1, 1));
    dispose("INFY", 1000.0, 175.0, makeDate(2024, 5, 1));
    dispose("INFY", 1000.0, 175.0, makeDate(2024, 9, 1));

    // Краткосрочный доход 50 000 и убыток
    acquire("TCS", 200.0, 1000.0, makeDate(2024, 4, 10));
    dispose("TCS", 100.0, 1500.0, makeDate(2024, 6, 1));
    dispose("TCS", 100.0, 900.0, makeDate(2024, 7, 1));

    CapitalGainsReporter reporter(db, TaxSettings{});
    auto report = reporter.generate(2024);
    ASSERT_TRUE(report.has_value());

    EXPECT_EQ(report->longTermGains.size(), 2u);
    EXPECT_EQ(report->shortTermGains.size(), 2u);
    EXPECT_DOUBLE_EQ(report->longTermTotal, 150000.0);
    EXPECT_DOUBLE_EQ(report->shortTermTotal, 40000.0);

    EXPECT_DOUBLE_EQ(report->tax.longTax, 5000.0);
    EXPECT_DOUBLE_EQ(report->tax.shortTax, 10000.0);
    EXPECT_DOUBLE_EQ(report->tax.exemptionApplied, 100000.0);
    EXPECT_DOUBLE_EQ(report->tax.totalTax(), 15000.0);
}

TEST_F(CapitalGainsReportTest, InstrumentFilter) {
    acquire("INFY", 10.0, 100.0, makeDate(2024, 4, 1));
    acquire("TCS", 10.0, 100.0, makeDate(2024, 4, 1));
    dispose("INFY", 10.0, 150.0, makeDate(2024, 5, 1));
    dispose("TCS", 10.0, 120.0, makeDate(2024, 5, 1));

    CapitalGainsReporter reporter(db, TaxSettings{});
    auto report = reporter.generate(2024, "TCS");
    ASSERT_TRUE(report.has_value());

    ASSERT_EQ(report->shortTermGains.size(), 1u);
    EXPECT_EQ(report->shortTermGains[0].instrumentId, "TCS");
    EXPECT_DOUBLE_EQ(report->shortTermTotal, 200.0);
}

TEST_F(CapitalGainsReportTest, FilteredReportSharesYearExemption) {
    // По 150 000 долгосрочного дохода на инструмент, порог 100 000 на год
    acquire("INFY", 1000.0, 100.0, makeDate(2022, 1, 1));
    acquire("TCS", 1000.0, 100.0, makeDate(2022, 1, 1));
    dispose("INFY", 1000.0, 250.0, makeDate(2024, 5, 1));
    dispose("TCS", 1000.0, 250.0, makeDate(2024, 6, 1));

    CapitalGainsReporter reporter(db, TaxSettings{});

    auto whole = reporter.generate(2024);
    ASSERT_TRUE(whole.has_value());
    EXPECT_NEAR(whole->tax.longTax, 20000.0, 1e-6);
    EXPECT_TRUE(whole->instrumentFilter.empty());

    auto infy = reporter.generate(2024, "INFY");
    auto tcs = reporter.generate(2024, "TCS");
    ASSERT_TRUE(infy.has_value());
    ASSERT_TRUE(tcs.has_value());

    EXPECT_EQ(infy->instrumentFilter, "INFY");
    EXPECT_NEAR(infy->tax.exemptionApplied, 50000.0, 1e-6);
    EXPECT_NEAR(infy->tax.taxableLongTerm, 100000.0, 1e-6);
    EXPECT_NEAR(infy->tax.longTax, 10000.0, 1e-6);
    EXPECT_NEAR(infy->periodTax.longTax, 20000.0, 1e-6);

    // Доли инструментов складываются в налог года
    EXPECT_NEAR(infy->tax.longTax + tcs->tax.longTax, whole->tax.longTax, 1e-6);
    EXPECT_NEAR(infy->tax.exemptionApplied + tcs->tax.exemptionApplied,
                whole->tax.exemptionApplied, 1e-6);
}

TEST_F(CapitalGainsReportTest, CalendarFiscalYear) {
    acquire("INFY", 10.0, 100.0, makeDate(2024, 1, 1));
    dispose("INFY", 5.0, 110.0, makeDate(2024, 2, 1));
    dispose("INFY", 5.0, 110.0, makeDate(2024, 12, 31));

    TaxSettings settings;
    settings.fiscalYearStartMonth = 1;

    CapitalGainsReporter reporter(db, settings);
    auto report = reporter.generate(2024);
    ASSERT_TRUE(report.has_value());

    EXPECT_EQ(report->year.label(), "FY 2024");
    EXPECT_EQ(report->shortTermGains.size(), 2u);
}

TEST_F(CapitalGainsReportTest, InvalidSettingsAreRejected) {
    TaxSettings settings;
    settings.shortRate = -0.1;

    CapitalGainsReporter reporter(db, settings);
    auto report = reporter.generate(2024);

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(CapitalGainsReportTest, YearOutOfRangeIsRejected) {
    CapitalGainsReporter reporter(db, TaxSettings{});

    auto report = reporter.generate(1800);

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::InvalidArgument);
}
