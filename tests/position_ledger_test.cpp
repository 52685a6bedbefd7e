// =============================================================================
// position_ledger_test.cpp
// =============================================================================
// Unit tests for optexec::store::PositionLedger.
//
// Validates:
//   - Quantity-weighted average entry across several entry fills
//   - Exit fills realize PnL, are clamped to the open quantity and close
//     the aggregate at zero
//   - Mark-to-market drives unrealized and net PnL
//   - A new entry on a CLOSED symbol starts a fresh aggregate
//   - closedPositions() lists superseded and current CLOSED aggregates
// =============================================================================

#include "fake_broker.hpp"

#include "optexec/store/position_ledger.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using optexec::domain::AggregateStatus;
using optexec::domain::ExitReason;

class PositionLedgerTest : public ::testing::Test {
 protected:
  optexec::store::PositionLedger ledger;
  optexec::domain::Contract ce =
      optexec::testing::makeOption("NIFTY25000CE", "40001");
};

// -----------------------------------------------------------------------------
// 1. 30 @ 100 then 20 @ 110 -> 50 @ 104.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, WeightedAverageEntry) {
  ledger.applyEntryFill(ce, 1, 30, 100.0);
  ledger.applyEntryFill(ce, 1, 20, 110.0);

  auto pos = ledger.position(ce.symbol);
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->status, AggregateStatus::Open);
  EXPECT_EQ(pos->open_quantity, 50);
  EXPECT_EQ(pos->opened_quantity, 50);
  EXPECT_DOUBLE_EQ(pos->average_entry_price, 104.0);
  ASSERT_EQ(pos->entry_order_ids.size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Fill arrival order does not change the average.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, AverageIndependentOfFillOrder) {
  optexec::store::PositionLedger other;
  ledger.applyEntryFill(ce, 1, 30, 100.0);
  ledger.applyEntryFill(ce, 2, 20, 110.0);
  other.applyEntryFill(ce, 2, 20, 110.0);
  other.applyEntryFill(ce, 1, 30, 100.0);

  EXPECT_DOUBLE_EQ(ledger.position(ce.symbol)->average_entry_price,
                   other.position(ce.symbol)->average_entry_price);
}

// -----------------------------------------------------------------------------
// 3. Partial exit realizes on the closed part; the rest stays open.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, PartialExitRealizesPnl) {
  ledger.applyEntryFill(ce, 1, 50, 100.0);
  ledger.applyExitFill(ce, 2, 20, 90.0, ExitReason::StopLoss);

  auto pos = ledger.position(ce.symbol);
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->status, AggregateStatus::Open);
  EXPECT_EQ(pos->open_quantity, 30);
  EXPECT_EQ(pos->closed_quantity, 20);
  EXPECT_DOUBLE_EQ(pos->realized_pnl, -200.0);
  EXPECT_DOUBLE_EQ(pos->average_exit_price, 90.0);
  ASSERT_TRUE(pos->last_exit_reason.has_value());
  EXPECT_EQ(*pos->last_exit_reason, ExitReason::StopLoss);
}

// -----------------------------------------------------------------------------
// 4. An oversized exit is clamped and closes the position.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ExitClampedToOpenQuantity) {
  ledger.applyEntryFill(ce, 1, 50, 100.0);
  ledger.applyExitFill(ce, 2, 80, 120.0, ExitReason::Target);

  auto pos = ledger.position(ce.symbol);
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->status, AggregateStatus::Closed);
  EXPECT_EQ(pos->open_quantity, 0);
  EXPECT_EQ(pos->closed_quantity, 50);
  EXPECT_DOUBLE_EQ(pos->realized_pnl, 1000.0);
  EXPECT_DOUBLE_EQ(pos->unrealized_pnl, 0.0);
  EXPECT_DOUBLE_EQ(pos->net_pnl, 1000.0);
}

// -----------------------------------------------------------------------------
// 5. Exit fills without an open aggregate are ignored.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ExitWithoutPositionIgnored) {
  ledger.applyExitFill(ce, 2, 10, 100.0, ExitReason::Manual);
  EXPECT_FALSE(ledger.position(ce.symbol).has_value());
  EXPECT_DOUBLE_EQ(ledger.realizedPnl(), 0.0);
}

// -----------------------------------------------------------------------------
// 6. Marks move unrealized PnL; net is realized + unrealized.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, MarkToMarket) {
  ledger.applyEntryFill(ce, 1, 50, 100.0);
  ledger.applyExitFill(ce, 2, 10, 110.0, ExitReason::Manual);
  ledger.markToMarket(ce, 95.0);

  auto pos = ledger.position(ce.symbol);
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->last_price, 95.0);
  EXPECT_DOUBLE_EQ(pos->realized_pnl, 100.0);
  EXPECT_DOUBLE_EQ(pos->unrealized_pnl, -200.0);
  EXPECT_DOUBLE_EQ(pos->net_pnl, -100.0);
}

// -----------------------------------------------------------------------------
// 7. Re-entering a closed symbol starts a fresh aggregate and keeps history.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ReentryAfterCloseStartsFresh) {
  ledger.applyEntryFill(ce, 1, 50, 100.0);
  ledger.applyExitFill(ce, 2, 50, 110.0, ExitReason::Target);
  ledger.applyEntryFill(ce, 3, 25, 200.0);

  auto pos = ledger.position(ce.symbol);
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->status, AggregateStatus::Open);
  EXPECT_EQ(pos->opened_quantity, 25);
  EXPECT_DOUBLE_EQ(pos->average_entry_price, 200.0);
  EXPECT_DOUBLE_EQ(pos->realized_pnl, 0.0);

  auto closed = ledger.closedPositions();
  ASSERT_EQ(closed.size(), 1u);
  EXPECT_DOUBLE_EQ(closed[0].realized_pnl, 500.0);
  EXPECT_DOUBLE_EQ(ledger.realizedPnl(), 500.0);
  EXPECT_EQ(ledger.getSnapshots().size(), 1u);
}

// -----------------------------------------------------------------------------
// 7b. A symbol closed without re-entry is listed with the closed aggregates.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ClosedPositionsIncludeCurrentClosedAggregate) {
  auto pe = optexec::testing::makeOption("NIFTY25000PE", "40002", 25, 25000.0,
                                         optexec::domain::OptionType::Put);
  ledger.applyEntryFill(ce, 1, 50, 100.0);
  ledger.applyExitFill(ce, 2, 50, 79.0, ExitReason::StopLoss);
  ledger.applyEntryFill(pe, 3, 25, 60.0);

  auto closed = ledger.closedPositions();
  ASSERT_EQ(closed.size(), 1u);
  EXPECT_EQ(closed[0].symbol, ce.symbol);
  EXPECT_EQ(closed[0].status, AggregateStatus::Closed);
  EXPECT_DOUBLE_EQ(closed[0].realized_pnl, -1050.0);
}

// -----------------------------------------------------------------------------
// 8. Non-positive quantities are ignored.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, NonPositiveQuantityIgnored) {
  ledger.applyEntryFill(ce, 1, 0, 100.0);
  ledger.applyEntryFill(ce, 1, -5, 100.0);
  EXPECT_FALSE(ledger.position(ce.symbol).has_value());
}

// -----------------------------------------------------------------------------
// 9. Concurrent writers on distinct symbols and a reader do not corrupt the
//    table.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ConcurrentWritersAndReader) {
  auto pe = optexec::testing::makeOption("NIFTY25000PE", "40002", 25, 25000.0,
                                         optexec::domain::OptionType::Put);
  constexpr int kFills = 200;

  std::thread a([&] {
    for (int i = 0; i < kFills; ++i) ledger.applyEntryFill(ce, 1, 1, 100.0);
  });
  std::thread b([&] {
    for (int i = 0; i < kFills; ++i) ledger.applyEntryFill(pe, 2, 1, 50.0);
  });
  std::thread reader([&] {
    for (int i = 0; i < kFills; ++i) (void)ledger.getSnapshots();
  });
  a.join();
  b.join();
  reader.join();

  EXPECT_EQ(ledger.position(ce.symbol)->open_quantity, kFills);
  EXPECT_EQ(ledger.position(pe.symbol)->open_quantity, kFills);
}
