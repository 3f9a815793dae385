#include "ledger.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using payments::Amount;
using payments::DisputeStatus;
using payments::ErrorKind;
using payments::Ledger;
using payments::TransactionType;

TEST(DisputeStatusTest, OnlyFourTransitionsAreLegal) {
  const DisputeStatus all[] = {DisputeStatus::NORMAL, DisputeStatus::DISPUTED,
                               DisputeStatus::RESOLVED, DisputeStatus::CHARGED_BACK};
  int legal = 0;
  for (auto from : all) {
    for (auto to : all) {
      if (payments::isValidTransition(from, to)) ++legal;
    }
  }
  EXPECT_EQ(legal, 4);

  EXPECT_TRUE(payments::isValidTransition(DisputeStatus::NORMAL, DisputeStatus::DISPUTED));
  EXPECT_TRUE(payments::isValidTransition(DisputeStatus::RESOLVED, DisputeStatus::DISPUTED));
  EXPECT_TRUE(payments::isValidTransition(DisputeStatus::DISPUTED, DisputeStatus::RESOLVED));
  EXPECT_TRUE(payments::isValidTransition(DisputeStatus::DISPUTED, DisputeStatus::CHARGED_BACK));
}

class LedgerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(ledger_.insert(1, 10, TransactionType::DEPOSIT, Amount::fromUnits(500000)));
    ASSERT_TRUE(ledger_.insert(2, 10, TransactionType::WITHDRAWAL, Amount::fromUnits(100000)));
  }

  Ledger ledger_;
};

TEST_F(LedgerTest, InsertedEntriesStartNormal) {
  const auto* entry = ledger_.find(1);
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->client, 10);
  EXPECT_EQ(entry->kind, TransactionType::DEPOSIT);
  EXPECT_EQ(entry->amount, Amount::fromUnits(500000));
  EXPECT_EQ(entry->status, DisputeStatus::NORMAL);
  EXPECT_EQ(ledger_.size(), 2u);
}

TEST_F(LedgerTest, DuplicateInsertIsRefusedAndKeepsOriginal) {
  EXPECT_FALSE(ledger_.insert(1, 11, TransactionType::DEPOSIT, Amount::fromUnits(1)));
  EXPECT_EQ(ledger_.find(1)->client, 10);
  EXPECT_EQ(ledger_.size(), 2u);
}

TEST_F(LedgerTest, OnlyValueMovingKindsCanBeRecorded) {
  EXPECT_THROW(ledger_.insert(3, 10, TransactionType::DISPUTE, Amount::zero()),
               std::invalid_argument);
  EXPECT_FALSE(ledger_.contains(3));
}

TEST_F(LedgerTest, FullLifecycleWithRedispute) {
  EXPECT_FALSE(ledger_.transition(1, DisputeStatus::DISPUTED).has_value());
  EXPECT_EQ(ledger_.disputedTotal(10), Amount::fromUnits(500000));
  EXPECT_FALSE(ledger_.transition(1, DisputeStatus::RESOLVED).has_value());
  EXPECT_EQ(ledger_.disputedTotal(10), Amount::zero());
  EXPECT_FALSE(ledger_.transition(1, DisputeStatus::DISPUTED).has_value());
  EXPECT_FALSE(ledger_.transition(1, DisputeStatus::CHARGED_BACK).has_value());
  EXPECT_EQ(ledger_.find(1)->status, DisputeStatus::CHARGED_BACK);
}

TEST_F(LedgerTest, IllegalTransitionsLeaveStatusUnchanged) {
  EXPECT_EQ(ledger_.transition(1, DisputeStatus::RESOLVED), ErrorKind::INVALID_DISPUTE_STATE);
  EXPECT_EQ(ledger_.transition(1, DisputeStatus::CHARGED_BACK),
            ErrorKind::INVALID_DISPUTE_STATE);
  EXPECT_EQ(ledger_.find(1)->status, DisputeStatus::NORMAL);

  ASSERT_FALSE(ledger_.transition(1, DisputeStatus::DISPUTED).has_value());
  EXPECT_EQ(ledger_.transition(1, DisputeStatus::DISPUTED), ErrorKind::INVALID_DISPUTE_STATE);
  ASSERT_FALSE(ledger_.transition(1, DisputeStatus::CHARGED_BACK).has_value());

  EXPECT_EQ(ledger_.transition(1, DisputeStatus::DISPUTED), ErrorKind::INVALID_DISPUTE_STATE);
  EXPECT_EQ(ledger_.transition(1, DisputeStatus::RESOLVED), ErrorKind::INVALID_DISPUTE_STATE);
  EXPECT_EQ(ledger_.find(1)->status, DisputeStatus::CHARGED_BACK);
}

TEST_F(LedgerTest, UnknownTransaction) {
  EXPECT_EQ(ledger_.find(99), nullptr);
  EXPECT_EQ(ledger_.transition(99, DisputeStatus::DISPUTED), ErrorKind::UNKNOWN_TRANSACTION);
}
