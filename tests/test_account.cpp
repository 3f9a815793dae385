#include "account.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using payments::Account;
using payments::Amount;
using payments::ErrorKind;

namespace {

Amount amt(const char* text) {
  return Amount::parse(text).value();
}

}  // namespace

class AccountTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_FALSE(account_.creditAvailable(amt("100")).has_value());
  }

  Account account_{7};
};

TEST(AccountBasicsTest, StartsEmptyAndUnlocked) {
  Account account(3);
  EXPECT_EQ(account.client(), 3);
  EXPECT_EQ(account.available(), Amount::zero());
  EXPECT_EQ(account.held(), Amount::zero());
  EXPECT_EQ(account.total(), Amount::zero());
  EXPECT_FALSE(account.locked());
}

TEST_F(AccountTest, CreditAndDebit) {
  EXPECT_FALSE(account_.debitAvailable(amt("40")).has_value());
  EXPECT_EQ(account_.available(), amt("60"));
  EXPECT_EQ(account_.total(), amt("60"));

  EXPECT_FALSE(account_.debitAvailable(amt("60")).has_value());
  EXPECT_EQ(account_.available(), Amount::zero());
}

TEST_F(AccountTest, ZeroAmountsAreAccepted) {
  EXPECT_FALSE(account_.creditAvailable(Amount::zero()).has_value());
  EXPECT_FALSE(account_.debitAvailable(Amount::zero()).has_value());
  EXPECT_FALSE(account_.hold(Amount::zero()).has_value());
  account_.release(Amount::zero());
  EXPECT_EQ(account_.available(), amt("100"));
}

TEST_F(AccountTest, RejectsNegativeCreditAndDebit) {
  EXPECT_EQ(account_.creditAvailable(amt("-1")), ErrorKind::NEGATIVE_AMOUNT);
  EXPECT_EQ(account_.debitAvailable(amt("-1")), ErrorKind::NEGATIVE_AMOUNT);
  EXPECT_EQ(account_.available(), amt("100"));
}

TEST_F(AccountTest, RejectsOverdraw) {
  EXPECT_EQ(account_.debitAvailable(amt("100.0001")), ErrorKind::INSUFFICIENT_FUNDS);
  EXPECT_EQ(account_.available(), amt("100"));
}

TEST_F(AccountTest, HoldAndRelease) {
  EXPECT_FALSE(account_.hold(amt("30")).has_value());
  EXPECT_EQ(account_.available(), amt("70"));
  EXPECT_EQ(account_.held(), amt("30"));
  EXPECT_EQ(account_.total(), amt("100"));

  account_.release(amt("30"));
  EXPECT_EQ(account_.available(), amt("100"));
  EXPECT_EQ(account_.held(), Amount::zero());
}

TEST_F(AccountTest, HoldMoreThanAvailableIsRejected) {
  EXPECT_EQ(account_.hold(amt("150")), ErrorKind::INSUFFICIENT_FUNDS);
  EXPECT_EQ(account_.available(), amt("100"));
  EXPECT_EQ(account_.held(), Amount::zero());
}

TEST_F(AccountTest, ChargebackRemovesHeldFundsAndLocks) {
  ASSERT_FALSE(account_.hold(amt("30")).has_value());
  account_.chargeback(amt("30"));

  EXPECT_TRUE(account_.locked());
  EXPECT_EQ(account_.held(), Amount::zero());
  EXPECT_EQ(account_.available(), amt("70"));
  EXPECT_EQ(account_.total(), amt("70"));
}

TEST_F(AccountTest, LockedAccountRejectsCreditAndDebitButAllowsHold) {
  ASSERT_FALSE(account_.hold(amt("30")).has_value());
  account_.chargeback(amt("30"));

  EXPECT_EQ(account_.creditAvailable(amt("10")), ErrorKind::ACCOUNT_LOCKED);
  EXPECT_EQ(account_.debitAvailable(amt("10")), ErrorKind::ACCOUNT_LOCKED);
  EXPECT_FALSE(account_.hold(amt("10")).has_value());
  EXPECT_EQ(account_.held(), amt("10"));
}

TEST_F(AccountTest, ReleaseOrChargebackBeyondHeldIsALogicError) {
  ASSERT_FALSE(account_.hold(amt("10")).has_value());
  EXPECT_THROW(account_.release(amt("10.0001")), std::logic_error);
  EXPECT_THROW(account_.chargeback(amt("11")), std::logic_error);
  EXPECT_THROW(account_.hold(amt("-1")), std::logic_error);

  EXPECT_EQ(account_.held(), amt("10"));
  EXPECT_FALSE(account_.locked());
}
