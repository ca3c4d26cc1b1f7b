/**
 * @file transaction_test.cpp
 * @brief Unit tests for Transaction
 */

#include <gtest/gtest.h>

#include <type_traits>
#include <utility>

#include "transaction/transaction.hpp"

namespace schemata {
namespace {

TEST(TransactionTest, CreateTransaction) {
  Transaction txn(1, 7);

  EXPECT_EQ(txn.txn_id(), 1u);
  EXPECT_EQ(txn.read_version(), 7u);
  EXPECT_EQ(txn.state(), TransactionState::ACTIVE);
  EXPECT_TRUE(txn.is_active());
}

TEST(TransactionTest, Commit) {
  Transaction txn(1, 1);
  txn.commit();

  EXPECT_EQ(txn.state(), TransactionState::COMMITTED);
  EXPECT_FALSE(txn.is_active());
  EXPECT_EQ(txn.read_version(), 1u);
}

TEST(TransactionTest, Abort) {
  Transaction txn(2, 1);
  txn.abort();

  EXPECT_EQ(txn.state(), TransactionState::ABORTED);
  EXPECT_FALSE(txn.is_active());
}

TEST(TransactionTest, MoveKeepsSnapshot) {
  Transaction txn(3, 4);
  Transaction moved(std::move(txn));

  EXPECT_EQ(moved.txn_id(), 3u);
  EXPECT_EQ(moved.read_version(), 4u);
  EXPECT_TRUE(moved.is_active());
}

TEST(TransactionTest, NotCopyable) {
  EXPECT_FALSE(std::is_copy_constructible_v<Transaction>);
  EXPECT_FALSE(std::is_copy_assignable_v<Transaction>);
  EXPECT_TRUE(std::is_move_constructible_v<Transaction>);
}

TEST(TransactionTest, StateToString) {
  EXPECT_STREQ(transaction_state_to_string(TransactionState::ACTIVE), "ACTIVE");
  EXPECT_STREQ(transaction_state_to_string(TransactionState::COMMITTED),
               "COMMITTED");
  EXPECT_STREQ(transaction_state_to_string(TransactionState::ABORTED),
               "ABORTED");
}

} // namespace
} // namespace schemata
