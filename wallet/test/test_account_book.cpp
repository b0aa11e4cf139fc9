#include "../AccountBook.h"
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <limits>
#include <thread>
#include <vector>

using namespace paisa;

class AccountBookTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "paisa_account_book_test";
    cleanupTestDir();
  }

  void TearDown() override { cleanupTestDir(); }

  void cleanupTestDir() {
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  static AccountBook::UserProfile profile(const std::string &name,
                                          const std::string &email,
                                          const std::string &phone,
                                          const std::string &upiId) {
    AccountBook::UserProfile p;
    p.name = name;
    p.email = email;
    p.phone = phone;
    p.upiId = upiId;
    return p;
  }

  std::filesystem::path testDir_;
};

TEST_F(AccountBookTest, OpenAccountAssignsSequentialIds) {
  AccountBook book;
  ASSERT_TRUE(book.init({}).isOk());

  auto alice = book.openAccount(profile("Alice", "alice@example.com", "9000000001", "alice@upi"), 100000);
  auto bob = book.openAccount(profile("Bob", "bob@example.com", "9000000002", ""), 0);
  ASSERT_TRUE(alice.isOk());
  ASSERT_TRUE(bob.isOk());
  EXPECT_EQ(alice.value(), AccountBook::ID_FIRST_USER);
  EXPECT_EQ(bob.value(), AccountBook::ID_FIRST_USER + 1);

  auto balance = book.getBalance(alice.value());
  ASSERT_TRUE(balance.isOk());
  EXPECT_EQ(balance.value(), 100000);
  EXPECT_EQ(book.getOpeningBalance(alice.value()).value(), 100000);
}

TEST_F(AccountBookTest, OpenAccountRejectsBadInput) {
  AccountBook book;
  ASSERT_TRUE(book.init({}).isOk());

  auto negative = book.openAccount(profile("A", "a@example.com", "", ""), -1);
  ASSERT_TRUE(negative.isError());
  EXPECT_EQ(negative.error().code, AccountBook::E_INPUT);

  auto anonymous = book.openAccount(profile("Nobody", "", "", ""), 0);
  ASSERT_TRUE(anonymous.isError());
  EXPECT_EQ(anonymous.error().code, AccountBook::E_INPUT);
}

TEST_F(AccountBookTest, OpenAccountRejectsTakenIdentity) {
  AccountBook book;
  ASSERT_TRUE(book.init({}).isOk());
  ASSERT_TRUE(book.openAccount(profile("Alice", "alice@example.com", "9000000001", "alice@upi"), 0).isOk());

  auto sameEmail = book.openAccount(profile("Eve", "ALICE@example.com", "", ""), 0);
  ASSERT_TRUE(sameEmail.isError());
  EXPECT_EQ(sameEmail.error().code, AccountBook::E_ACCOUNT);

  auto samePhone = book.openAccount(profile("Eve", "", "9000000001", ""), 0);
  EXPECT_TRUE(samePhone.isError());

  auto sameUpi = book.openAccount(profile("Eve", "", "", "Alice@UPI"), 0);
  EXPECT_TRUE(sameUpi.isError());

  auto explicitId = profile("Carol", "carol@example.com", "", "");
  explicitId.userId = AccountBook::ID_FIRST_USER;
  auto duplicateId = book.openAccount(explicitId, 0);
  ASSERT_TRUE(duplicateId.isError());
  EXPECT_EQ(duplicateId.error().code, AccountBook::E_ACCOUNT);
}

TEST_F(AccountBookTest, AtomicAdjustDebitsAndCredits) {
  AccountBook book;
  ASSERT_TRUE(book.init({}).isOk());
  uint64_t id = book.openAccount(profile("Alice", "alice@example.com", "", ""), 10000).value();

  auto debited = book.atomicAdjust(id, -2500);
  ASSERT_TRUE(debited.isOk());
  EXPECT_EQ(debited.value(), 7500);

  auto credited = book.atomicAdjust(id, 500);
  ASSERT_TRUE(credited.isOk());
  EXPECT_EQ(credited.value(), 8000);
}

TEST_F(AccountBookTest, AtomicAdjustRefusesOverdraft) {
  AccountBook book;
  ASSERT_TRUE(book.init({}).isOk());
  uint64_t id = book.openAccount(profile("Alice", "alice@example.com", "", ""), 1000).value();

  auto result = book.atomicAdjust(id, -1001);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, AccountBook::E_BALANCE);
  EXPECT_EQ(book.getBalance(id).value(), 1000);

  // Exact drain is allowed
  auto drained = book.atomicAdjust(id, -1000);
  ASSERT_TRUE(drained.isOk());
  EXPECT_EQ(drained.value(), 0);
}

TEST_F(AccountBookTest, AtomicAdjustRejectsOverflowAndUnknownAccount) {
  AccountBook book;
  ASSERT_TRUE(book.init({}).isOk());
  uint64_t id = book.openAccount(profile("Alice", "alice@example.com", "", ""), 1).value();

  auto overflow = book.atomicAdjust(id, std::numeric_limits<int64_t>::max());
  ASSERT_TRUE(overflow.isError());
  EXPECT_EQ(overflow.error().code, AccountBook::E_INPUT);

  auto minimum = book.atomicAdjust(id, std::numeric_limits<int64_t>::min());
  ASSERT_TRUE(minimum.isError());
  EXPECT_EQ(minimum.error().code, AccountBook::E_INPUT);

  auto unknown = book.atomicAdjust(99999, 100);
  ASSERT_TRUE(unknown.isError());
  EXPECT_EQ(unknown.error().code, AccountBook::E_ACCOUNT);
}

TEST_F(AccountBookTest, ConcurrentDebitsNeverOverdraw) {
  AccountBook book;
  ASSERT_TRUE(book.init({}).isOk());
  uint64_t id = book.openAccount(profile("Alice", "alice@example.com", "", ""), 10000).value();

  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  std::atomic<int> succeeded{ 0 };
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPerThread; ++i) {
        if (book.atomicAdjust(id, -100).isOk()) {
          ++succeeded;
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(succeeded.load(), 100);
  EXPECT_EQ(book.getBalance(id).value(), 0);
}

TEST_F(AccountBookTest, FindUserByAnyIdentifier) {
  AccountBook book;
  ASSERT_TRUE(book.init({}).isOk());
  uint64_t id = book.openAccount(profile("Alice", "Alice@Example.com", "9000000001", "alice@okbank"), 0).value();

  EXPECT_EQ(book.findUser("alice@example.com").value(), id);
  EXPECT_EQ(book.findUser("9000000001").value(), id);
  EXPECT_EQ(book.findUser("ALICE@OKBANK").value(), id);

  auto missing = book.findUser("bob@example.com");
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, AccountBook::E_ACCOUNT);

  auto empty = book.findUser("");
  ASSERT_TRUE(empty.isError());
  EXPECT_EQ(empty.error().code, AccountBook::E_INPUT);

  auto p = book.getProfile(id);
  ASSERT_TRUE(p.isOk());
  EXPECT_EQ(p.value().name, "Alice");
}

TEST_F(AccountBookTest, CloseAccount) {
  AccountBook book;
  ASSERT_TRUE(book.init({}).isOk());
  uint64_t id = book.openAccount(profile("Alice", "alice@example.com", "", ""), 0).value();

  EXPECT_TRUE(book.hasAccount(id));
  ASSERT_TRUE(book.closeAccount(id).isOk());
  EXPECT_FALSE(book.hasAccount(id));
  EXPECT_TRUE(book.closeAccount(id).isOk());
  EXPECT_TRUE(book.getAccountIds().empty());
}

TEST_F(AccountBookTest, PersistsAcrossRestart) {
  uint64_t id = 0;
  {
    AccountBook book;
    ASSERT_TRUE(book.init({ testDir_.string() }).isOk());
    id = book.openAccount(profile("Alice", "alice@example.com", "", "alice@upi"), 5000).value();
    ASSERT_TRUE(book.atomicAdjust(id, -1200).isOk());
  }

  AccountBook reopened;
  ASSERT_TRUE(reopened.init({ testDir_.string() }).isOk());
  auto account = reopened.getAccount(id);
  ASSERT_TRUE(account.isOk());
  EXPECT_EQ(account.value().balance, 3800);
  EXPECT_EQ(account.value().openingBalance, 5000);
  EXPECT_EQ(account.value().profile.upiId, "alice@upi");

  auto next = reopened.openAccount(profile("Bob", "bob@example.com", "", ""), 0);
  ASSERT_TRUE(next.isOk());
  EXPECT_EQ(next.value(), id + 1);
}

TEST_F(AccountBookTest, InitRejectsMalformedFile) {
  std::filesystem::create_directories(testDir_);
  {
    std::ofstream out(testDir_ / AccountBook::ACCOUNTS_FILE);
    out << "{\"accounts\": [{\"name\": \"no id\"}]}";
  }

  AccountBook book;
  auto result = book.init({ testDir_.string() });
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, AccountBook::E_STORAGE);
}
