#include "../PaymentProcessor.h"
#include "AccountBook.h"
#include "CredentialVault.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sodium.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace paisa;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;

namespace {

// 2024-03-01 10:00:00 UTC
constexpr int64_t MARCH_1_2024_10AM = 1709287200000LL;
constexpr int64_t HOUR_MS = 3600 * 1000LL;

class MockBalanceAccessor : public BalanceAccessor {
public:
  MOCK_METHOD(Roe<int64_t>, getBalance, (uint64_t userId), (const, override));
  MOCK_METHOD(Roe<int64_t>, atomicAdjust, (uint64_t userId, int64_t delta), (override));
  MOCK_METHOD(Roe<uint64_t>, findUser, (const std::string &identifier), (const, override));
  MOCK_METHOD(Roe<UserProfile>, getProfile, (uint64_t userId), (const, override));

  void delegateTo(AccountBook &book) {
    ON_CALL(*this, getBalance(_)).WillByDefault([&book](uint64_t id) {
      return book.getBalance(id);
    });
    ON_CALL(*this, atomicAdjust(_, _)).WillByDefault([&book](uint64_t id, int64_t delta) {
      return book.atomicAdjust(id, delta);
    });
    ON_CALL(*this, findUser(_)).WillByDefault([&book](const std::string &identifier) {
      return book.findUser(identifier);
    });
    ON_CALL(*this, getProfile(_)).WillByDefault([&book](uint64_t id) {
      return book.getProfile(id);
    });
  }
};

class MockGateway : public SettlementGateway {
public:
  MOCK_METHOD(Roe<Receipt>, settle, (const Request &request), (override));
};

SettlementGateway::Receipt receipt(const std::string &reference) {
  SettlementGateway::Receipt r;
  r.gatewayReference = reference;
  return r;
}

} // namespace

class PaymentProcessorTest : public ::testing::Test {
protected:
  void SetUp() override {
    clockMs_ = MARCH_1_2024_10AM;

    LedgerStore::InitConfig storeConfig;
    storeConfig.clock = [this] { return clockMs_.load(); };
    // Generated ids can be forced onto a taken one to make store writes fail
    storeConfig.idGenerator = [this](int64_t nowMs) {
      return collideIds_ ? std::string(TAKEN_ID) : LedgerStore::generateTransactionId(nowMs);
    };
    ASSERT_TRUE(store_.init(storeConfig).isOk());
    ASSERT_TRUE(book_.init({}).isOk());

    CredentialVault::InitConfig vaultConfig;
    vaultConfig.opsLimit = crypto_pwhash_OPSLIMIT_MIN;
    vaultConfig.memLimit = crypto_pwhash_MEMLIMIT_MIN;
    ASSERT_TRUE(vault_.init(vaultConfig).isOk());

    accounts_.delegateTo(book_);
    ON_CALL(gateway_, settle(_)).WillByDefault(Return(receipt("pi_TESTREFERENCE")));

    processor_ = std::make_unique<PaymentProcessor>(store_, accounts_, vault_, gateway_);

    alice_ = openUser("Alice", "alice@example.com", "9000000001", "alice@okbank", 100000, "1234");
    bob_ = openUser("Bob", "bob@example.com", "9000000002", "bob@okbank", 20000, "5678");
  }

  uint64_t openUser(const std::string &name, const std::string &email,
                    const std::string &phone, const std::string &upiId,
                    int64_t balance, const std::string &pin) {
    AccountBook::UserProfile profile;
    profile.name = name;
    profile.email = email;
    profile.phone = phone;
    profile.upiId = upiId;
    auto id = book_.openAccount(profile, balance);
    EXPECT_TRUE(id.isOk());
    EXPECT_TRUE(vault_.enrollPin(id.value(), pin).isOk());
    return id.value();
  }

  static AuthProof pin(const std::string &secret) {
    AuthProof proof;
    proof.method = AuthMethod::PIN;
    proof.secret = secret;
    return proof;
  }

  static PaymentProcessor::TransferRequest transfer(const std::string &recipient,
                                                    int64_t amount,
                                                    const std::string &secret) {
    PaymentProcessor::TransferRequest request;
    request.recipient = recipient;
    request.amount = amount;
    request.authProof = pin(secret);
    return request;
  }

  static PaymentProcessor::UpiPaymentRequest upi(const std::string &recipient,
                                                 int64_t amount,
                                                 const std::string &secret) {
    PaymentProcessor::UpiPaymentRequest request;
    request.recipientUpi = recipient;
    request.amount = amount;
    request.pin = secret;
    return request;
  }

  static PaymentProcessor::RechargeRequest recharge(int64_t amount,
                                                    const std::string &secret) {
    PaymentProcessor::RechargeRequest request;
    request.rechargeType = "mobile";
    request.number = "9811122233";
    request.operatorName = "Airtel";
    request.plan = "28 days unlimited";
    request.amount = amount;
    request.pin = secret;
    return request;
  }

  int64_t balanceOf(uint64_t userId) { return book_.getBalance(userId).value(); }

  // Reserve TAKEN_ID and make every later generated id collide with it
  void failGeneratedIds() {
    LedgerStore::Draft d;
    d.ownerId = 999;
    d.type = TransactionType::PAYMENT;
    d.paymentMethod = PaymentMethod::WALLET;
    d.amount = 1;
    d.transactionId = TAKEN_ID;
    ASSERT_TRUE(store_.create(d).isOk());
    collideIds_ = true;
  }

  size_t entriesOf(uint64_t userId) {
    return store_.findByOwner(userId, LedgerStore::Filter()).value().total;
  }

  Transaction entryOf(const std::string &transactionId) {
    return store_.findByTransactionId(transactionId).value();
  }

  void expectReconciled(uint64_t userId) {
    auto result = processor_->getAnalytics().reconcile(
        userId, book_.getOpeningBalance(userId).value(), balanceOf(userId));
    EXPECT_TRUE(result.balanced) << "user " << userId << " expected " << result.expected
                                 << " actual " << result.actual;
  }

  static constexpr const char *TAKEN_ID = "TXNTAKEN";

  std::atomic<int64_t> clockMs_{ 0 };
  std::atomic<bool> collideIds_{ false };
  LedgerStore store_;
  AccountBook book_;
  CredentialVault vault_;
  NiceMock<MockBalanceAccessor> accounts_;
  NiceMock<MockGateway> gateway_;
  std::unique_ptr<PaymentProcessor> processor_;
  uint64_t alice_{ 0 };
  uint64_t bob_{ 0 };
};

TEST_F(PaymentProcessorTest, TransferMovesFundsAndWritesBothLegs) {
  auto result = processor_->processTransfer(alice_, transfer("bob@example.com", 50000, "1234"));
  ASSERT_TRUE(result.isOk()) << result.error().message;

  const Transaction &sent = result.value();
  EXPECT_EQ(sent.ownerId, alice_);
  EXPECT_EQ(sent.status, TransactionStatus::COMPLETED);
  EXPECT_EQ(sent.type, TransactionType::TRANSFER);
  EXPECT_EQ(sent.direction, Direction::DEBIT);
  EXPECT_EQ(sent.amount, 50000);
  EXPECT_EQ(sent.balanceBefore, 100000);
  EXPECT_EQ(sent.balanceAfter, 50000);
  EXPECT_EQ(sent.receiverDetails.name, "Bob");
  ASSERT_TRUE(sent.completedAt.has_value());

  auto received = store_.findByOwner(bob_, LedgerStore::Filter());
  ASSERT_TRUE(received.isOk());
  ASSERT_EQ(received.value().entries.size(), 1u);
  const Transaction &leg = received.value().entries[0];
  EXPECT_EQ(leg.status, TransactionStatus::COMPLETED);
  EXPECT_EQ(leg.direction, Direction::CREDIT);
  EXPECT_EQ(leg.type, TransactionType::TRANSFER);
  EXPECT_EQ(leg.amount, 50000);
  EXPECT_EQ(leg.balanceAfter, 70000);
  EXPECT_EQ(leg.senderDetails.name, "Alice");
  EXPECT_EQ(leg.metadata.at("relatedTransactionId"), sent.transactionId);

  EXPECT_EQ(balanceOf(alice_), 50000);
  EXPECT_EQ(balanceOf(bob_), 70000);
  expectReconciled(alice_);
  expectReconciled(bob_);
}

TEST_F(PaymentProcessorTest, TransferWithInsufficientFundsCreatesNoEntry) {
  uint64_t carol = openUser("Carol", "carol@example.com", "", "", 10000, "1111");

  auto result = processor_->processTransfer(carol, transfer("bob@example.com", 50000, "1111"));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PaymentProcessor::E_INSUFFICIENT_FUNDS);
  EXPECT_TRUE(result.error().transactionId.empty());

  EXPECT_EQ(store_.size(), 0u);
  EXPECT_EQ(balanceOf(carol), 10000);
}

TEST_F(PaymentProcessorTest, RechargeWithInvalidPinCreatesNoEntry) {
  EXPECT_CALL(gateway_, settle(_)).Times(0);

  auto result = processor_->processRecharge(alice_, recharge(19900, "0000"));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PaymentProcessor::E_AUTHENTICATION);
  EXPECT_EQ(store_.size(), 0u);
  EXPECT_EQ(balanceOf(alice_), 100000);
}

TEST_F(PaymentProcessorTest, MonthlySummaryOverMarchActivity) {
  ASSERT_TRUE(processor_->processUpiPayment(alice_, upi("grocer@okbank", 10000, "1234")).isOk());
  clockMs_ += 24 * HOUR_MS;
  ASSERT_TRUE(processor_->processUpiPayment(alice_, upi("cafe@okbank", 5000, "1234")).isOk());
  clockMs_ += 24 * HOUR_MS;
  PaymentProcessor::AddMoneyRequest topUp;
  topUp.amount = 30000;
  ASSERT_TRUE(processor_->addMoney(alice_, topUp).isOk());

  auto summary = processor_->getMonthlySummary(alice_, 2024, 3);
  ASSERT_TRUE(summary.isOk());
  EXPECT_EQ(summary.value().totalDebits, 15000);
  EXPECT_EQ(summary.value().totalCredits, 30000);
  EXPECT_EQ(summary.value().netFlow, 15000);
  ASSERT_EQ(summary.value().dailyBreakdown.size(), 3u);
  EXPECT_EQ(summary.value().dailyBreakdown[0].date, "2024-03-01");
  EXPECT_EQ(summary.value().dailyBreakdown[0].debits, 10000);
  EXPECT_EQ(summary.value().dailyBreakdown[2].date, "2024-03-03");
  EXPECT_EQ(summary.value().dailyBreakdown[2].credits, 30000);

  auto badMonth = processor_->getMonthlySummary(alice_, 2024, 13);
  ASSERT_TRUE(badMonth.isError());
  EXPECT_EQ(badMonth.error().code, PaymentProcessor::E_VALIDATION);
}

TEST_F(PaymentProcessorTest, TransferCounterpartyErrors) {
  auto unknown = processor_->processTransfer(alice_, transfer("nobody@example.com", 100, "1234"));
  ASSERT_TRUE(unknown.isError());
  EXPECT_EQ(unknown.error().code, PaymentProcessor::E_COUNTERPARTY_NOT_FOUND);

  auto self = processor_->processTransfer(alice_, transfer("9000000001", 100, "1234"));
  ASSERT_TRUE(self.isError());
  EXPECT_EQ(self.error().code, PaymentProcessor::E_INVALID_OPERATION);

  auto badPin = processor_->processTransfer(alice_, transfer("bob@example.com", 100, "9999"));
  ASSERT_TRUE(badPin.isError());
  EXPECT_EQ(badPin.error().code, PaymentProcessor::E_AUTHENTICATION);

  EXPECT_EQ(store_.size(), 0u);
  EXPECT_EQ(balanceOf(alice_), 100000);
}

TEST_F(PaymentProcessorTest, ValidationFailuresLeaveNoTrace) {
  auto zero = processor_->processUpiPayment(alice_, upi("shop@okbank", 0, "1234"));
  ASSERT_TRUE(zero.isError());
  EXPECT_EQ(zero.error().code, PaymentProcessor::E_VALIDATION);

  auto noPayee = processor_->processUpiPayment(alice_, upi("", 100, "1234"));
  ASSERT_TRUE(noPayee.isError());
  EXPECT_EQ(noPayee.error().code, PaymentProcessor::E_VALIDATION);

  auto noPin = processor_->processUpiPayment(alice_, upi("shop@okbank", 100, ""));
  ASSERT_TRUE(noPin.isError());
  EXPECT_EQ(noPin.error().code, PaymentProcessor::E_VALIDATION);

  auto noRecipient = processor_->processTransfer(alice_, transfer("", 100, "1234"));
  ASSERT_TRUE(noRecipient.isError());
  EXPECT_EQ(noRecipient.error().code, PaymentProcessor::E_VALIDATION);

  PaymentProcessor::PaymentRequest credit;
  credit.type = TransactionType::CASHBACK;
  credit.amount = 100;
  credit.counterpart = "shop@okbank";
  credit.authProof = pin("1234");
  auto wrongType = processor_->processPayment(alice_, credit);
  ASSERT_TRUE(wrongType.isError());
  EXPECT_EQ(wrongType.error().code, PaymentProcessor::E_VALIDATION);

  EXPECT_EQ(store_.size(), 0u);
}

TEST_F(PaymentProcessorTest, UpiPaymentRecordsAuditTrail) {
  auto result = processor_->processUpiPayment(alice_, upi("chai.stall@okbank", 2550, "1234"));
  ASSERT_TRUE(result.isOk()) << result.error().message;

  const Transaction &tx = result.value();
  EXPECT_EQ(tx.paymentMethod, PaymentMethod::UPI);
  EXPECT_EQ(tx.receiverDetails.upiId, "chai.stall@okbank");
  EXPECT_EQ(tx.receiverDetails.name, "chai.stall");
  EXPECT_EQ(tx.metadata.at("recipientId"), "chai.stall@okbank");
  EXPECT_EQ(tx.metadata.at("authMethod"), "pin");
  EXPECT_EQ(tx.description, "UPI payment to chai.stall@okbank");
  EXPECT_EQ(tx.balanceBefore, 100000);
  EXPECT_EQ(tx.balanceAfter, 97450);
  ASSERT_EQ(tx.statusHistory.size(), 2u);
  EXPECT_EQ(tx.statusHistory[0].status, TransactionStatus::PROCESSING);
  EXPECT_EQ(tx.statusHistory[1].status, TransactionStatus::COMPLETED);
  EXPECT_EQ(balanceOf(alice_), 97450);
}

TEST_F(PaymentProcessorTest, FeeAndTaxAreDebitedWithTheAmount) {
  PaymentProcessor::PaymentRequest bill;
  bill.type = TransactionType::BILL_PAYMENT;
  bill.amount = 10000;
  bill.fee = 200;
  bill.tax = 36;
  bill.counterpart = "ELEC-00421";
  bill.counterpartName = "City Power";
  bill.authProof = pin("1234");

  auto result = processor_->processPayment(alice_, bill);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value().totalAmount, 10236);
  EXPECT_EQ(result.value().receiverDetails.accountNumber, "ELEC-00421");
  EXPECT_EQ(balanceOf(alice_), 100000 - 10236);
  expectReconciled(alice_);
}

TEST_F(PaymentProcessorTest, BiometricPaymentUsesEnrolledTemplate) {
  ASSERT_TRUE(vault_.enrollBiometric(alice_, "fingerprint", "alice-ridges").isOk());

  PaymentProcessor::BiometricPaymentRequest request;
  request.recipientUpi = "books@okbank";
  request.amount = 4000;
  request.biometricType = "fingerprint";
  request.biometricData = "alice-ridges";
  auto paid = processor_->processBiometricPayment(alice_, request);
  ASSERT_TRUE(paid.isOk()) << paid.error().message;
  EXPECT_EQ(paid.value().paymentMethod, PaymentMethod::BIOMETRIC);
  EXPECT_EQ(paid.value().paymentMethodDetails.biometricType, "fingerprint");
  EXPECT_EQ(paid.value().metadata.at("authMethod"), "biometric");

  request.biometricData = "someone-else";
  auto refused = processor_->processBiometricPayment(alice_, request);
  ASSERT_TRUE(refused.isError());
  EXPECT_EQ(refused.error().code, PaymentProcessor::E_AUTHENTICATION);
  EXPECT_EQ(store_.size(), 1u);
}

TEST_F(PaymentProcessorTest, ExternalReferenceMakesRetriesIdempotent) {
  auto request = transfer("bob@example.com", 10000, "1234");
  request.externalReferenceId = "client-req-42";

  auto first = processor_->processTransfer(alice_, request);
  auto second = processor_->processTransfer(alice_, request);
  ASSERT_TRUE(first.isOk());
  ASSERT_TRUE(second.isOk());
  EXPECT_EQ(first.value().transactionId, second.value().transactionId);
  EXPECT_EQ(balanceOf(alice_), 90000);
  EXPECT_EQ(balanceOf(bob_), 30000);
  // One sender leg, one receiver leg
  EXPECT_EQ(store_.size(), 2u);

  auto payment = upi("shop@okbank", 500, "1234");
  payment.externalReferenceId = "client-req-42";
  // Same reference from the same owner maps to the existing entry
  auto crossed = processor_->processUpiPayment(alice_, payment);
  ASSERT_TRUE(crossed.isOk());
  EXPECT_EQ(crossed.value().transactionId, first.value().transactionId);
  EXPECT_EQ(balanceOf(alice_), 90000);
}

TEST_F(PaymentProcessorTest, CallerTransactionIdMakesRetriesIdempotent) {
  PaymentProcessor::PaymentRequest request;
  request.amount = 700;
  request.counterpart = "shop@okbank";
  request.authProof = pin("1234");
  request.transactionId = "TXNCALLER0001";

  auto first = processor_->processPayment(alice_, request);
  auto second = processor_->processPayment(alice_, request);
  ASSERT_TRUE(first.isOk());
  ASSERT_TRUE(second.isOk());
  EXPECT_EQ(first.value().transactionId, "TXNCALLER0001");
  EXPECT_EQ(second.value().id, first.value().id);
  EXPECT_EQ(balanceOf(alice_), 99300);

  request.authProof = pin("5678");
  auto stolen = processor_->processPayment(bob_, request);
  ASSERT_TRUE(stolen.isError());
  EXPECT_EQ(stolen.error().code, PaymentProcessor::E_VALIDATION);
}

TEST_F(PaymentProcessorTest, ConcurrentDebitsOfFullBalanceAdmitOne) {
  uint64_t dave = openUser("Dave", "dave@example.com", "", "", 10000, "2468");

  constexpr int kRequests = 12;
  std::atomic<int> succeeded{ 0 };
  std::atomic<int> insufficient{ 0 };
  std::atomic<int> other{ 0 };
  std::vector<std::thread> threads;
  for (int i = 0; i < kRequests; ++i) {
    threads.emplace_back([&] {
      auto result = processor_->processUpiPayment(dave, upi("shop@okbank", 10000, "2468"));
      if (result.isOk()) {
        ++succeeded;
      } else if (result.error().code == PaymentProcessor::E_INSUFFICIENT_FUNDS) {
        ++insufficient;
      } else {
        ++other;
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(succeeded.load(), 1);
  EXPECT_EQ(insufficient.load(), kRequests - 1);
  EXPECT_EQ(other.load(), 0);
  EXPECT_EQ(balanceOf(dave), 0);
  expectReconciled(dave);
}

TEST_F(PaymentProcessorTest, RechargeSettlesWithOperator) {
  SettlementGateway::Request seen;
  EXPECT_CALL(gateway_, settle(_))
      .WillOnce(DoAll(SaveArg<0>(&seen), Return(receipt("pi_OPERATOR"))));

  auto result = processor_->processRecharge(alice_, recharge(19900, "1234"));
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value().type, TransactionType::RECHARGE);
  EXPECT_EQ(result.value().gatewayReference, "pi_OPERATOR");
  EXPECT_EQ(result.value().metadata.at("rechargeType"), "mobile");
  EXPECT_EQ(result.value().metadata.at("plan"), "28 days unlimited");
  EXPECT_EQ(result.value().description, "mobile recharge for 9811122233");
  EXPECT_EQ(seen.reference, result.value().transactionId);
  EXPECT_EQ(seen.amount, 19900);
  EXPECT_EQ(balanceOf(alice_), 100000 - 19900);
}

TEST_F(PaymentProcessorTest, DeclinedSettlementIsReversed) {
  EXPECT_CALL(gateway_, settle(_))
      .WillOnce(Return(SettlementGateway::Error(SettlementGateway::E_DECLINED, "operator rejected")));

  auto result = processor_->processRecharge(alice_, recharge(19900, "1234"));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PaymentProcessor::E_SETTLEMENT_FAILED);
  EXPECT_FALSE(result.error().retryable);
  ASSERT_FALSE(result.error().transactionId.empty());

  Transaction tx = entryOf(result.error().transactionId);
  EXPECT_EQ(tx.status, TransactionStatus::FAILED);
  ASSERT_TRUE(tx.errorDetails.has_value());
  EXPECT_EQ(tx.errorDetails->code, "SETTLEMENT_FAILED");
  EXPECT_FALSE(tx.errorDetails->retryable);
  EXPECT_EQ(balanceOf(alice_), 100000);
  expectReconciled(alice_);
}

TEST_F(PaymentProcessorTest, SettlementTimeoutHoldsEntryUntilResolved) {
  EXPECT_CALL(gateway_, settle(_))
      .WillOnce(Return(SettlementGateway::Error(SettlementGateway::E_TIMEOUT, "no answer")));

  auto result = processor_->processRecharge(alice_, recharge(19900, "1234"));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PaymentProcessor::E_SETTLEMENT_TIMEOUT);
  EXPECT_FALSE(result.error().retryable);
  std::string txid = result.error().transactionId;

  Transaction held = entryOf(txid);
  EXPECT_EQ(held.status, TransactionStatus::ON_HOLD);
  EXPECT_EQ(held.errorDetails->code, "SETTLEMENT_TIMEOUT");
  // Debit stays until an operator decides
  EXPECT_EQ(balanceOf(alice_), 80100);

  PaymentProcessor::Resolution resolution;
  resolution.outcome = TransactionStatus::FAILED;
  resolution.reason = "Operator confirmed no recharge";
  auto resolved = processor_->resolveHeld(alice_, txid, resolution);
  ASSERT_TRUE(resolved.isOk()) << resolved.error().message;
  EXPECT_EQ(resolved.value().status, TransactionStatus::FAILED);
  EXPECT_EQ(resolved.value().statusHistory.back().actor, "operator");
  EXPECT_EQ(balanceOf(alice_), 100000);
  expectReconciled(alice_);

  auto again = processor_->resolveHeld(alice_, txid, resolution);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, PaymentProcessor::E_INVALID_OPERATION);
}

TEST_F(PaymentProcessorTest, ResolveHeldAsCompletedKeepsDebit) {
  EXPECT_CALL(gateway_, settle(_))
      .WillOnce(Return(SettlementGateway::Error(SettlementGateway::E_TIMEOUT, "no answer")));
  auto result = processor_->processRecharge(alice_, recharge(5000, "1234"));
  ASSERT_TRUE(result.isError());

  PaymentProcessor::Resolution resolution;
  resolution.outcome = TransactionStatus::CANCELLED;
  auto invalid = processor_->resolveHeld(alice_, result.error().transactionId, resolution);
  ASSERT_TRUE(invalid.isError());
  EXPECT_EQ(invalid.error().code, PaymentProcessor::E_VALIDATION);

  resolution.outcome = TransactionStatus::COMPLETED;
  auto foreign = processor_->resolveHeld(bob_, result.error().transactionId, resolution);
  ASSERT_TRUE(foreign.isError());
  EXPECT_EQ(foreign.error().code, PaymentProcessor::E_NOT_FOUND);

  auto resolved = processor_->resolveHeld(alice_, result.error().transactionId, resolution);
  ASSERT_TRUE(resolved.isOk());
  EXPECT_EQ(resolved.value().status, TransactionStatus::COMPLETED);
  EXPECT_TRUE(resolved.value().completedAt.has_value());
  EXPECT_EQ(balanceOf(alice_), 95000);
  expectReconciled(alice_);
}

TEST_F(PaymentProcessorTest, CardPaymentLeavesWalletUntouched) {
  PaymentProcessor::CardPaymentRequest request;
  request.amount = 250000;
  request.merchant = "Electronics Hub";
  request.cardLast4 = "4242";
  request.cardBrand = "visa";

  auto paid = processor_->processCardPayment(alice_, request);
  ASSERT_TRUE(paid.isOk()) << paid.error().message;
  EXPECT_EQ(paid.value().status, TransactionStatus::COMPLETED);
  EXPECT_EQ(paid.value().paymentMethod, PaymentMethod::CARD);
  EXPECT_FALSE(paid.value().affectsBalance);
  EXPECT_EQ(paid.value().paymentMethodDetails.cardLast4, "4242");
  EXPECT_EQ(paid.value().gatewayReference, "pi_TESTREFERENCE");
  EXPECT_EQ(balanceOf(alice_), 100000);

  EXPECT_CALL(gateway_, settle(_))
      .WillOnce(Return(SettlementGateway::Error(SettlementGateway::E_DECLINED, "card declined")));
  auto declined = processor_->processCardPayment(alice_, request);
  ASSERT_TRUE(declined.isError());
  EXPECT_EQ(declined.error().code, PaymentProcessor::E_SETTLEMENT_FAILED);
  EXPECT_EQ(entryOf(declined.error().transactionId).status, TransactionStatus::FAILED);
  EXPECT_EQ(balanceOf(alice_), 100000);
  expectReconciled(alice_);
}

TEST_F(PaymentProcessorTest, AddMoneyFromBankAndCard) {
  EXPECT_CALL(gateway_, settle(_)).Times(1);

  PaymentProcessor::AddMoneyRequest bank;
  bank.amount = 50000;
  auto fromBank = processor_->addMoney(bob_, bank);
  ASSERT_TRUE(fromBank.isOk()) << fromBank.error().message;
  EXPECT_EQ(fromBank.value().type, TransactionType::ADD_MONEY);
  EXPECT_EQ(fromBank.value().direction, Direction::CREDIT);
  EXPECT_EQ(fromBank.value().paymentMethod, PaymentMethod::BANK_TRANSFER);
  EXPECT_EQ(fromBank.value().balanceAfter, 70000);

  PaymentProcessor::AddMoneyRequest card;
  card.amount = 10000;
  card.source = PaymentMethod::CARD;
  auto fromCard = processor_->addMoney(bob_, card);
  ASSERT_TRUE(fromCard.isOk()) << fromCard.error().message;
  EXPECT_EQ(fromCard.value().gatewayReference, "pi_TESTREFERENCE");
  EXPECT_EQ(balanceOf(bob_), 80000);

  PaymentProcessor::AddMoneyRequest self;
  self.amount = 100;
  self.source = PaymentMethod::WALLET;
  auto invalid = processor_->addMoney(bob_, self);
  ASSERT_TRUE(invalid.isError());
  EXPECT_EQ(invalid.error().code, PaymentProcessor::E_VALIDATION);
  expectReconciled(bob_);
}

TEST_F(PaymentProcessorTest, HeldCardTopUpCreditsOnResolution) {
  EXPECT_CALL(gateway_, settle(_))
      .WillOnce(Return(SettlementGateway::Error(SettlementGateway::E_TIMEOUT, "no answer")));

  PaymentProcessor::AddMoneyRequest card;
  card.amount = 10000;
  card.source = PaymentMethod::CARD;
  auto held = processor_->addMoney(bob_, card);
  ASSERT_TRUE(held.isError());
  EXPECT_EQ(held.error().code, PaymentProcessor::E_SETTLEMENT_TIMEOUT);
  EXPECT_EQ(balanceOf(bob_), 20000);

  PaymentProcessor::Resolution resolution;
  resolution.outcome = TransactionStatus::COMPLETED;
  auto resolved = processor_->resolveHeld(bob_, held.error().transactionId, resolution);
  ASSERT_TRUE(resolved.isOk());
  EXPECT_EQ(resolved.value().balanceAfter, 30000);
  EXPECT_EQ(balanceOf(bob_), 30000);
  expectReconciled(bob_);
}

TEST_F(PaymentProcessorTest, DebitFailureMarksEntryFailedAndRetryable) {
  EXPECT_CALL(accounts_, atomicAdjust(_, _)).Times(AnyNumber());
  EXPECT_CALL(accounts_, atomicAdjust(alice_, -3000))
      .WillOnce(Return(BalanceAccessor::Error(BalanceAccessor::E_STORAGE, "disk full")))
      .RetiresOnSaturation();

  auto result = processor_->processUpiPayment(alice_, upi("shop@okbank", 3000, "1234"));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PaymentProcessor::E_PERSISTENCE);
  EXPECT_TRUE(result.error().retryable);

  Transaction tx = entryOf(result.error().transactionId);
  EXPECT_EQ(tx.status, TransactionStatus::FAILED);
  EXPECT_EQ(tx.errorDetails->code, "BALANCE_MUTATION_FAILED");
  EXPECT_TRUE(tx.errorDetails->retryable);
  EXPECT_EQ(balanceOf(alice_), 100000);
}

TEST_F(PaymentProcessorTest, ReceiverCreditFailureReversesSenderDebit) {
  EXPECT_CALL(accounts_, atomicAdjust(_, _)).Times(AnyNumber());
  EXPECT_CALL(accounts_, atomicAdjust(bob_, 40000))
      .WillOnce(Return(BalanceAccessor::Error(BalanceAccessor::E_STORAGE, "disk full")))
      .RetiresOnSaturation();

  auto result = processor_->processTransfer(alice_, transfer("bob@okbank", 40000, "1234"));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PaymentProcessor::E_PERSISTENCE);

  Transaction tx = entryOf(result.error().transactionId);
  EXPECT_EQ(tx.status, TransactionStatus::FAILED);
  EXPECT_EQ(tx.errorDetails->code, "BALANCE_MUTATION_FAILED");
  EXPECT_EQ(balanceOf(alice_), 100000);
  EXPECT_EQ(balanceOf(bob_), 20000);
  EXPECT_TRUE(store_.findByOwner(bob_, LedgerStore::Filter()).value().entries.empty());
  expectReconciled(alice_);
  expectReconciled(bob_);
}

TEST_F(PaymentProcessorTest, FailedCompensationPutsEntryOnHold) {
  EXPECT_CALL(accounts_, atomicAdjust(_, _)).Times(AnyNumber());
  EXPECT_CALL(accounts_, atomicAdjust(bob_, 40000))
      .WillOnce(Return(BalanceAccessor::Error(BalanceAccessor::E_STORAGE, "disk full")))
      .RetiresOnSaturation();
  EXPECT_CALL(accounts_, atomicAdjust(alice_, 40000))
      .WillOnce(Return(BalanceAccessor::Error(BalanceAccessor::E_STORAGE, "still full")))
      .RetiresOnSaturation();

  auto result = processor_->processTransfer(alice_, transfer("bob@okbank", 40000, "1234"));
  ASSERT_TRUE(result.isError());

  Transaction tx = entryOf(result.error().transactionId);
  EXPECT_EQ(tx.status, TransactionStatus::ON_HOLD);
  EXPECT_EQ(tx.statusHistory.back().reason, PaymentProcessor::REASON_COMPENSATION_FAILED);
  // Debit was applied and could not be reversed
  EXPECT_EQ(balanceOf(alice_), 60000);

  // Bob was never credited, so the transfer cannot be completed as is
  PaymentProcessor::Resolution resolution;
  resolution.outcome = TransactionStatus::COMPLETED;
  auto refused = processor_->resolveHeld(alice_, tx.transactionId, resolution);
  ASSERT_TRUE(refused.isError());
  EXPECT_EQ(refused.error().code, PaymentProcessor::E_INVALID_OPERATION);

  // The operator can now return the funds
  resolution.outcome = TransactionStatus::FAILED;
  auto resolved = processor_->resolveHeld(alice_, tx.transactionId, resolution);
  ASSERT_TRUE(resolved.isOk()) << resolved.error().message;
  EXPECT_EQ(balanceOf(alice_), 100000);
  expectReconciled(alice_);
}

TEST_F(PaymentProcessorTest, RefundReturnsTotalAndMarksOriginal) {
  PaymentProcessor::PaymentRequest bill;
  bill.type = TransactionType::BILL_PAYMENT;
  bill.amount = 10000;
  bill.fee = 100;
  bill.counterpart = "WATER-17";
  bill.authProof = pin("1234");
  auto paid = processor_->processPayment(alice_, bill);
  ASSERT_TRUE(paid.isOk());
  std::string original = paid.value().transactionId;

  auto refund = processor_->refundPayment(alice_, original, "Duplicate bill");
  ASSERT_TRUE(refund.isOk()) << refund.error().message;
  EXPECT_EQ(refund.value().type, TransactionType::REFUND);
  EXPECT_EQ(refund.value().direction, Direction::CREDIT);
  EXPECT_EQ(refund.value().amount, 10100);
  EXPECT_EQ(refund.value().status, TransactionStatus::COMPLETED);
  EXPECT_EQ(refund.value().metadata.at("originalTransactionId"), original);
  EXPECT_EQ(entryOf(original).status, TransactionStatus::REFUNDED);
  EXPECT_EQ(balanceOf(alice_), 100000);
  expectReconciled(alice_);

  auto again = processor_->refundPayment(alice_, original, "Duplicate bill");
  ASSERT_TRUE(again.isOk());
  EXPECT_EQ(again.value().transactionId, refund.value().transactionId);
  EXPECT_EQ(balanceOf(alice_), 100000);

  auto foreign = processor_->refundPayment(bob_, original, "");
  ASSERT_TRUE(foreign.isError());
  EXPECT_EQ(foreign.error().code, PaymentProcessor::E_NOT_FOUND);
}

TEST_F(PaymentProcessorTest, OnlyCompletedWalletDebitsAreRefundable) {
  auto sent = processor_->processTransfer(alice_, transfer("bob@example.com", 1000, "1234"));
  ASSERT_TRUE(sent.isOk());
  auto transferRefund = processor_->refundPayment(alice_, sent.value().transactionId, "");
  ASSERT_TRUE(transferRefund.isError());
  EXPECT_EQ(transferRefund.error().code, PaymentProcessor::E_INVALID_OPERATION);

  PaymentProcessor::CardPaymentRequest card;
  card.amount = 500;
  auto charged = processor_->processCardPayment(alice_, card);
  ASSERT_TRUE(charged.isOk());
  auto cardRefund = processor_->refundPayment(alice_, charged.value().transactionId, "");
  ASSERT_TRUE(cardRefund.isError());
  EXPECT_EQ(cardRefund.error().code, PaymentProcessor::E_INVALID_OPERATION);
}

TEST_F(PaymentProcessorTest, QueriesAreScopedToOwner) {
  ASSERT_TRUE(processor_->processUpiPayment(alice_, upi("grocer@okbank", 1200, "1234")).isOk());
  clockMs_ += HOUR_MS;
  auto sent = processor_->processTransfer(alice_, transfer("bob@example.com", 3000, "1234"));
  ASSERT_TRUE(sent.isOk());
  clockMs_ += HOUR_MS;
  ASSERT_TRUE(processor_->processUpiPayment(alice_, upi("pharmacy@okbank", 800, "1234")).isOk());

  LedgerStore::Filter filter;
  filter.types = { TransactionType::PAYMENT };
  auto page = processor_->getStatement(alice_, filter);
  ASSERT_TRUE(page.isOk());
  EXPECT_EQ(page.value().total, 2u);
  EXPECT_EQ(page.value().entries[0].receiverDetails.upiId, "pharmacy@okbank");

  auto found = processor_->searchLedger(alice_, "GROCER", 0);
  ASSERT_TRUE(found.isOk());
  ASSERT_EQ(found.value().size(), 1u);

  auto empty = processor_->searchLedger(alice_, "  ", 0);
  ASSERT_TRUE(empty.isError());
  EXPECT_EQ(empty.error().code, PaymentProcessor::E_VALIDATION);

  auto mine = processor_->getTransaction(alice_, sent.value().transactionId);
  ASSERT_TRUE(mine.isOk());
  auto theirs = processor_->getTransaction(bob_, sent.value().transactionId);
  ASSERT_TRUE(theirs.isError());
  EXPECT_EQ(theirs.error().code, PaymentProcessor::E_NOT_FOUND);

  auto stats = processor_->getStatistics(alice_, Analytics::DateRange());
  ASSERT_TRUE(stats.isOk());
  EXPECT_EQ(stats.value().count, 3u);
  EXPECT_EQ(stats.value().totalDebits, 5000);

  auto balance = processor_->getBalance(alice_);
  ASSERT_TRUE(balance.isOk());
  EXPECT_EQ(balance.value(), 95000);
  auto missing = processor_->getBalance(424242);
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, PaymentProcessor::E_NOT_FOUND);
}

TEST_F(PaymentProcessorTest, HistoriesStayMonotonicAndBalancesReconcile) {
  ASSERT_TRUE(processor_->processUpiPayment(alice_, upi("a@okbank", 1000, "1234")).isOk());
  ASSERT_TRUE(processor_->processTransfer(alice_, transfer("bob@example.com", 5000, "1234")).isOk());
  ASSERT_TRUE(processor_->processTransfer(bob_, transfer("alice@example.com", 2000, "5678")).isOk());
  PaymentProcessor::AddMoneyRequest topUp;
  topUp.amount = 7000;
  ASSERT_TRUE(processor_->addMoney(bob_, topUp).isOk());
  auto paid = processor_->processRecharge(bob_, recharge(9900, "5678"));
  ASSERT_TRUE(paid.isOk());
  ASSERT_TRUE(processor_->refundPayment(bob_, paid.value().transactionId, "").isOk());
  EXPECT_TRUE(processor_->processUpiPayment(bob_, upi("b@okbank", 999999, "5678")).isError());

  for (uint64_t owner : { alice_, bob_ }) {
    store_.forEachOwned(owner, [](const Transaction &tx) {
      ASSERT_FALSE(tx.statusHistory.empty());
      for (size_t i = 1; i < tx.statusHistory.size(); ++i) {
        EXPECT_LE(tx.statusHistory[i - 1].timestamp, tx.statusHistory[i].timestamp);
      }
    });
    expectReconciled(owner);
  }
}

TEST_F(PaymentProcessorTest, RetryOfFailedRequestReportsTheFailure) {
  EXPECT_CALL(accounts_, atomicAdjust(_, _)).Times(AnyNumber());
  EXPECT_CALL(accounts_, atomicAdjust(alice_, -3000))
      .WillOnce(Return(BalanceAccessor::Error(BalanceAccessor::E_STORAGE, "disk full")))
      .RetiresOnSaturation();

  auto request = upi("shop@okbank", 3000, "1234");
  request.externalReferenceId = "client-req-77";
  auto first = processor_->processUpiPayment(alice_, request);
  ASSERT_TRUE(first.isError());

  auto retried = processor_->processUpiPayment(alice_, request);
  ASSERT_TRUE(retried.isError());
  EXPECT_EQ(retried.error().code, PaymentProcessor::E_PERSISTENCE);
  EXPECT_TRUE(retried.error().retryable);
  EXPECT_EQ(retried.error().transactionId, first.error().transactionId);
  EXPECT_EQ(entriesOf(alice_), 1u);
  EXPECT_EQ(balanceOf(alice_), 100000);
}

TEST_F(PaymentProcessorTest, RetryOfDeclinedOrHeldRequestIsNotSuccess) {
  EXPECT_CALL(gateway_, settle(_))
      .WillOnce(Return(SettlementGateway::Error(SettlementGateway::E_DECLINED, "operator rejected")))
      .WillOnce(Return(SettlementGateway::Error(SettlementGateway::E_TIMEOUT, "no answer")));

  auto declined = recharge(19900, "1234");
  declined.externalReferenceId = "recharge-1";
  ASSERT_TRUE(processor_->processRecharge(alice_, declined).isError());
  auto again = processor_->processRecharge(alice_, declined);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, PaymentProcessor::E_SETTLEMENT_FAILED);
  EXPECT_FALSE(again.error().retryable);

  auto held = recharge(5000, "1234");
  held.externalReferenceId = "recharge-2";
  ASSERT_TRUE(processor_->processRecharge(alice_, held).isError());
  auto stillHeld = processor_->processRecharge(alice_, held);
  ASSERT_TRUE(stillHeld.isError());
  EXPECT_EQ(stillHeld.error().code, PaymentProcessor::E_SETTLEMENT_TIMEOUT);
  EXPECT_EQ(entryOf(stillHeld.error().transactionId).status, TransactionStatus::ON_HOLD);

  // Gateway saw each request once; retries never reached it
  EXPECT_EQ(balanceOf(alice_), 95000);
}

TEST_F(PaymentProcessorTest, ReceiverLegWriteFailureReversesBothWallets) {
  failGeneratedIds();

  auto request = transfer("bob@example.com", 40000, "1234");
  request.transactionId = "TXNSENDER0001";
  auto result = processor_->processTransfer(alice_, request);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, PaymentProcessor::E_PERSISTENCE);
  EXPECT_TRUE(result.error().retryable);
  EXPECT_EQ(result.error().transactionId, "TXNSENDER0001");

  Transaction tx = entryOf("TXNSENDER0001");
  EXPECT_EQ(tx.status, TransactionStatus::FAILED);
  EXPECT_EQ(tx.errorDetails->code, "PERSISTENCE");
  EXPECT_EQ(balanceOf(alice_), 100000);
  EXPECT_EQ(balanceOf(bob_), 20000);
  EXPECT_EQ(entriesOf(bob_), 0u);
  expectReconciled(alice_);
  expectReconciled(bob_);
}

TEST_F(PaymentProcessorTest, UnreversedReceiverCreditIsTakenBackOnFailure) {
  failGeneratedIds();
  EXPECT_CALL(accounts_, atomicAdjust(_, _)).Times(AnyNumber());
  EXPECT_CALL(accounts_, atomicAdjust(bob_, -40000))
      .WillOnce(Return(BalanceAccessor::Error(BalanceAccessor::E_STORAGE, "disk full")))
      .RetiresOnSaturation();

  auto request = transfer("bob@example.com", 40000, "1234");
  request.transactionId = "TXNSENDER0002";
  auto result = processor_->processTransfer(alice_, request);
  ASSERT_TRUE(result.isError());

  Transaction held = entryOf("TXNSENDER0002");
  EXPECT_EQ(held.status, TransactionStatus::ON_HOLD);
  EXPECT_EQ(held.errorDetails->code, PaymentProcessor::CODE_RECEIVER_UNREVERSED);
  EXPECT_EQ(balanceOf(alice_), 60000);
  EXPECT_EQ(balanceOf(bob_), 60000);

  PaymentProcessor::Resolution resolution;
  resolution.outcome = TransactionStatus::FAILED;
  auto resolved = processor_->resolveHeld(alice_, "TXNSENDER0002", resolution);
  ASSERT_TRUE(resolved.isOk()) << resolved.error().message;
  EXPECT_EQ(resolved.value().status, TransactionStatus::FAILED);
  EXPECT_EQ(balanceOf(alice_), 100000);
  EXPECT_EQ(balanceOf(bob_), 20000);
  expectReconciled(alice_);
  expectReconciled(bob_);
}

TEST_F(PaymentProcessorTest, UnreversedReceiverCreditCompletesWithMissingLeg) {
  failGeneratedIds();
  EXPECT_CALL(accounts_, atomicAdjust(_, _)).Times(AnyNumber());
  EXPECT_CALL(accounts_, atomicAdjust(bob_, -40000))
      .WillOnce(Return(BalanceAccessor::Error(BalanceAccessor::E_STORAGE, "disk full")))
      .RetiresOnSaturation();

  auto request = transfer("bob@example.com", 40000, "1234");
  request.transactionId = "TXNSENDER0003";
  ASSERT_TRUE(processor_->processTransfer(alice_, request).isError());
  collideIds_ = false;

  // Bob spent part of the credit, so it can no longer be taken back
  ASSERT_TRUE(processor_->processUpiPayment(bob_, upi("shop@okbank", 30000, "5678")).isOk());
  PaymentProcessor::Resolution resolution;
  resolution.outcome = TransactionStatus::FAILED;
  auto refused = processor_->resolveHeld(alice_, "TXNSENDER0003", resolution);
  ASSERT_TRUE(refused.isError());
  EXPECT_EQ(refused.error().code, PaymentProcessor::E_INSUFFICIENT_FUNDS);
  EXPECT_EQ(entryOf("TXNSENDER0003").status, TransactionStatus::ON_HOLD);
  EXPECT_EQ(balanceOf(alice_), 60000);
  EXPECT_EQ(balanceOf(bob_), 30000);

  resolution.outcome = TransactionStatus::COMPLETED;
  resolution.actor = "ops:riya";
  auto completed = processor_->resolveHeld(alice_, "TXNSENDER0003", resolution);
  ASSERT_TRUE(completed.isOk()) << completed.error().message;
  EXPECT_EQ(completed.value().status, TransactionStatus::COMPLETED);

  LedgerStore::Filter credits;
  credits.direction = Direction::CREDIT;
  auto legs = store_.findByOwner(bob_, credits).value().entries;
  ASSERT_EQ(legs.size(), 1u);
  EXPECT_EQ(legs[0].amount, 40000);
  EXPECT_EQ(legs[0].status, TransactionStatus::COMPLETED);
  EXPECT_EQ(legs[0].metadata.at("relatedTransactionId"), "TXNSENDER0003");
  EXPECT_EQ(legs[0].statusHistory.front().actor, "ops:riya");

  EXPECT_EQ(balanceOf(alice_), 60000);
  EXPECT_EQ(balanceOf(bob_), 30000);
  expectReconciled(alice_);
  expectReconciled(bob_);
}

TEST_F(PaymentProcessorTest, OppositeTransfersRunConcurrently) {
  constexpr int kRounds = 40;
  std::atomic<int> failures{ 0 };
  std::thread aliceToBob([&] {
    for (int i = 0; i < kRounds; ++i) {
      if (processor_->processTransfer(alice_, transfer("bob@example.com", 300, "1234")).isError()) {
        ++failures;
      }
    }
  });
  std::thread bobToAlice([&] {
    for (int i = 0; i < kRounds; ++i) {
      if (processor_->processTransfer(bob_, transfer("alice@example.com", 100, "5678")).isError()) {
        ++failures;
      }
    }
  });
  aliceToBob.join();
  bobToAlice.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(balanceOf(alice_), 100000 - kRounds * 300 + kRounds * 100);
  EXPECT_EQ(balanceOf(bob_), 20000 + kRounds * 300 - kRounds * 100);
  EXPECT_EQ(entriesOf(alice_), 2u * kRounds);
  EXPECT_EQ(entriesOf(bob_), 2u * kRounds);
  expectReconciled(alice_);
  expectReconciled(bob_);
}
