#ifndef PAISA_PAYMENT_PAYMENT_PROCESSOR_H
#define PAISA_PAYMENT_PAYMENT_PROCESSOR_H

#include "Analytics.h"
#include "BalanceAccessor.h"
#include "LedgerStore.h"
#include "Module.h"
#include "ResultOrError.hpp"
#include "SettlementGateway.h"
#include "Transaction.h"
#include "VerificationGate.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace paisa {

/**
 * PaymentProcessor - drives every money movement through
 * validate -> verify -> resolve -> funds check -> record -> mutate -> finalize.
 *
 * Responsibilities:
 * - Refuse bad or unauthorized requests before anything is recorded
 * - Keep ledger entries and wallet balances consistent; every failure after
 *   an entry exists ends in failed (effect reversed) or on_hold (needs an
 *   operator), never in a silent half-applied state
 * - Serialize all balance work per user through a lock table
 * - Answer statement and analytics queries on behalf of an owner
 *
 * Collaborators are injected and must outlive the processor.
 */
class PaymentProcessor : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
    // Caller may resubmit the same request
    bool retryable{ false };
    // Set once the failure happened after the entry was recorded
    std::string transactionId;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_VALIDATION = 1;
  constexpr static int32_t E_AUTHENTICATION = 2;
  constexpr static int32_t E_COUNTERPARTY_NOT_FOUND = 3;
  constexpr static int32_t E_INVALID_OPERATION = 4;
  constexpr static int32_t E_INSUFFICIENT_FUNDS = 5;
  constexpr static int32_t E_PERSISTENCE = 6;
  constexpr static int32_t E_SETTLEMENT_FAILED = 7;
  constexpr static int32_t E_NOT_FOUND = 8;
  constexpr static int32_t E_SETTLEMENT_TIMEOUT = 9;

  // errorDetails.code values written on failed entries
  constexpr static const char *CODE_VALIDATION = "VALIDATION";
  constexpr static const char *CODE_INSUFFICIENT_FUNDS = "INSUFFICIENT_FUNDS";
  constexpr static const char *CODE_PERSISTENCE = "PERSISTENCE";
  constexpr static const char *CODE_SETTLEMENT_FAILED = "SETTLEMENT_FAILED";
  constexpr static const char *CODE_SETTLEMENT_TIMEOUT = "SETTLEMENT_TIMEOUT";
  constexpr static const char *CODE_BALANCE_MUTATION = "BALANCE_MUTATION_FAILED";
  // Held transfer whose receiver kept a credit that has no ledger entry
  constexpr static const char *CODE_RECEIVER_UNREVERSED = "RECEIVER_CREDIT_UNREVERSED";

  constexpr static const char *REASON_COMPENSATION_FAILED =
      "Compensation failed; manual reconciliation required";

  struct Config {
    std::string currency{ "INR" };
  };

  /**
   * Generic wallet debit to a party outside the wallet (merchant, biller,
   * operator, UPI handle)
   */
  struct PaymentRequest {
    TransactionType type{ TransactionType::PAYMENT };
    int64_t amount{ 0 };
    int64_t fee{ 0 };
    int64_t tax{ 0 };
    // UPI id, phone, biller or account number of the payee
    std::string counterpart;
    std::string counterpartName;
    AuthProof authProof;
    PaymentMethod method{ PaymentMethod::WALLET };
    PaymentMethodDetails methodDetails;
    std::map<std::string, std::string> metadata;
    std::string externalReferenceId;
    // Optional; a known id returns the existing entry
    std::string transactionId;
    std::string description;
    std::string remarks;
    std::string category;
    // Route through the settlement gateway after the debit
    bool settleExternally{ false };
  };

  struct UpiPaymentRequest {
    std::string recipientUpi;
    int64_t amount{ 0 };
    std::string pin;
    std::string upiApp;
    std::string description;
    std::string externalReferenceId;
  };

  struct BiometricPaymentRequest {
    std::string recipientUpi;
    int64_t amount{ 0 };
    std::string biometricType;
    std::string biometricData;
    std::string description;
    std::string externalReferenceId;
  };

  struct RechargeRequest {
    // mobile, dth, ...
    std::string rechargeType;
    std::string number;
    std::string operatorName;
    std::string plan;
    int64_t amount{ 0 };
    std::string pin;
    std::string externalReferenceId;
  };

  struct CardPaymentRequest {
    int64_t amount{ 0 };
    std::string merchant;
    std::string cardLast4;
    std::string cardBrand;
    std::string description;
    std::string externalReferenceId;
  };

  struct AddMoneyRequest {
    int64_t amount{ 0 };
    // CARD settles through the gateway before the wallet is credited
    PaymentMethod source{ PaymentMethod::BANK_TRANSFER };
    PaymentMethodDetails sourceDetails;
    std::string description;
    std::string externalReferenceId;
  };

  struct TransferRequest {
    // Email, phone or UPI id of the receiver
    std::string recipient;
    int64_t amount{ 0 };
    AuthProof authProof;
    std::string note;
    std::string externalReferenceId;
    std::string transactionId;
  };

  /**
   * Operator decision for an on_hold entry.
   *
   * A held transfer debit is checked against its receiver: failing it is
   * refused once the receiver leg exists, and a receiver credit left without
   * a leg is reversed on failure or recorded as the missing leg on
   * completion.
   */
  struct Resolution {
    // completed or failed
    TransactionStatus outcome{ TransactionStatus::COMPLETED };
    std::string reason;
    std::string actor{ "operator" };
    // Apply the wallet correction the outcome implies: credit back a held
    // debit that fails, credit a held credit that completes
    bool adjustBalance{ true };
  };

  PaymentProcessor(LedgerStore &store, BalanceAccessor &accounts,
                   VerificationGate &gate, SettlementGateway &gateway);
  PaymentProcessor(LedgerStore &store, BalanceAccessor &accounts,
                   VerificationGate &gate, SettlementGateway &gateway,
                   const Config &config);
  ~PaymentProcessor() override = default;

  // ----------------- money movement ---------------------------------
  Roe<Transaction> processPayment(uint64_t ownerId, const PaymentRequest &request);
  Roe<Transaction> processUpiPayment(uint64_t ownerId, const UpiPaymentRequest &request);
  Roe<Transaction> processBiometricPayment(uint64_t ownerId,
                                           const BiometricPaymentRequest &request);
  Roe<Transaction> processRecharge(uint64_t ownerId, const RechargeRequest &request);

  /**
   * Card-funded purchase. Recorded for the owner but never touches the
   * wallet balance.
   */
  Roe<Transaction> processCardPayment(uint64_t ownerId,
                                      const CardPaymentRequest &request);

  Roe<Transaction> addMoney(uint64_t ownerId, const AddMoneyRequest &request);

  /**
   * Peer-to-peer transfer
   * @return the sender's entry; the receiver gets its own completed entry
   */
  Roe<Transaction> processTransfer(uint64_t senderId, const TransferRequest &request);

  /**
   * Reverse a completed wallet debit (payment, recharge, bill payment)
   * @return the refund credit entry
   */
  Roe<Transaction> refundPayment(uint64_t ownerId, const std::string &transactionId,
                                 const std::string &reason);

  Roe<Transaction> resolveHeld(uint64_t ownerId, const std::string &transactionId,
                               const Resolution &resolution);

  /**
   * Drop the lock slot of a user whose account is gone
   */
  void releaseUser(uint64_t userId);
  size_t getLockTableSize() const;

  // ----------------- queries ----------------------------------------
  Roe<LedgerStore::Page> getStatement(uint64_t ownerId,
                                      const LedgerStore::Filter &filter) const;
  Roe<Analytics::Statistics> getStatistics(uint64_t ownerId,
                                           const Analytics::DateRange &range) const;
  Roe<Analytics::MonthlySummary> getMonthlySummary(uint64_t ownerId, int year,
                                                   int month) const;
  Roe<std::vector<Transaction>> searchLedger(uint64_t ownerId,
                                             const std::string &query,
                                             size_t limit) const;
  Roe<Transaction> getTransaction(uint64_t ownerId,
                                  const std::string &transactionId) const;
  Roe<int64_t> getBalance(uint64_t ownerId) const;

  const Analytics &getAnalytics() const { return analytics_; }

private:
  static Error makeError(int32_t code, const std::string &message,
                         const std::string &transactionId = "",
                         bool retryable = false);
  static Error fromStore(const LedgerStore::Error &error,
                         const std::string &transactionId = "");
  static Error fromAccounts(const BalanceAccessor::Error &error);

  std::shared_ptr<std::mutex> userLock(uint64_t userId);

  Roe<void> validateAmount(int64_t amount, int64_t fee, int64_t tax) const;
  Roe<void> verifyAuth(uint64_t userId, const AuthProof &proof);
  Roe<PartyDetails> ownerParty(uint64_t userId) const;

  /**
   * Existing entry for a retried request, looked up by external reference
   * and then by transaction id. Caller holds the owner's lock.
   */
  Roe<std::optional<Transaction>> findExisting(uint64_t ownerId,
                                               const std::string &externalReferenceId,
                                               const std::string &transactionId) const;

  /**
   * Outcome of a retried request: the entry when it completed, otherwise
   * the error its stored status and errorDetails describe
   */
  Roe<Transaction> replayExisting(const Transaction &existing) const;

  Roe<Transaction> executeDebit(uint64_t ownerId, LedgerStore::Draft draft,
                                bool settleExternally);

  SettlementGateway::Roe<SettlementGateway::Receipt> settle(const Transaction &entry);

  /**
   * Reverse an applied balance change. Moves the entry to on_hold when the
   * reversal itself fails.
   * @return true if the reversal succeeded
   */
  bool compensate(const Transaction &entry, uint64_t userId, int64_t delta,
                  const char *holdCode = CODE_BALANCE_MUTATION);

  void markFailed(const Transaction &entry, const std::string &code,
                  const std::string &message, bool retryable);
  void markOnHold(const Transaction &entry, const std::string &reason,
                  const std::optional<ErrorDetails> &details);

  /**
   * Completed credit leg written for a transfer's receiver, if any
   */
  std::optional<Transaction> findReceiverLeg(const Transaction &senderEntry) const;

  LedgerStore::Draft receiverLegDraft(const Transaction &senderEntry, uint64_t receiverId,
                                      std::optional<int64_t> receiverBalanceAfter) const;

  /**
   * Refund credits already recorded against an original debit
   */
  std::vector<Transaction> findRefunds(uint64_t ownerId,
                                       const std::string &originalTransactionId) const;

  LedgerStore &store_;
  BalanceAccessor &accounts_;
  VerificationGate &gate_;
  SettlementGateway &gateway_;
  Analytics analytics_;
  Config config_;

  mutable std::mutex lockTableMutex_;
  std::map<uint64_t, std::shared_ptr<std::mutex>> userLocks_;
};

} // namespace paisa

#endif // PAISA_PAYMENT_PAYMENT_PROCESSOR_H
