#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace paisa {

enum class TransactionType {
  PAYMENT,
  TRANSFER,
  ADD_MONEY,
  WITHDRAWAL,
  RECHARGE,
  BILL_PAYMENT,
  REFUND,
  CASHBACK,
  LOAN_DISBURSEMENT,
  LOAN_REPAYMENT
};

enum class Direction { DEBIT, CREDIT };

enum class TransactionStatus {
  PENDING,
  PROCESSING,
  COMPLETED,
  FAILED,
  CANCELLED,
  ON_HOLD,
  REFUNDED
};

enum class PaymentMethod {
  UPI,
  CARD,
  NET_BANKING,
  WALLET,
  BIOMETRIC,
  BANK_TRANSFER,
  CASH
};

// Wire names are the lower-case snake_case forms, e.g. "add_money", "on_hold"
std::string toString(TransactionType type);
std::string toString(Direction direction);
std::string toString(TransactionStatus status);
std::string toString(PaymentMethod method);

bool parseTransactionType(const std::string &str, TransactionType &type);
bool parseDirection(const std::string &str, Direction &direction);
bool parseTransactionStatus(const std::string &str, TransactionStatus &status);
bool parsePaymentMethod(const std::string &str, PaymentMethod &method);

/**
 * Direction implied by a transaction type.
 * add_money, refund, cashback and loan_disbursement credit the wallet;
 * every other type debits it.
 */
Direction inferDirection(TransactionType type);

/**
 * completed, failed, cancelled and refunded are terminal.
 * completed still admits the post-completion move to refunded.
 */
bool isTerminal(TransactionStatus status);

bool isTransitionAllowed(TransactionStatus from, TransactionStatus to);

/**
 * Counterpart identity captured when the entry is created. It is a snapshot
 * and never follows later profile changes.
 */
struct PartyDetails {
  uint64_t userId{ 0 };
  std::string name;
  std::string email;
  std::string phone;
  std::string upiId;
  std::string accountNumber;
  std::string ifscCode;

  bool isEmpty() const;
  nlohmann::json toJson() const;
  static PartyDetails fromJson(const nlohmann::json &j);
};

struct PaymentMethodDetails {
  std::string cardLast4;
  std::string cardBrand;
  std::string upiId;
  std::string upiApp;
  std::string bankName;
  std::string bankAccountLast4;
  std::string walletName;
  std::string biometricType;

  nlohmann::json toJson() const;
  static PaymentMethodDetails fromJson(const nlohmann::json &j);
};

struct ErrorDetails {
  std::string code;
  std::string message;
  bool retryable{ false };

  nlohmann::json toJson() const;
  static ErrorDetails fromJson(const nlohmann::json &j);
};

struct StatusChange {
  TransactionStatus status{ TransactionStatus::PENDING };
  int64_t timestamp{ 0 };
  std::string reason;
  std::string actor;
};

/**
 * One recorded effect on one user's wallet. A transfer produces two of
 * these, one per leg, each owned by a different user.
 */
struct Transaction {
  uint64_t id{ 0 };
  std::string transactionId;
  uint64_t ownerId{ 0 };

  TransactionType type{ TransactionType::PAYMENT };
  Direction direction{ Direction::DEBIT };

  // Minor units (paisa)
  int64_t amount{ 0 };
  int64_t fee{ 0 };
  int64_t tax{ 0 };
  int64_t totalAmount{ 0 };
  std::string currency{ "INR" };

  TransactionStatus status{ TransactionStatus::PENDING };
  std::vector<StatusChange> statusHistory;

  std::string description;
  std::string remarks;
  std::string category;

  PartyDetails senderDetails;
  PartyDetails receiverDetails;

  std::optional<int64_t> balanceBefore;
  std::optional<int64_t> balanceAfter;

  PaymentMethod paymentMethod{ PaymentMethod::WALLET };
  PaymentMethodDetails paymentMethodDetails;

  std::string externalReferenceId;
  std::string gatewayReference;

  std::optional<ErrorDetails> errorDetails;

  // False when funds moved outside the wallet, e.g. a card-funded purchase
  bool affectsBalance{ true };

  std::map<std::string, std::string> metadata;

  int64_t createdAt{ 0 };
  int64_t initiatedAt{ 0 };
  int64_t updatedAt{ 0 };
  std::optional<int64_t> completedAt;

  bool isDebit() const { return direction == Direction::DEBIT; }
  bool isCredit() const { return direction == Direction::CREDIT; }

  /**
   * Signed effect on the owner's wallet when the entry is applied:
   * -totalAmount for debits, +amount for credits, 0 if it does not touch
   * the wallet.
   */
  int64_t balanceEffect() const;

  nlohmann::json toJson() const;

  /**
   * Restore from toJson() output
   * @return true if every required field was present and well-formed
   */
  bool fromJson(const nlohmann::json &j);
};

} // namespace paisa
