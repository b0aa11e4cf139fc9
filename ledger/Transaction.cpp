#include "Transaction.h"

#include <utility>

namespace paisa {

namespace {

template <typename E, size_t N>
std::string nameOf(const std::pair<E, const char *> (&table)[N], E value) {
  for (const auto &[key, name] : table) {
    if (key == value) {
      return name;
    }
  }
  return "unknown";
}

template <typename E, size_t N>
bool valueOf(const std::pair<E, const char *> (&table)[N],
             const std::string &str, E &value) {
  for (const auto &[key, name] : table) {
    if (str == name) {
      value = key;
      return true;
    }
  }
  return false;
}

const std::pair<TransactionType, const char *> TYPE_NAMES[] = {
    { TransactionType::PAYMENT, "payment" },
    { TransactionType::TRANSFER, "transfer" },
    { TransactionType::ADD_MONEY, "add_money" },
    { TransactionType::WITHDRAWAL, "withdrawal" },
    { TransactionType::RECHARGE, "recharge" },
    { TransactionType::BILL_PAYMENT, "bill_payment" },
    { TransactionType::REFUND, "refund" },
    { TransactionType::CASHBACK, "cashback" },
    { TransactionType::LOAN_DISBURSEMENT, "loan_disbursement" },
    { TransactionType::LOAN_REPAYMENT, "loan_repayment" },
};

const std::pair<Direction, const char *> DIRECTION_NAMES[] = {
    { Direction::DEBIT, "debit" },
    { Direction::CREDIT, "credit" },
};

const std::pair<TransactionStatus, const char *> STATUS_NAMES[] = {
    { TransactionStatus::PENDING, "pending" },
    { TransactionStatus::PROCESSING, "processing" },
    { TransactionStatus::COMPLETED, "completed" },
    { TransactionStatus::FAILED, "failed" },
    { TransactionStatus::CANCELLED, "cancelled" },
    { TransactionStatus::ON_HOLD, "on_hold" },
    { TransactionStatus::REFUNDED, "refunded" },
};

const std::pair<PaymentMethod, const char *> METHOD_NAMES[] = {
    { PaymentMethod::UPI, "upi" },
    { PaymentMethod::CARD, "card" },
    { PaymentMethod::NET_BANKING, "net_banking" },
    { PaymentMethod::WALLET, "wallet" },
    { PaymentMethod::BIOMETRIC, "biometric" },
    { PaymentMethod::BANK_TRANSFER, "bank_transfer" },
    { PaymentMethod::CASH, "cash" },
};

// Empty strings are left out of the JSON view
void putIfSet(nlohmann::json &j, const char *key, const std::string &value) {
  if (!value.empty()) {
    j[key] = value;
  }
}

std::string getString(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

} // namespace

std::string toString(TransactionType type) { return nameOf(TYPE_NAMES, type); }
std::string toString(Direction direction) {
  return nameOf(DIRECTION_NAMES, direction);
}
std::string toString(TransactionStatus status) {
  return nameOf(STATUS_NAMES, status);
}
std::string toString(PaymentMethod method) {
  return nameOf(METHOD_NAMES, method);
}

bool parseTransactionType(const std::string &str, TransactionType &type) {
  return valueOf(TYPE_NAMES, str, type);
}
bool parseDirection(const std::string &str, Direction &direction) {
  return valueOf(DIRECTION_NAMES, str, direction);
}
bool parseTransactionStatus(const std::string &str, TransactionStatus &status) {
  return valueOf(STATUS_NAMES, str, status);
}
bool parsePaymentMethod(const std::string &str, PaymentMethod &method) {
  return valueOf(METHOD_NAMES, str, method);
}

Direction inferDirection(TransactionType type) {
  switch (type) {
  case TransactionType::ADD_MONEY:
  case TransactionType::REFUND:
  case TransactionType::CASHBACK:
  case TransactionType::LOAN_DISBURSEMENT:
    return Direction::CREDIT;
  default:
    return Direction::DEBIT;
  }
}

bool isTerminal(TransactionStatus status) {
  switch (status) {
  case TransactionStatus::COMPLETED:
  case TransactionStatus::FAILED:
  case TransactionStatus::CANCELLED:
  case TransactionStatus::REFUNDED:
    return true;
  default:
    return false;
  }
}

bool isTransitionAllowed(TransactionStatus from, TransactionStatus to) {
  using S = TransactionStatus;
  switch (from) {
  case S::PENDING:
    return to == S::PROCESSING || to == S::COMPLETED || to == S::FAILED ||
           to == S::CANCELLED || to == S::ON_HOLD;
  case S::PROCESSING:
    return to == S::COMPLETED || to == S::FAILED || to == S::CANCELLED ||
           to == S::ON_HOLD;
  case S::ON_HOLD:
    return to == S::PROCESSING || to == S::COMPLETED || to == S::FAILED ||
           to == S::CANCELLED;
  case S::COMPLETED:
    return to == S::REFUNDED;
  default:
    return false;
  }
}

// ========== PartyDetails ==========

bool PartyDetails::isEmpty() const {
  return userId == 0 && name.empty() && email.empty() && phone.empty() &&
         upiId.empty() && accountNumber.empty() && ifscCode.empty();
}

nlohmann::json PartyDetails::toJson() const {
  nlohmann::json j = nlohmann::json::object();
  if (userId != 0) {
    j["userId"] = userId;
  }
  putIfSet(j, "name", name);
  putIfSet(j, "email", email);
  putIfSet(j, "phone", phone);
  putIfSet(j, "upiId", upiId);
  putIfSet(j, "accountNumber", accountNumber);
  putIfSet(j, "ifscCode", ifscCode);
  return j;
}

PartyDetails PartyDetails::fromJson(const nlohmann::json &j) {
  PartyDetails p;
  if (!j.is_object()) {
    return p;
  }
  p.userId = j.value("userId", uint64_t(0));
  p.name = getString(j, "name");
  p.email = getString(j, "email");
  p.phone = getString(j, "phone");
  p.upiId = getString(j, "upiId");
  p.accountNumber = getString(j, "accountNumber");
  p.ifscCode = getString(j, "ifscCode");
  return p;
}

// ========== PaymentMethodDetails ==========

nlohmann::json PaymentMethodDetails::toJson() const {
  nlohmann::json j = nlohmann::json::object();
  putIfSet(j, "cardLast4", cardLast4);
  putIfSet(j, "cardBrand", cardBrand);
  putIfSet(j, "upiId", upiId);
  putIfSet(j, "upiApp", upiApp);
  putIfSet(j, "bankName", bankName);
  putIfSet(j, "bankAccountLast4", bankAccountLast4);
  putIfSet(j, "walletName", walletName);
  putIfSet(j, "biometricType", biometricType);
  return j;
}

PaymentMethodDetails PaymentMethodDetails::fromJson(const nlohmann::json &j) {
  PaymentMethodDetails d;
  if (!j.is_object()) {
    return d;
  }
  d.cardLast4 = getString(j, "cardLast4");
  d.cardBrand = getString(j, "cardBrand");
  d.upiId = getString(j, "upiId");
  d.upiApp = getString(j, "upiApp");
  d.bankName = getString(j, "bankName");
  d.bankAccountLast4 = getString(j, "bankAccountLast4");
  d.walletName = getString(j, "walletName");
  d.biometricType = getString(j, "biometricType");
  return d;
}

// ========== ErrorDetails ==========

nlohmann::json ErrorDetails::toJson() const {
  return { { "code", code }, { "message", message }, { "retryable", retryable } };
}

ErrorDetails ErrorDetails::fromJson(const nlohmann::json &j) {
  ErrorDetails e;
  if (!j.is_object()) {
    return e;
  }
  e.code = getString(j, "code");
  e.message = getString(j, "message");
  e.retryable = j.value("retryable", false);
  return e;
}

// ========== Transaction ==========

int64_t Transaction::balanceEffect() const {
  if (!affectsBalance) {
    return 0;
  }
  return isCredit() ? amount : -totalAmount;
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["transactionId"] = transactionId;
  j["ownerId"] = ownerId;
  j["type"] = toString(type);
  j["direction"] = toString(direction);
  j["amount"] = amount;
  j["fee"] = fee;
  j["tax"] = tax;
  j["totalAmount"] = totalAmount;
  j["currency"] = currency;
  j["status"] = toString(status);

  nlohmann::json history = nlohmann::json::array();
  for (const auto &change : statusHistory) {
    history.push_back({ { "status", toString(change.status) },
                        { "timestamp", change.timestamp },
                        { "reason", change.reason },
                        { "actor", change.actor } });
  }
  j["statusHistory"] = history;

  putIfSet(j, "description", description);
  putIfSet(j, "remarks", remarks);
  putIfSet(j, "category", category);
  if (!senderDetails.isEmpty()) {
    j["senderDetails"] = senderDetails.toJson();
  }
  if (!receiverDetails.isEmpty()) {
    j["receiverDetails"] = receiverDetails.toJson();
  }
  if (balanceBefore) {
    j["balanceBefore"] = *balanceBefore;
  }
  if (balanceAfter) {
    j["balanceAfter"] = *balanceAfter;
  }
  j["paymentMethod"] = toString(paymentMethod);
  auto methodDetails = paymentMethodDetails.toJson();
  if (!methodDetails.empty()) {
    j["paymentMethodDetails"] = methodDetails;
  }
  putIfSet(j, "externalReferenceId", externalReferenceId);
  putIfSet(j, "gatewayReference", gatewayReference);
  if (errorDetails) {
    j["errorDetails"] = errorDetails->toJson();
  }
  j["affectsBalance"] = affectsBalance;
  if (!metadata.empty()) {
    j["metadata"] = metadata;
  }
  j["createdAt"] = createdAt;
  j["initiatedAt"] = initiatedAt;
  j["updatedAt"] = updatedAt;
  if (completedAt) {
    j["completedAt"] = *completedAt;
  }
  return j;
}

bool Transaction::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return false;
  }
  try {
    id = j.at("id").get<uint64_t>();
    transactionId = j.at("transactionId").get<std::string>();
    ownerId = j.at("ownerId").get<uint64_t>();
    if (!parseTransactionType(j.at("type").get<std::string>(), type) ||
        !parseDirection(j.at("direction").get<std::string>(), direction) ||
        !parseTransactionStatus(j.at("status").get<std::string>(), status) ||
        !parsePaymentMethod(j.at("paymentMethod").get<std::string>(),
                            paymentMethod)) {
      return false;
    }
    amount = j.at("amount").get<int64_t>();
    fee = j.value("fee", int64_t(0));
    tax = j.value("tax", int64_t(0));
    totalAmount = j.at("totalAmount").get<int64_t>();
    currency = j.value("currency", std::string("INR"));

    statusHistory.clear();
    for (const auto &h : j.at("statusHistory")) {
      StatusChange change;
      if (!parseTransactionStatus(h.at("status").get<std::string>(),
                                  change.status)) {
        return false;
      }
      change.timestamp = h.at("timestamp").get<int64_t>();
      change.reason = h.value("reason", std::string());
      change.actor = h.value("actor", std::string());
      statusHistory.push_back(change);
    }

    description = getString(j, "description");
    remarks = getString(j, "remarks");
    category = getString(j, "category");
    senderDetails = PartyDetails::fromJson(j.value("senderDetails", nlohmann::json()));
    receiverDetails =
        PartyDetails::fromJson(j.value("receiverDetails", nlohmann::json()));

    balanceBefore.reset();
    balanceAfter.reset();
    if (j.contains("balanceBefore")) {
      balanceBefore = j["balanceBefore"].get<int64_t>();
    }
    if (j.contains("balanceAfter")) {
      balanceAfter = j["balanceAfter"].get<int64_t>();
    }

    paymentMethodDetails = PaymentMethodDetails::fromJson(
        j.value("paymentMethodDetails", nlohmann::json()));
    externalReferenceId = getString(j, "externalReferenceId");
    gatewayReference = getString(j, "gatewayReference");

    errorDetails.reset();
    if (j.contains("errorDetails")) {
      errorDetails = ErrorDetails::fromJson(j["errorDetails"]);
    }
    affectsBalance = j.value("affectsBalance", true);

    metadata.clear();
    if (j.contains("metadata")) {
      metadata = j["metadata"].get<std::map<std::string, std::string>>();
    }

    createdAt = j.at("createdAt").get<int64_t>();
    initiatedAt = j.value("initiatedAt", createdAt);
    updatedAt = j.value("updatedAt", createdAt);
    completedAt.reset();
    if (j.contains("completedAt")) {
      completedAt = j["completedAt"].get<int64_t>();
    }
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  return true;
}

} // namespace paisa
