#include "PaymentProcessor.h"
#include "Utilities.h"

#include <limits>
#include <utility>

namespace paisa {

namespace {

bool isWalletDebitType(TransactionType type) {
  return inferDirection(type) == Direction::DEBIT &&
         type != TransactionType::TRANSFER;
}

bool isRefundableType(TransactionType type) {
  return type == TransactionType::PAYMENT || type == TransactionType::RECHARGE ||
         type == TransactionType::BILL_PAYMENT;
}

std::string nameFromHandle(const std::string &handle) {
  auto at = handle.find('@');
  return at == std::string::npos ? handle : handle.substr(0, at);
}

PartyDetails toParty(const BalanceAccessor::UserProfile &profile) {
  PartyDetails party;
  party.userId = profile.userId;
  party.name = profile.name;
  party.email = profile.email;
  party.phone = profile.phone;
  party.upiId = profile.upiId;
  return party;
}

PartyDetails externalParty(const std::string &identifier, const std::string &name) {
  PartyDetails party;
  party.name = name.empty() ? nameFromHandle(identifier) : name;
  if (identifier.find('@') != std::string::npos) {
    party.upiId = identifier;
  } else {
    party.accountNumber = identifier;
  }
  return party;
}

std::string authMethodName(const AuthProof &proof) {
  return proof.method == AuthMethod::PIN ? "pin" : "biometric";
}

// Receiving account named on a transfer's sender entry
std::optional<uint64_t> transferReceiver(const Transaction &entry) {
  if (entry.type != TransactionType::TRANSFER || !entry.isDebit()) {
    return std::nullopt;
  }
  auto it = entry.metadata.find("recipientUserId");
  uint64_t receiverId = 0;
  if (it == entry.metadata.end() || !utl::parseUInt64(it->second, receiverId)) {
    return std::nullopt;
  }
  return receiverId;
}

} // namespace

PaymentProcessor::PaymentProcessor(LedgerStore &store, BalanceAccessor &accounts,
                                   VerificationGate &gate,
                                   SettlementGateway &gateway)
    : PaymentProcessor(store, accounts, gate, gateway, Config()) {}

PaymentProcessor::PaymentProcessor(LedgerStore &store, BalanceAccessor &accounts,
                                   VerificationGate &gate,
                                   SettlementGateway &gateway, const Config &config)
    : Module("paisa.payment"), store_(store), accounts_(accounts), gate_(gate),
      gateway_(gateway), analytics_(store), config_(config) {}

PaymentProcessor::Error PaymentProcessor::makeError(int32_t code,
                                                    const std::string &message,
                                                    const std::string &transactionId,
                                                    bool retryable) {
  Error error(code, message);
  error.transactionId = transactionId;
  error.retryable = retryable;
  return error;
}

PaymentProcessor::Error
PaymentProcessor::fromStore(const LedgerStore::Error &error,
                            const std::string &transactionId) {
  switch (error.code) {
  case LedgerStore::E_VALIDATION:
  case LedgerStore::E_DUPLICATE:
    return makeError(E_VALIDATION, error.message, transactionId);
  case LedgerStore::E_NOT_FOUND:
    return makeError(E_NOT_FOUND, error.message, transactionId);
  case LedgerStore::E_TRANSITION:
    return makeError(E_INVALID_OPERATION, error.message, transactionId);
  default:
    return makeError(E_PERSISTENCE, error.message, transactionId, true);
  }
}

PaymentProcessor::Error
PaymentProcessor::fromAccounts(const BalanceAccessor::Error &error) {
  switch (error.code) {
  case BalanceAccessor::E_ACCOUNT:
    return makeError(E_NOT_FOUND, error.message);
  case BalanceAccessor::E_BALANCE:
    return makeError(E_INSUFFICIENT_FUNDS, error.message);
  case BalanceAccessor::E_INPUT:
    return makeError(E_VALIDATION, error.message);
  default:
    return makeError(E_PERSISTENCE, error.message, "", true);
  }
}

std::shared_ptr<std::mutex> PaymentProcessor::userLock(uint64_t userId) {
  std::lock_guard<std::mutex> lock(lockTableMutex_);
  auto &slot = userLocks_[userId];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

void PaymentProcessor::releaseUser(uint64_t userId) {
  std::lock_guard<std::mutex> lock(lockTableMutex_);
  // Threads already holding the slot keep it alive through their shared_ptr
  userLocks_.erase(userId);
}

size_t PaymentProcessor::getLockTableSize() const {
  std::lock_guard<std::mutex> lock(lockTableMutex_);
  return userLocks_.size();
}

PaymentProcessor::Roe<void>
PaymentProcessor::validateAmount(int64_t amount, int64_t fee, int64_t tax) const {
  if (amount <= 0) {
    return makeError(E_VALIDATION, "Amount must be positive");
  }
  if (fee < 0 || tax < 0) {
    return makeError(E_VALIDATION, "Fee and tax must not be negative");
  }
  constexpr int64_t MAX = std::numeric_limits<int64_t>::max();
  if (amount > MAX - fee || amount + fee > MAX - tax) {
    return makeError(E_VALIDATION, "Amount out of range");
  }
  return {};
}

PaymentProcessor::Roe<void> PaymentProcessor::verifyAuth(uint64_t userId,
                                                         const AuthProof &proof) {
  if (!proof.isPresent()) {
    return makeError(E_VALIDATION, proof.method == AuthMethod::PIN
                                       ? "UPI PIN is required"
                                       : "Biometric data is required");
  }
  if (proof.method == AuthMethod::BIOMETRIC && proof.biometricType.empty()) {
    return makeError(E_VALIDATION, "Biometric type is required");
  }
  if (!gate_.verify(userId, proof)) {
    log().warning << "Authorization refused for user " << userId << " ("
                  << authMethodName(proof) << ")";
    return makeError(E_AUTHENTICATION, proof.method == AuthMethod::PIN
                                           ? "Invalid UPI PIN"
                                           : "Biometric verification failed");
  }
  return {};
}

PaymentProcessor::Roe<PartyDetails>
PaymentProcessor::ownerParty(uint64_t userId) const {
  auto profile = accounts_.getProfile(userId);
  if (!profile) {
    return fromAccounts(profile.error());
  }
  return toParty(profile.value());
}

PaymentProcessor::Roe<std::optional<Transaction>>
PaymentProcessor::findExisting(uint64_t ownerId,
                               const std::string &externalReferenceId,
                               const std::string &transactionId) const {
  if (!externalReferenceId.empty()) {
    auto existing = store_.findByExternalReference(ownerId, externalReferenceId);
    if (existing) {
      return std::optional<Transaction>(existing.value());
    }
    if (existing.error().code != LedgerStore::E_NOT_FOUND) {
      return fromStore(existing.error());
    }
  }
  if (!transactionId.empty()) {
    auto existing = store_.findByTransactionId(transactionId);
    if (existing) {
      if (existing.value().ownerId != ownerId) {
        return makeError(E_VALIDATION, "Transaction id already in use: " + transactionId);
      }
      return std::optional<Transaction>(existing.value());
    }
    if (existing.error().code != LedgerStore::E_NOT_FOUND) {
      return fromStore(existing.error());
    }
  }
  return std::optional<Transaction>();
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::replayExisting(const Transaction &existing) const {
  log().info << "Retried request maps to " << existing.transactionId << " ("
             << toString(existing.status) << ")";
  const std::string &txid = existing.transactionId;
  const std::string code = existing.errorDetails ? existing.errorDetails->code : "";
  const std::string detail = existing.errorDetails ? existing.errorDetails->message
                                                   : toString(existing.status);

  switch (existing.status) {
  case TransactionStatus::COMPLETED:
  case TransactionStatus::REFUNDED:
    return existing;
  case TransactionStatus::FAILED: {
    int32_t errorCode = E_PERSISTENCE;
    if (code == CODE_INSUFFICIENT_FUNDS) {
      errorCode = E_INSUFFICIENT_FUNDS;
    } else if (code == CODE_SETTLEMENT_FAILED) {
      errorCode = E_SETTLEMENT_FAILED;
    } else if (code == CODE_VALIDATION) {
      errorCode = E_VALIDATION;
    }
    bool retryable = existing.errorDetails && existing.errorDetails->retryable;
    std::string message = "Request already failed as " + txid + ": " + detail;
    if (retryable) {
      message += "; resubmit with a new reference";
    }
    return makeError(errorCode, message, txid, retryable);
  }
  case TransactionStatus::ON_HOLD:
    return makeError(code == CODE_SETTLEMENT_TIMEOUT ? E_SETTLEMENT_TIMEOUT
                                                     : E_PERSISTENCE,
                     "Request is on hold as " + txid + ": " + detail, txid);
  default:
    return makeError(E_INVALID_OPERATION,
                     "Request is " + toString(existing.status) + " as " + txid, txid);
  }
}

SettlementGateway::Roe<SettlementGateway::Receipt>
PaymentProcessor::settle(const Transaction &entry) {
  SettlementGateway::Request request;
  request.reference = entry.transactionId;
  request.amount = entry.totalAmount;
  request.method = entry.paymentMethod;
  request.metadata = entry.metadata;
  return gateway_.settle(request);
}

bool PaymentProcessor::compensate(const Transaction &entry, uint64_t userId,
                                  int64_t delta, const char *holdCode) {
  log().error << "Compensating " << entry.transactionId << ": adjusting user "
              << userId << " by " << (delta < 0 ? "-" : "+")
              << utl::formatAmount(delta < 0 ? -delta : delta);
  auto reversed = accounts_.atomicAdjust(userId, delta);
  if (reversed) {
    return true;
  }
  log().error << "Compensation for " << entry.transactionId
              << " failed: " << reversed.error().message;
  markOnHold(entry, REASON_COMPENSATION_FAILED,
             ErrorDetails{ holdCode, reversed.error().message, false });
  return false;
}

void PaymentProcessor::markFailed(const Transaction &entry, const std::string &code,
                                  const std::string &message, bool retryable) {
  LedgerStore::StatusUpdate update;
  update.reason = message;
  update.errorDetails = ErrorDetails{ code, message, retryable };
  auto result = store_.updateStatus(entry.id, TransactionStatus::FAILED, update);
  if (!result) {
    log().error << "Failed to mark " << entry.transactionId
                << " failed: " << result.error().message;
    return;
  }
  log().warning << entry.transactionId << " failed [" << code << "]: " << message;
}

void PaymentProcessor::markOnHold(const Transaction &entry, const std::string &reason,
                                  const std::optional<ErrorDetails> &details) {
  LedgerStore::StatusUpdate update;
  update.reason = reason;
  update.errorDetails = details;
  auto result = store_.updateStatus(entry.id, TransactionStatus::ON_HOLD, update);
  if (!result) {
    log().error << "Failed to put " << entry.transactionId
                << " on hold: " << result.error().message;
    return;
  }
  log().warning << entry.transactionId << " on hold: " << reason;
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::executeDebit(uint64_t ownerId, LedgerStore::Draft draft,
                               bool settleExternally) {
  auto lockPtr = userLock(ownerId);
  std::lock_guard<std::mutex> guard(*lockPtr);

  auto existing = findExisting(ownerId, draft.externalReferenceId, draft.transactionId);
  if (!existing) {
    return existing.error();
  }
  if (existing.value()) {
    return replayExisting(*existing.value());
  }

  int64_t total = draft.amount + draft.fee + draft.tax;
  auto balance = accounts_.getBalance(ownerId);
  if (!balance) {
    return fromAccounts(balance.error());
  }
  if (balance.value() < total) {
    log().warning << "Insufficient funds for user " << ownerId << ": has "
                  << utl::formatAmount(balance.value()) << ", needs "
                  << utl::formatAmount(total);
    return makeError(E_INSUFFICIENT_FUNDS, "Insufficient balance");
  }

  draft.initialStatus = TransactionStatus::PROCESSING;
  draft.balanceBefore = balance.value();
  auto created = store_.create(draft);
  if (!created) {
    log().error << "Failed to record debit for user " << ownerId << ": "
                << created.error().message;
    return fromStore(created.error());
  }
  const Transaction entry = created.value();

  auto debited = accounts_.atomicAdjust(ownerId, -entry.totalAmount);
  if (!debited) {
    if (debited.error().code == BalanceAccessor::E_BALANCE) {
      markFailed(entry, CODE_INSUFFICIENT_FUNDS, debited.error().message, false);
      return makeError(E_INSUFFICIENT_FUNDS, "Insufficient balance",
                       entry.transactionId);
    }
    markFailed(entry, CODE_BALANCE_MUTATION, debited.error().message, true);
    return makeError(E_PERSISTENCE, "Balance update failed: " + debited.error().message,
                     entry.transactionId, true);
  }

  LedgerStore::StatusUpdate update;
  update.reason = "Transaction completed";
  update.balanceAfter = debited.value();

  if (settleExternally) {
    auto receipt = settle(entry);
    if (!receipt) {
      const std::string &message = receipt.error().message;
      if (receipt.error().code == SettlementGateway::E_TIMEOUT) {
        // Outcome unknown; keep the debit until an operator resolves it
        markOnHold(entry, "Settlement outcome unknown",
                   ErrorDetails{ CODE_SETTLEMENT_TIMEOUT, message, false });
        return makeError(E_SETTLEMENT_TIMEOUT, "Settlement timed out: " + message,
                         entry.transactionId);
      }
      if (!compensate(entry, ownerId, entry.totalAmount)) {
        return makeError(E_SETTLEMENT_FAILED,
                         message + "; " + REASON_COMPENSATION_FAILED,
                         entry.transactionId);
      }
      markFailed(entry, CODE_SETTLEMENT_FAILED, message, false);
      return makeError(E_SETTLEMENT_FAILED, "Settlement failed: " + message,
                       entry.transactionId);
    }
    update.gatewayReference = receipt.value().gatewayReference;
  }

  auto completed = store_.updateStatus(entry.id, TransactionStatus::COMPLETED, update);
  if (!completed) {
    const std::string &message = completed.error().message;
    markOnHold(entry, "Completion not recorded: " + message,
               ErrorDetails{ CODE_PERSISTENCE, message, false });
    return makeError(E_PERSISTENCE, "Failed to record completion: " + message,
                     entry.transactionId);
  }

  log().info << entry.transactionId << ": " << toString(entry.type) << " of "
             << utl::formatAmount(entry.totalAmount) << " by user " << ownerId
             << " completed";
  return completed.value();
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::processPayment(uint64_t ownerId, const PaymentRequest &request) {
  log().info << toString(request.type) << " of " << utl::formatAmount(request.amount)
             << " by user " << ownerId << " to " << request.counterpart;

  auto valid = validateAmount(request.amount, request.fee, request.tax);
  if (!valid) {
    return valid.error();
  }
  if (!isWalletDebitType(request.type)) {
    return makeError(E_VALIDATION,
                     "Not a wallet payment type: " + toString(request.type));
  }
  if (request.method == PaymentMethod::CARD) {
    return makeError(E_VALIDATION, "Card-funded purchases use a card payment");
  }
  if (request.counterpart.empty()) {
    return makeError(E_VALIDATION, "Payee is required");
  }

  auto verified = verifyAuth(ownerId, request.authProof);
  if (!verified) {
    return verified.error();
  }

  auto sender = ownerParty(ownerId);
  if (!sender) {
    return sender.error();
  }

  LedgerStore::Draft draft;
  draft.ownerId = ownerId;
  draft.type = request.type;
  draft.direction = Direction::DEBIT;
  draft.paymentMethod = request.method;
  draft.amount = request.amount;
  draft.fee = request.fee;
  draft.tax = request.tax;
  draft.currency = config_.currency;
  draft.transactionId = request.transactionId;
  draft.senderDetails = sender.value();
  draft.receiverDetails = externalParty(request.counterpart, request.counterpartName);
  draft.description = request.description.empty()
                          ? "Payment to " + draft.receiverDetails.name
                          : request.description;
  draft.remarks = request.remarks;
  draft.category = request.category.empty() ? toString(request.type) : request.category;
  draft.paymentMethodDetails = request.methodDetails;
  draft.externalReferenceId = request.externalReferenceId;
  draft.metadata = request.metadata;
  draft.metadata["recipientId"] = request.counterpart;
  draft.metadata["authMethod"] = authMethodName(request.authProof);
  draft.actor = "user:" + std::to_string(ownerId);

  return executeDebit(ownerId, std::move(draft), request.settleExternally);
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::processUpiPayment(uint64_t ownerId, const UpiPaymentRequest &request) {
  PaymentRequest payment;
  payment.type = TransactionType::PAYMENT;
  payment.amount = request.amount;
  payment.counterpart = request.recipientUpi;
  payment.authProof.method = AuthMethod::PIN;
  payment.authProof.secret = request.pin;
  payment.method = PaymentMethod::UPI;
  payment.methodDetails.upiId = request.recipientUpi;
  payment.methodDetails.upiApp = request.upiApp;
  payment.description = request.description.empty()
                            ? "UPI payment to " + request.recipientUpi
                            : request.description;
  payment.externalReferenceId = request.externalReferenceId;
  return processPayment(ownerId, payment);
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::processBiometricPayment(uint64_t ownerId,
                                          const BiometricPaymentRequest &request) {
  PaymentRequest payment;
  payment.type = TransactionType::PAYMENT;
  payment.amount = request.amount;
  payment.counterpart = request.recipientUpi;
  payment.authProof.method = AuthMethod::BIOMETRIC;
  payment.authProof.secret = request.biometricData;
  payment.authProof.biometricType = request.biometricType;
  payment.method = PaymentMethod::BIOMETRIC;
  payment.methodDetails.upiId = request.recipientUpi;
  payment.methodDetails.biometricType = request.biometricType;
  payment.metadata["biometricType"] = request.biometricType;
  payment.description = request.description.empty()
                            ? "Biometric payment to " + request.recipientUpi
                            : request.description;
  payment.externalReferenceId = request.externalReferenceId;
  return processPayment(ownerId, payment);
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::processRecharge(uint64_t ownerId, const RechargeRequest &request) {
  if (request.rechargeType.empty()) {
    return makeError(E_VALIDATION, "Recharge type is required");
  }

  PaymentRequest payment;
  payment.type = TransactionType::RECHARGE;
  payment.amount = request.amount;
  payment.counterpart = request.number;
  payment.counterpartName = request.operatorName;
  payment.authProof.method = AuthMethod::PIN;
  payment.authProof.secret = request.pin;
  payment.method = PaymentMethod::WALLET;
  payment.metadata["rechargeType"] = request.rechargeType;
  payment.metadata["operator"] = request.operatorName;
  if (!request.plan.empty()) {
    payment.metadata["plan"] = request.plan;
  }
  payment.description = request.rechargeType + " recharge for " + request.number;
  payment.category = "recharge";
  payment.externalReferenceId = request.externalReferenceId;
  // The gateway stands in for the operator API
  payment.settleExternally = true;
  return processPayment(ownerId, payment);
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::processCardPayment(uint64_t ownerId,
                                     const CardPaymentRequest &request) {
  log().info << "Card payment of " << utl::formatAmount(request.amount)
             << " by user " << ownerId;

  auto valid = validateAmount(request.amount, 0, 0);
  if (!valid) {
    return valid.error();
  }
  auto owner = ownerParty(ownerId);
  if (!owner) {
    return owner.error();
  }

  auto lockPtr = userLock(ownerId);
  std::lock_guard<std::mutex> guard(*lockPtr);

  auto existing = findExisting(ownerId, request.externalReferenceId, "");
  if (!existing) {
    return existing.error();
  }
  if (existing.value()) {
    return replayExisting(*existing.value());
  }

  LedgerStore::Draft draft;
  draft.ownerId = ownerId;
  draft.type = TransactionType::PAYMENT;
  draft.direction = Direction::DEBIT;
  draft.paymentMethod = PaymentMethod::CARD;
  draft.amount = request.amount;
  draft.currency = config_.currency;
  draft.affectsBalance = false;
  draft.senderDetails = owner.value();
  if (!request.merchant.empty()) {
    draft.receiverDetails.name = request.merchant;
    draft.metadata["recipientId"] = request.merchant;
  }
  draft.paymentMethodDetails.cardLast4 = request.cardLast4;
  draft.paymentMethodDetails.cardBrand = request.cardBrand;
  draft.description = request.description.empty() ? "Card payment" : request.description;
  draft.category = "card";
  draft.externalReferenceId = request.externalReferenceId;
  draft.actor = "user:" + std::to_string(ownerId);

  auto created = store_.create(draft);
  if (!created) {
    return fromStore(created.error());
  }
  const Transaction entry = created.value();

  auto receipt = settle(entry);
  if (!receipt) {
    const std::string &message = receipt.error().message;
    if (receipt.error().code == SettlementGateway::E_TIMEOUT) {
      markOnHold(entry, "Settlement outcome unknown",
                 ErrorDetails{ CODE_SETTLEMENT_TIMEOUT, message, false });
      return makeError(E_SETTLEMENT_TIMEOUT, "Settlement timed out: " + message,
                       entry.transactionId);
    }
    markFailed(entry, CODE_SETTLEMENT_FAILED, message, false);
    return makeError(E_SETTLEMENT_FAILED, "Payment declined: " + message,
                     entry.transactionId);
  }

  LedgerStore::StatusUpdate update;
  update.reason = "Card charge settled";
  update.gatewayReference = receipt.value().gatewayReference;
  auto completed = store_.updateStatus(entry.id, TransactionStatus::COMPLETED, update);
  if (!completed) {
    markOnHold(entry, "Completion not recorded: " + completed.error().message,
               ErrorDetails{ CODE_PERSISTENCE, completed.error().message, false });
    return makeError(E_PERSISTENCE, completed.error().message, entry.transactionId);
  }
  log().info << entry.transactionId << ": card charge settled as "
             << update.gatewayReference;
  return completed.value();
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::addMoney(uint64_t ownerId, const AddMoneyRequest &request) {
  log().info << "Add money " << utl::formatAmount(request.amount) << " for user "
             << ownerId << " from " << toString(request.source);

  auto valid = validateAmount(request.amount, 0, 0);
  if (!valid) {
    return valid.error();
  }
  if (request.source == PaymentMethod::WALLET) {
    return makeError(E_VALIDATION, "A wallet cannot be funded from itself");
  }
  auto owner = ownerParty(ownerId);
  if (!owner) {
    return owner.error();
  }

  auto lockPtr = userLock(ownerId);
  std::lock_guard<std::mutex> guard(*lockPtr);

  auto existing = findExisting(ownerId, request.externalReferenceId, "");
  if (!existing) {
    return existing.error();
  }
  if (existing.value()) {
    return replayExisting(*existing.value());
  }

  auto balance = accounts_.getBalance(ownerId);
  if (!balance) {
    return fromAccounts(balance.error());
  }

  LedgerStore::Draft draft;
  draft.ownerId = ownerId;
  draft.type = TransactionType::ADD_MONEY;
  draft.direction = Direction::CREDIT;
  draft.paymentMethod = request.source;
  draft.paymentMethodDetails = request.sourceDetails;
  draft.amount = request.amount;
  draft.currency = config_.currency;
  draft.receiverDetails = owner.value();
  draft.balanceBefore = balance.value();
  draft.description = request.description.empty()
                          ? "Added " + utl::formatAmount(request.amount) + " to wallet"
                          : request.description;
  draft.category = "add_money";
  draft.externalReferenceId = request.externalReferenceId;
  draft.actor = "user:" + std::to_string(ownerId);

  auto created = store_.create(draft);
  if (!created) {
    return fromStore(created.error());
  }
  const Transaction entry = created.value();

  LedgerStore::StatusUpdate update;
  update.reason = "Funds added";

  bool settled = false;
  if (request.source == PaymentMethod::CARD) {
    auto receipt = settle(entry);
    if (!receipt) {
      const std::string &message = receipt.error().message;
      if (receipt.error().code == SettlementGateway::E_TIMEOUT) {
        markOnHold(entry, "Settlement outcome unknown",
                   ErrorDetails{ CODE_SETTLEMENT_TIMEOUT, message, false });
        return makeError(E_SETTLEMENT_TIMEOUT, "Settlement timed out: " + message,
                         entry.transactionId);
      }
      markFailed(entry, CODE_SETTLEMENT_FAILED, message, false);
      return makeError(E_SETTLEMENT_FAILED, "Card charge declined: " + message,
                       entry.transactionId);
    }
    settled = true;
    update.gatewayReference = receipt.value().gatewayReference;
  }

  auto credited = accounts_.atomicAdjust(ownerId, entry.amount);
  if (!credited) {
    const std::string &message = credited.error().message;
    if (settled) {
      // The card was charged; the credit is owed
      markOnHold(entry, "Card settled but wallet credit failed",
                 ErrorDetails{ CODE_BALANCE_MUTATION, message, false });
      return makeError(E_PERSISTENCE, "Wallet credit failed: " + message,
                       entry.transactionId);
    }
    bool overflow = credited.error().code == BalanceAccessor::E_INPUT;
    markFailed(entry, overflow ? CODE_VALIDATION : CODE_BALANCE_MUTATION, message,
               !overflow);
    return makeError(overflow ? E_VALIDATION : E_PERSISTENCE,
                     "Wallet credit failed: " + message, entry.transactionId,
                     !overflow);
  }

  update.balanceAfter = credited.value();
  auto completed = store_.updateStatus(entry.id, TransactionStatus::COMPLETED, update);
  if (!completed) {
    markOnHold(entry, "Completion not recorded: " + completed.error().message,
               ErrorDetails{ CODE_PERSISTENCE, completed.error().message, false });
    return makeError(E_PERSISTENCE, completed.error().message, entry.transactionId);
  }
  log().info << entry.transactionId << ": added " << utl::formatAmount(entry.amount)
             << " to wallet " << ownerId;
  return completed.value();
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::processTransfer(uint64_t senderId, const TransferRequest &request) {
  log().info << "Transfer of " << utl::formatAmount(request.amount) << " from user "
             << senderId << " to " << request.recipient;

  auto valid = validateAmount(request.amount, 0, 0);
  if (!valid) {
    return valid.error();
  }
  if (request.recipient.empty()) {
    return makeError(E_VALIDATION, "Recipient email, phone or UPI id is required");
  }

  auto verified = verifyAuth(senderId, request.authProof);
  if (!verified) {
    return verified.error();
  }

  auto found = accounts_.findUser(request.recipient);
  if (!found) {
    if (found.error().code == BalanceAccessor::E_ACCOUNT) {
      log().warning << "Recipient not found: " << request.recipient;
      return makeError(E_COUNTERPARTY_NOT_FOUND,
                       "Recipient not found: " + request.recipient);
    }
    return fromAccounts(found.error());
  }
  uint64_t receiverId = found.value();
  if (receiverId == senderId) {
    return makeError(E_INVALID_OPERATION, "Cannot transfer to yourself");
  }

  auto sender = ownerParty(senderId);
  if (!sender) {
    return sender.error();
  }
  auto receiver = ownerParty(receiverId);
  if (!receiver) {
    return makeError(E_COUNTERPARTY_NOT_FOUND, receiver.error().message);
  }

  auto senderLock = userLock(senderId);
  auto receiverLock = userLock(receiverId);
  std::scoped_lock guard(*senderLock, *receiverLock);

  auto existing = findExisting(senderId, request.externalReferenceId,
                               request.transactionId);
  if (!existing) {
    return existing.error();
  }
  if (existing.value()) {
    return replayExisting(*existing.value());
  }

  auto balance = accounts_.getBalance(senderId);
  if (!balance) {
    return fromAccounts(balance.error());
  }
  if (balance.value() < request.amount) {
    log().warning << "Insufficient funds for user " << senderId << ": has "
                  << utl::formatAmount(balance.value()) << ", needs "
                  << utl::formatAmount(request.amount);
    return makeError(E_INSUFFICIENT_FUNDS, "Insufficient balance");
  }

  LedgerStore::Draft draft;
  draft.ownerId = senderId;
  draft.type = TransactionType::TRANSFER;
  draft.direction = Direction::DEBIT;
  draft.paymentMethod = PaymentMethod::WALLET;
  draft.amount = request.amount;
  draft.currency = config_.currency;
  draft.transactionId = request.transactionId;
  draft.senderDetails = sender.value();
  draft.receiverDetails = receiver.value();
  draft.description = request.note.empty() ? "Transfer to " + receiver.value().name
                                           : request.note;
  draft.remarks = request.note;
  draft.category = "transfer";
  draft.balanceBefore = balance.value();
  draft.externalReferenceId = request.externalReferenceId;
  draft.metadata["recipientId"] = request.recipient;
  draft.metadata["recipientUserId"] = std::to_string(receiverId);
  draft.metadata["authMethod"] = authMethodName(request.authProof);
  draft.actor = "user:" + std::to_string(senderId);

  auto created = store_.create(draft);
  if (!created) {
    log().error << "Failed to record transfer: " << created.error().message;
    return fromStore(created.error());
  }
  const Transaction entry = created.value();

  auto debited = accounts_.atomicAdjust(senderId, -entry.amount);
  if (!debited) {
    if (debited.error().code == BalanceAccessor::E_BALANCE) {
      markFailed(entry, CODE_INSUFFICIENT_FUNDS, debited.error().message, false);
      return makeError(E_INSUFFICIENT_FUNDS, "Insufficient balance",
                       entry.transactionId);
    }
    markFailed(entry, CODE_BALANCE_MUTATION, debited.error().message, true);
    return makeError(E_PERSISTENCE, "Balance update failed: " + debited.error().message,
                     entry.transactionId, true);
  }
  int64_t senderAfter = debited.value();

  auto credited = accounts_.atomicAdjust(receiverId, entry.amount);
  if (!credited) {
    const std::string message = credited.error().message;
    if (!compensate(entry, senderId, entry.amount)) {
      return makeError(E_PERSISTENCE, "Receiver credit failed: " + message,
                       entry.transactionId);
    }
    bool overflow = credited.error().code == BalanceAccessor::E_INPUT;
    markFailed(entry, overflow ? CODE_VALIDATION : CODE_BALANCE_MUTATION, message,
               !overflow);
    return makeError(overflow ? E_VALIDATION : E_PERSISTENCE,
                     "Receiver credit failed: " + message, entry.transactionId,
                     !overflow);
  }
  int64_t receiverAfter = credited.value();

  auto recorded = store_.create(receiverLegDraft(entry, receiverId, receiverAfter));
  if (!recorded) {
    const std::string message = recorded.error().message;
    log().error << "Failed to record receiver leg of " << entry.transactionId << ": "
                << message;
    // Undo the receiver credit first, then the sender debit
    if (!compensate(entry, receiverId, -entry.amount, CODE_RECEIVER_UNREVERSED)) {
      return makeError(E_PERSISTENCE, "Receiver entry not recorded: " + message,
                       entry.transactionId);
    }
    if (!compensate(entry, senderId, entry.amount)) {
      return makeError(E_PERSISTENCE, "Receiver entry not recorded: " + message,
                       entry.transactionId);
    }
    markFailed(entry, CODE_PERSISTENCE, message, true);
    return makeError(E_PERSISTENCE, "Receiver entry not recorded: " + message,
                     entry.transactionId, true);
  }

  LedgerStore::StatusUpdate update;
  update.reason = "Transfer completed";
  update.balanceAfter = senderAfter;
  auto completed = store_.updateStatus(entry.id, TransactionStatus::COMPLETED, update);
  if (!completed) {
    const std::string &message = completed.error().message;
    markOnHold(entry, "Completion not recorded: " + message,
               ErrorDetails{ CODE_PERSISTENCE, message, false });
    return makeError(E_PERSISTENCE, "Failed to record completion: " + message,
                     entry.transactionId);
  }

  log().info << entry.transactionId << ": transferred "
             << utl::formatAmount(entry.amount) << " from " << senderId << " to "
             << receiverId << " (" << recorded.value().transactionId << ")";
  return completed.value();
}

std::vector<Transaction>
PaymentProcessor::findRefunds(uint64_t ownerId,
                              const std::string &originalTransactionId) const {
  std::vector<Transaction> refunds;
  store_.forEachOwned(ownerId, [&](const Transaction &tx) {
    if (tx.type != TransactionType::REFUND) {
      return;
    }
    auto it = tx.metadata.find("originalTransactionId");
    if (it != tx.metadata.end() && it->second == originalTransactionId) {
      refunds.push_back(tx);
    }
  });
  return refunds;
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::refundPayment(uint64_t ownerId, const std::string &transactionId,
                                const std::string &reason) {
  log().info << "Refund of " << transactionId << " requested by user " << ownerId;
  if (transactionId.empty()) {
    return makeError(E_VALIDATION, "Transaction id is required");
  }

  auto lockPtr = userLock(ownerId);
  std::lock_guard<std::mutex> guard(*lockPtr);

  auto found = store_.findByTransactionId(transactionId);
  if (!found || found.value().ownerId != ownerId) {
    return makeError(E_NOT_FOUND, "Transaction not found: " + transactionId);
  }
  const Transaction original = found.value();

  LedgerStore::StatusUpdate refunded;
  refunded.actor = "user:" + std::to_string(ownerId);

  for (const auto &previous : findRefunds(ownerId, transactionId)) {
    if (previous.status == TransactionStatus::COMPLETED) {
      // Finish an interrupted refund
      if (original.status == TransactionStatus::COMPLETED) {
        refunded.reason = "Refunded by " + previous.transactionId;
        auto moved = store_.updateStatus(original.id, TransactionStatus::REFUNDED,
                                         refunded);
        if (!moved) {
          return fromStore(moved.error(), previous.transactionId);
        }
      }
      return previous;
    }
    if (previous.status == TransactionStatus::PROCESSING ||
        previous.status == TransactionStatus::ON_HOLD) {
      return makeError(E_INVALID_OPERATION,
                       "Refund already in progress: " + previous.transactionId);
    }
  }

  if (original.status != TransactionStatus::COMPLETED) {
    return makeError(E_INVALID_OPERATION, "Only completed transactions can be refunded; " +
                                              transactionId + " is " +
                                              toString(original.status));
  }
  if (!original.isDebit() || !original.affectsBalance ||
      !isRefundableType(original.type)) {
    return makeError(E_INVALID_OPERATION,
                     "Transaction is not a refundable wallet debit: " + transactionId);
  }

  auto balance = accounts_.getBalance(ownerId);
  if (!balance) {
    return fromAccounts(balance.error());
  }

  LedgerStore::Draft draft;
  draft.ownerId = ownerId;
  draft.type = TransactionType::REFUND;
  draft.direction = Direction::CREDIT;
  draft.paymentMethod = PaymentMethod::WALLET;
  draft.amount = original.totalAmount;
  draft.currency = original.currency;
  draft.senderDetails = original.receiverDetails;
  draft.receiverDetails = original.senderDetails;
  draft.description = "Refund for " + transactionId;
  draft.remarks = reason;
  draft.category = "refund";
  draft.balanceBefore = balance.value();
  draft.metadata["originalTransactionId"] = transactionId;
  draft.actor = refunded.actor;

  auto created = store_.create(draft);
  if (!created) {
    return fromStore(created.error());
  }
  const Transaction entry = created.value();

  auto credited = accounts_.atomicAdjust(ownerId, entry.amount);
  if (!credited) {
    bool overflow = credited.error().code == BalanceAccessor::E_INPUT;
    markFailed(entry, overflow ? CODE_VALIDATION : CODE_BALANCE_MUTATION,
               credited.error().message, !overflow);
    return makeError(overflow ? E_VALIDATION : E_PERSISTENCE,
                     "Refund credit failed: " + credited.error().message,
                     entry.transactionId, !overflow);
  }

  LedgerStore::StatusUpdate update;
  update.reason = reason.empty() ? "Refund completed" : reason;
  update.actor = refunded.actor;
  update.balanceAfter = credited.value();
  auto completed = store_.updateStatus(entry.id, TransactionStatus::COMPLETED, update);
  if (!completed) {
    markOnHold(entry, "Completion not recorded: " + completed.error().message,
               ErrorDetails{ CODE_PERSISTENCE, completed.error().message, false });
    return makeError(E_PERSISTENCE, completed.error().message, entry.transactionId);
  }

  refunded.reason = "Refunded by " + entry.transactionId;
  auto moved = store_.updateStatus(original.id, TransactionStatus::REFUNDED, refunded);
  if (!moved) {
    // A retry finds the completed refund and finishes the move
    log().error << "Refund " << entry.transactionId << " applied but " << transactionId
                << " not marked refunded: " << moved.error().message;
    return makeError(E_PERSISTENCE, moved.error().message, entry.transactionId, true);
  }

  log().info << entry.transactionId << ": refunded "
             << utl::formatAmount(entry.amount) << " for " << transactionId;
  return completed.value();
}

std::optional<Transaction>
PaymentProcessor::findReceiverLeg(const Transaction &senderEntry) const {
  auto receiverId = transferReceiver(senderEntry);
  if (!receiverId) {
    return std::nullopt;
  }
  std::optional<Transaction> leg;
  store_.forEachOwned(*receiverId, [&](const Transaction &tx) {
    auto related = tx.metadata.find("relatedTransactionId");
    if (related != tx.metadata.end() && related->second == senderEntry.transactionId) {
      leg = tx;
    }
  });
  return leg;
}

LedgerStore::Draft
PaymentProcessor::receiverLegDraft(const Transaction &senderEntry, uint64_t receiverId,
                                   std::optional<int64_t> receiverBalanceAfter) const {
  LedgerStore::Draft leg;
  leg.ownerId = receiverId;
  leg.type = TransactionType::TRANSFER;
  leg.direction = Direction::CREDIT;
  leg.paymentMethod = PaymentMethod::WALLET;
  leg.amount = senderEntry.amount;
  leg.currency = senderEntry.currency;
  leg.initialStatus = TransactionStatus::COMPLETED;
  leg.senderDetails = senderEntry.senderDetails;
  leg.receiverDetails = senderEntry.receiverDetails;
  leg.description = "Received from " + senderEntry.senderDetails.name;
  leg.remarks = senderEntry.remarks;
  leg.category = "transfer";
  if (receiverBalanceAfter) {
    leg.balanceBefore = *receiverBalanceAfter - senderEntry.amount;
    leg.balanceAfter = receiverBalanceAfter;
  }
  leg.metadata["senderId"] = std::to_string(senderEntry.ownerId);
  leg.metadata["senderName"] = senderEntry.senderDetails.name;
  leg.metadata["relatedTransactionId"] = senderEntry.transactionId;
  leg.reason = "Transfer received";
  return leg;
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::resolveHeld(uint64_t ownerId, const std::string &transactionId,
                              const Resolution &resolution) {
  if (resolution.outcome != TransactionStatus::COMPLETED &&
      resolution.outcome != TransactionStatus::FAILED) {
    return makeError(E_VALIDATION, "A held entry resolves to completed or failed");
  }

  auto found = store_.findByTransactionId(transactionId);
  if (!found || found.value().ownerId != ownerId) {
    return makeError(E_NOT_FOUND, "Transaction not found: " + transactionId);
  }
  const std::optional<uint64_t> receiverId = transferReceiver(found.value());

  // A held transfer may still owe its receiver a correction
  auto ownerLock = userLock(ownerId);
  std::shared_ptr<std::mutex> receiverLock;
  std::unique_lock<std::mutex> ownerGuard(*ownerLock, std::defer_lock);
  std::unique_lock<std::mutex> receiverGuard;
  if (receiverId && *receiverId != ownerId) {
    receiverLock = userLock(*receiverId);
    receiverGuard = std::unique_lock<std::mutex>(*receiverLock, std::defer_lock);
    std::lock(ownerGuard, receiverGuard);
  } else {
    ownerGuard.lock();
  }

  found = store_.findByTransactionId(transactionId);
  if (!found) {
    return makeError(E_NOT_FOUND, "Transaction not found: " + transactionId);
  }
  const Transaction entry = found.value();
  if (entry.status != TransactionStatus::ON_HOLD) {
    return makeError(E_INVALID_OPERATION, transactionId + " is " +
                                              toString(entry.status) +
                                              ", not on_hold");
  }

  const bool receiverUnreversed = receiverId && entry.errorDetails &&
                                  entry.errorDetails->code == CODE_RECEIVER_UNREVERSED;
  const std::optional<Transaction> leg =
      receiverId ? findReceiverLeg(entry) : std::nullopt;
  const bool adjust = resolution.adjustBalance && entry.affectsBalance;

  int64_t correction = 0;
  int64_t receiverCorrection = 0;
  bool writeLeg = false;
  if (resolution.outcome == TransactionStatus::FAILED) {
    if (leg) {
      return makeError(E_INVALID_OPERATION,
                       "Receiver already credited for " + transactionId, transactionId);
    }
    if (adjust && entry.isDebit()) {
      correction = entry.totalAmount;
      if (receiverUnreversed) {
        receiverCorrection = -entry.amount;
      }
    }
  } else {
    if (adjust && entry.isCredit()) {
      correction = entry.amount;
    }
    if (receiverId && !leg) {
      if (receiverUnreversed) {
        writeLeg = true;
      } else if (adjust) {
        return makeError(E_INVALID_OPERATION,
                         "Receiver was never credited for " + transactionId +
                             "; resolve it as failed",
                         transactionId);
      }
    }
  }

  if (receiverCorrection != 0) {
    auto reversed = accounts_.atomicAdjust(*receiverId, receiverCorrection);
    if (!reversed) {
      Error error = fromAccounts(reversed.error());
      error.message = "Could not reverse receiver credit: " + error.message;
      error.transactionId = transactionId;
      return error;
    }
  }

  LedgerStore::StatusUpdate update;
  update.reason = resolution.reason.empty() ? "Resolved by " + resolution.actor
                                            : resolution.reason;
  update.actor = resolution.actor;
  if (correction != 0) {
    auto adjusted = accounts_.atomicAdjust(ownerId, correction);
    if (!adjusted) {
      if (receiverCorrection != 0) {
        auto restored = accounts_.atomicAdjust(*receiverId, -receiverCorrection);
        if (!restored) {
          log().error << "Could not restore receiver credit for " << transactionId
                      << ": " << restored.error().message;
        }
      }
      Error error = fromAccounts(adjusted.error());
      error.transactionId = transactionId;
      return error;
    }
    update.balanceAfter = adjusted.value();
  }

  if (writeLeg) {
    auto draft = receiverLegDraft(entry, *receiverId, std::nullopt);
    draft.actor = resolution.actor;
    draft.reason = "Transfer received; recorded on resolution of " + transactionId;
    auto recorded = store_.create(draft);
    if (!recorded) {
      return fromStore(recorded.error(), transactionId);
    }
    log().info << "Recorded receiver leg " << recorded.value().transactionId << " for "
               << transactionId;
  }

  auto updated = store_.updateStatus(entry.id, resolution.outcome, update);
  if (!updated) {
    if (correction != 0) {
      auto undone = accounts_.atomicAdjust(ownerId, -correction);
      if (!undone) {
        log().error << "Could not undo correction for " << transactionId << ": "
                    << undone.error().message;
      }
    }
    if (receiverCorrection != 0) {
      auto restored = accounts_.atomicAdjust(*receiverId, -receiverCorrection);
      if (!restored) {
        log().error << "Could not restore receiver credit for " << transactionId
                    << ": " << restored.error().message;
      }
    }
    return fromStore(updated.error(), transactionId);
  }

  log().info << transactionId << " resolved as " << toString(resolution.outcome)
             << " by " << resolution.actor;
  return updated.value();
}

PaymentProcessor::Roe<LedgerStore::Page>
PaymentProcessor::getStatement(uint64_t ownerId,
                               const LedgerStore::Filter &filter) const {
  auto page = store_.findByOwner(ownerId, filter);
  if (!page) {
    return fromStore(page.error());
  }
  return page.value();
}

PaymentProcessor::Roe<Analytics::Statistics>
PaymentProcessor::getStatistics(uint64_t ownerId,
                                const Analytics::DateRange &range) const {
  auto stats = analytics_.statistics(ownerId, range);
  if (!stats) {
    return makeError(E_VALIDATION, stats.error().message);
  }
  return stats.value();
}

PaymentProcessor::Roe<Analytics::MonthlySummary>
PaymentProcessor::getMonthlySummary(uint64_t ownerId, int year, int month) const {
  auto summary = analytics_.monthlySummary(ownerId, year, month);
  if (!summary) {
    return makeError(E_VALIDATION, summary.error().message);
  }
  return summary.value();
}

PaymentProcessor::Roe<std::vector<Transaction>>
PaymentProcessor::searchLedger(uint64_t ownerId, const std::string &query,
                               size_t limit) const {
  auto results = analytics_.search(ownerId, query, limit);
  if (!results) {
    return makeError(E_VALIDATION, results.error().message);
  }
  return results.value();
}

PaymentProcessor::Roe<Transaction>
PaymentProcessor::getTransaction(uint64_t ownerId,
                                 const std::string &transactionId) const {
  auto found = store_.findByTransactionId(transactionId);
  if (!found || found.value().ownerId != ownerId) {
    return makeError(E_NOT_FOUND, "Transaction not found: " + transactionId);
  }
  return found.value();
}

PaymentProcessor::Roe<int64_t> PaymentProcessor::getBalance(uint64_t ownerId) const {
  auto balance = accounts_.getBalance(ownerId);
  if (!balance) {
    return fromAccounts(balance.error());
  }
  return balance.value();
}

} // namespace paisa
