#include "LedgerStore.h"
#include "Utilities.h"

#include <algorithm>
#include <filesystem>
#include <limits>

namespace paisa {

namespace {

const std::string BASE36_ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

bool isValidInitialStatus(TransactionStatus status) {
  return status == TransactionStatus::PENDING ||
         status == TransactionStatus::PROCESSING ||
         status == TransactionStatus::ON_HOLD ||
         status == TransactionStatus::COMPLETED;
}

} // namespace

LedgerStore::LedgerStore() : Module("paisa.ledger.store") {}

std::string LedgerStore::generateTransactionId(int64_t nowMs) {
  return "TXN" + utl::toBase36(static_cast<uint64_t>(nowMs)) +
         utl::randomString(6, BASE36_ALPHABET);
}

int64_t LedgerStore::now() const {
  return config_.clock ? config_.clock() : utl::getCurrentTimeMs();
}

LedgerStore::Roe<void> LedgerStore::init(const InitConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  clear();
  config_ = config;
  if (config_.maxPageLimit == 0) {
    config_.maxPageLimit = DEFAULT_MAX_LIMIT;
  }
  if (config_.maxIdAttempts == 0) {
    config_.maxIdAttempts = 1;
  }

  if (config_.workDir.empty()) {
    log().info << "Ledger store running in memory";
    return {};
  }

  std::error_code ec;
  std::filesystem::create_directories(config_.workDir, ec);
  if (ec || !std::filesystem::is_directory(config_.workDir)) {
    return Error(E_PERSISTENCE, "Failed to create work directory " +
                                    config_.workDir);
  }
  journalPath_ = config_.workDir + "/" + JOURNAL_FILE;

  auto replayResult = replayJournal();
  if (!replayResult) {
    return replayResult;
  }
  auto openResult = openJournal();
  if (!openResult) {
    return openResult;
  }

  log().info << "Ledger store mounted at " << config_.workDir << " with "
             << byId_.size() << " entries";
  return {};
}

void LedgerStore::clear() {
  if (journal_.is_open()) {
    journal_.close();
  }
  journalPath_.clear();
  nextId_ = 1;
  byId_.clear();
  byTransactionId_.clear();
  byOwner_.clear();
  byExternalRef_.clear();
}

LedgerStore::Roe<void> LedgerStore::openJournal() {
  // A crash can leave the last record without its newline
  bool needsNewline = false;
  {
    std::ifstream in(journalPath_, std::ios::binary | std::ios::ate);
    if (in.is_open() && in.tellg() > 0) {
      in.seekg(-1, std::ios::end);
      char last = 0;
      in.get(last);
      needsNewline = last != '\n';
    }
  }

  journal_.open(journalPath_, std::ios::out | std::ios::app);
  if (!journal_.is_open()) {
    return Error(E_PERSISTENCE, "Failed to open journal: " + journalPath_);
  }
  if (needsNewline) {
    journal_ << '\n';
    journal_.flush();
  }
  return {};
}

LedgerStore::Roe<void> LedgerStore::replayJournal() {
  std::ifstream in(journalPath_, std::ios::binary);
  if (!in.is_open()) {
    // Fresh ledger
    return {};
  }

  struct Line {
    std::streamoff offset;
    std::string text;
  };
  std::vector<Line> lines;
  std::string text;
  std::streamoff offset = in.tellg();
  while (std::getline(in, text)) {
    lines.push_back({ offset, text });
    offset = in.tellg();
  }
  in.close();

  size_t last = lines.size();
  for (size_t i = lines.size(); i > 0; --i) {
    if (!lines[i - 1].text.empty()) {
      last = i - 1;
      break;
    }
  }

  for (size_t i = 0; i < lines.size(); ++i) {
    if (lines[i].text.empty()) {
      continue;
    }
    auto record = nlohmann::json::parse(lines[i].text, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
      if (i != last) {
        return Error(E_PERSISTENCE, "Malformed journal line " + std::to_string(i + 1));
      }
      // Torn final write from a crash; cut it so later appends stay parseable
      log().warning << "Dropping incomplete journal line " << i + 1;
      std::error_code ec;
      std::filesystem::resize_file(journalPath_,
                                   static_cast<uintmax_t>(lines[i].offset), ec);
      if (ec) {
        return Error(E_PERSISTENCE, "Failed to truncate journal: " + ec.message());
      }
      break;
    }
    try {
      auto result = replayRecord(record);
      if (!result) {
        return Error(E_PERSISTENCE, "Journal line " + std::to_string(i + 1) + ": " +
                                        result.error().message);
      }
    } catch (const nlohmann::json::exception &e) {
      return Error(E_PERSISTENCE, "Journal line " + std::to_string(i + 1) + ": " +
                                      e.what());
    }
  }
  return {};
}

LedgerStore::Roe<void> LedgerStore::replayRecord(const nlohmann::json &record) {
  std::string op = record.value("op", std::string());

  if (op == "create") {
    Transaction tx;
    if (!record.contains("entry") || !tx.fromJson(record["entry"])) {
      return Error(E_PERSISTENCE, "Invalid create record");
    }
    if (byId_.count(tx.id) > 0 || byTransactionId_.count(tx.transactionId) > 0) {
      return Error(E_DUPLICATE, "Duplicate entry " + tx.transactionId);
    }
    if (!tx.externalReferenceId.empty() &&
        byExternalRef_.count({ tx.ownerId, tx.externalReferenceId }) > 0) {
      return Error(E_DUPLICATE, "Duplicate external reference " + tx.externalReferenceId);
    }
    insert(tx);
    nextId_ = std::max(nextId_, tx.id + 1);
    return {};
  }

  if (op == "status") {
    if (!record.contains("id") || !record["id"].is_number_unsigned()) {
      return Error(E_PERSISTENCE, "Status record without an entry id");
    }
    uint64_t id = record["id"].get<uint64_t>();
    auto it = byId_.find(id);
    if (it == byId_.end()) {
      return Error(E_NOT_FOUND, "Status record for unknown entry " +
                                    std::to_string(id));
    }
    TransactionStatus status;
    if (!parseTransactionStatus(record.value("status", std::string()), status)) {
      return Error(E_PERSISTENCE, "Invalid status in record");
    }
    if (!isTransitionAllowed(it->second.status, status)) {
      return Error(E_TRANSITION, "Illegal transition " + toString(it->second.status) +
                                     " -> " + toString(status) + " for " +
                                     it->second.transactionId);
    }
    StatusUpdate update;
    update.reason = record.value("reason", std::string());
    update.actor = record.value("actor", std::string());
    if (record.contains("balanceAfter")) {
      if (!record["balanceAfter"].is_number_integer()) {
        return Error(E_PERSISTENCE, "Invalid balanceAfter in record");
      }
      update.balanceAfter = record["balanceAfter"].get<int64_t>();
    }
    if (record.contains("errorDetails")) {
      update.errorDetails = ErrorDetails::fromJson(record["errorDetails"]);
    }
    update.gatewayReference = record.value("gatewayReference", std::string());
    applyStatus(it->second, status, record.value("timestamp", int64_t(0)),
                update);
    return {};
  }

  if (op == "erase") {
    eraseOwner(record.value("ownerId", uint64_t(0)));
    return {};
  }

  return Error(E_PERSISTENCE, "Unknown journal op: " + op);
}

LedgerStore::Roe<void> LedgerStore::appendJournal(const nlohmann::json &record) {
  if (journalPath_.empty()) {
    return {};
  }
  journal_ << record.dump() << '\n';
  journal_.flush();
  if (!journal_) {
    journal_.clear();
    return Error(E_PERSISTENCE, "Failed to write journal: " + journalPath_);
  }
  return {};
}

void LedgerStore::insert(const Transaction &tx) {
  byId_[tx.id] = tx;
  byTransactionId_[tx.transactionId] = tx.id;
  byOwner_[tx.ownerId].push_back(tx.id);
  if (!tx.externalReferenceId.empty()) {
    byExternalRef_[{ tx.ownerId, tx.externalReferenceId }] = tx.id;
  }
}

void LedgerStore::eraseOwner(uint64_t ownerId) {
  auto it = byOwner_.find(ownerId);
  if (it == byOwner_.end()) {
    return;
  }
  for (uint64_t id : it->second) {
    auto txIt = byId_.find(id);
    if (txIt == byId_.end()) {
      continue;
    }
    byTransactionId_.erase(txIt->second.transactionId);
    if (!txIt->second.externalReferenceId.empty()) {
      byExternalRef_.erase({ ownerId, txIt->second.externalReferenceId });
    }
    byId_.erase(txIt);
  }
  byOwner_.erase(it);
}

void LedgerStore::applyStatus(Transaction &tx, TransactionStatus status,
                              int64_t timestamp,
                              const StatusUpdate &update) const {
  StatusChange change;
  change.status = status;
  change.timestamp = timestamp;
  change.reason = update.reason;
  change.actor = update.actor;
  tx.statusHistory.push_back(change);

  tx.status = status;
  tx.updatedAt = timestamp;
  if (status == TransactionStatus::COMPLETED) {
    tx.completedAt = timestamp;
  }
  if (update.balanceAfter) {
    tx.balanceAfter = update.balanceAfter;
  }
  if (update.errorDetails) {
    tx.errorDetails = update.errorDetails;
  }
  if (!update.gatewayReference.empty()) {
    tx.gatewayReference = update.gatewayReference;
  }
}

LedgerStore::Roe<Transaction> LedgerStore::create(const Draft &draft) {
  if (!draft.type) {
    return Error(E_VALIDATION, "Transaction type is required");
  }
  if (!draft.paymentMethod) {
    return Error(E_VALIDATION, "Payment method is required");
  }
  if (draft.amount <= 0) {
    return Error(E_VALIDATION, "Amount must be positive");
  }
  if (draft.fee < 0 || draft.tax < 0) {
    return Error(E_VALIDATION, "Fee and tax must not be negative");
  }
  if (draft.ownerId == 0) {
    return Error(E_VALIDATION, "Owner is required");
  }
  if (!isValidInitialStatus(draft.initialStatus)) {
    return Error(E_VALIDATION, "Invalid initial status: " +
                                   toString(draft.initialStatus));
  }

  Transaction tx;
  tx.ownerId = draft.ownerId;
  tx.type = *draft.type;
  tx.direction = draft.direction ? *draft.direction : inferDirection(tx.type);
  tx.paymentMethod = *draft.paymentMethod;
  tx.amount = draft.amount;
  tx.fee = draft.fee;
  tx.tax = draft.tax;
  if (tx.isDebit()) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    if (tx.fee > max - tx.amount || tx.tax > max - tx.amount - tx.fee) {
      return Error(E_VALIDATION, "Total amount overflows");
    }
    tx.totalAmount = tx.amount + tx.fee + tx.tax;
  } else {
    tx.totalAmount = tx.amount;
  }
  tx.currency = draft.currency.empty() ? "INR" : draft.currency;
  tx.status = draft.initialStatus;
  tx.description = draft.description;
  tx.remarks = draft.remarks;
  tx.category = draft.category;
  tx.senderDetails = draft.senderDetails;
  tx.receiverDetails = draft.receiverDetails;
  tx.balanceBefore = draft.balanceBefore;
  tx.balanceAfter = draft.balanceAfter;
  tx.paymentMethodDetails = draft.paymentMethodDetails;
  tx.externalReferenceId = draft.externalReferenceId;
  tx.gatewayReference = draft.gatewayReference;
  tx.affectsBalance = draft.affectsBalance;
  tx.metadata = draft.metadata;

  std::lock_guard<std::mutex> lock(mutex_);
  int64_t ts = now();

  if (!draft.transactionId.empty()) {
    if (byTransactionId_.count(draft.transactionId) > 0) {
      return Error(E_DUPLICATE,
                   "Transaction id already exists: " + draft.transactionId);
    }
    tx.transactionId = draft.transactionId;
  } else {
    const IdGenerator &generate =
        config_.idGenerator ? config_.idGenerator : generateTransactionId;
    for (uint32_t attempt = 0; attempt < config_.maxIdAttempts; ++attempt) {
      std::string candidate = generate(ts);
      if (byTransactionId_.count(candidate) == 0) {
        tx.transactionId = candidate;
        break;
      }
      log().warning << "Transaction id collision on " << candidate
                    << ", drawing a new suffix";
    }
    if (tx.transactionId.empty()) {
      return Error(E_DUPLICATE, "Could not generate a unique transaction id after " +
                                    std::to_string(config_.maxIdAttempts) +
                                    " attempts");
    }
  }

  if (!tx.externalReferenceId.empty() &&
      byExternalRef_.count({ tx.ownerId, tx.externalReferenceId }) > 0) {
    return Error(E_DUPLICATE, "External reference already recorded: " +
                                  tx.externalReferenceId);
  }

  tx.id = nextId_;
  tx.createdAt = ts;
  tx.initiatedAt = ts;
  tx.updatedAt = ts;
  tx.statusHistory.push_back({ tx.status, ts, draft.reason, draft.actor });
  if (tx.status == TransactionStatus::COMPLETED) {
    tx.completedAt = ts;
  }

  auto journalResult = appendJournal({ { "op", "create" }, { "entry", tx.toJson() } });
  if (!journalResult) {
    log().error << journalResult.error().message;
    return journalResult.error();
  }

  insert(tx);
  ++nextId_;
  log().debug << "Created " << tx.transactionId << " owner=" << tx.ownerId
              << " type=" << toString(tx.type) << " amount=" << tx.amount
              << " status=" << toString(tx.status);
  return tx;
}

LedgerStore::Roe<Transaction> LedgerStore::findById(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = byId_.find(id);
  if (it == byId_.end()) {
    return Error(E_NOT_FOUND, "Transaction not found: " + std::to_string(id));
  }
  return it->second;
}

LedgerStore::Roe<Transaction>
LedgerStore::findByTransactionId(const std::string &transactionId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = byTransactionId_.find(transactionId);
  if (it == byTransactionId_.end()) {
    return Error(E_NOT_FOUND, "Transaction not found: " + transactionId);
  }
  return byId_.at(it->second);
}

LedgerStore::Roe<Transaction>
LedgerStore::findByExternalReference(uint64_t ownerId,
                                     const std::string &reference) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = byExternalRef_.find({ ownerId, reference });
  if (it == byExternalRef_.end()) {
    return Error(E_NOT_FOUND, "No transaction with external reference " +
                                  reference);
  }
  return byId_.at(it->second);
}

size_t LedgerStore::effectiveLimit(size_t requested) const {
  if (requested == 0) {
    return std::min(DEFAULT_LIMIT, config_.maxPageLimit);
  }
  return std::min(requested, config_.maxPageLimit);
}

bool LedgerStore::matches(const Transaction &tx, const Filter &filter) const {
  if (!filter.types.empty() && filter.types.count(tx.type) == 0) {
    return false;
  }
  if (!filter.statuses.empty() && filter.statuses.count(tx.status) == 0) {
    return false;
  }
  if (!filter.methods.empty() && filter.methods.count(tx.paymentMethod) == 0) {
    return false;
  }
  if (filter.direction && *filter.direction != tx.direction) {
    return false;
  }
  if (filter.fromMs && tx.createdAt < *filter.fromMs) {
    return false;
  }
  if (filter.toMs && tx.createdAt > *filter.toMs) {
    return false;
  }
  if (filter.minAmount && tx.amount < *filter.minAmount) {
    return false;
  }
  if (filter.maxAmount && tx.amount > *filter.maxAmount) {
    return false;
  }
  if (!filter.category.empty() && filter.category != tx.category) {
    return false;
  }
  return true;
}

LedgerStore::Roe<LedgerStore::Page>
LedgerStore::findByOwner(uint64_t ownerId, const Filter &filter) const {
  if (filter.page == 0) {
    return Error(E_VALIDATION, "Page numbers start at 1");
  }
  if (filter.fromMs && filter.toMs && *filter.fromMs > *filter.toMs) {
    return Error(E_VALIDATION, "Date range start is after its end");
  }
  if (filter.minAmount && filter.maxAmount && *filter.minAmount > *filter.maxAmount) {
    return Error(E_VALIDATION, "Minimum amount exceeds maximum amount");
  }

  std::vector<Transaction> matched;
  Page page;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    page.limit = effectiveLimit(filter.limit);
    auto it = byOwner_.find(ownerId);
    if (it != byOwner_.end()) {
      for (uint64_t id : it->second) {
        const Transaction &tx = byId_.at(id);
        if (matches(tx, filter)) {
          matched.push_back(tx);
        }
      }
    }
  }

  auto key = [&filter](const Transaction &tx) {
    switch (filter.sortBy) {
    case SortField::AMOUNT:
      return tx.amount;
    case SortField::UPDATED_AT:
      return tx.updatedAt;
    default:
      return tx.createdAt;
    }
  };
  std::sort(matched.begin(), matched.end(),
            [&](const Transaction &a, const Transaction &b) {
              auto ka = std::make_pair(key(a), a.id);
              auto kb = std::make_pair(key(b), b.id);
              return filter.ascending ? ka < kb : kb < ka;
            });

  page.page = filter.page;
  page.total = matched.size();
  page.totalPages = (page.total + page.limit - 1) / page.limit;

  size_t offset = (filter.page - 1) * page.limit;
  if (offset < matched.size()) {
    size_t end = std::min(matched.size(), offset + page.limit);
    page.entries.assign(std::make_move_iterator(matched.begin() + offset),
                        std::make_move_iterator(matched.begin() + end));
  }
  return page;
}

std::vector<Transaction> LedgerStore::getRecent(uint64_t ownerId,
                                                size_t limit) const {
  Filter filter;
  filter.limit = std::min(limit == 0 ? MAX_RECENT : limit, MAX_RECENT);
  auto page = findByOwner(ownerId, filter);
  if (!page) {
    return {};
  }
  return page->entries;
}

LedgerStore::Roe<Transaction>
LedgerStore::updateStatus(uint64_t id, TransactionStatus status,
                          const StatusUpdate &update) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = byId_.find(id);
  if (it == byId_.end()) {
    return Error(E_NOT_FOUND, "Transaction not found: " + std::to_string(id));
  }
  Transaction &current = it->second;
  if (!isTransitionAllowed(current.status, status)) {
    return Error(E_TRANSITION, "Illegal transition " + toString(current.status) +
                                   " -> " + toString(status) + " for " +
                                   current.transactionId);
  }

  int64_t ts = now();
  if (!current.statusHistory.empty()) {
    ts = std::max(ts, current.statusHistory.back().timestamp);
  }

  Transaction updated = current;
  applyStatus(updated, status, ts, update);

  nlohmann::json record = { { "op", "status" },
                            { "id", id },
                            { "status", toString(status) },
                            { "timestamp", ts },
                            { "reason", update.reason },
                            { "actor", update.actor } };
  if (update.balanceAfter) {
    record["balanceAfter"] = *update.balanceAfter;
  }
  if (update.errorDetails) {
    record["errorDetails"] = update.errorDetails->toJson();
  }
  if (!update.gatewayReference.empty()) {
    record["gatewayReference"] = update.gatewayReference;
  }
  auto journalResult = appendJournal(record);
  if (!journalResult) {
    log().error << journalResult.error().message;
    return journalResult.error();
  }

  current = std::move(updated);
  log().debug << current.transactionId << " -> " << toString(status) << " ("
              << update.reason << ")";
  return current;
}

LedgerStore::Roe<std::vector<Transaction>>
LedgerStore::search(uint64_t ownerId, const std::string &query,
                    size_t limit) const {
  if (query.find_first_not_of(" \t\r\n") == std::string::npos) {
    return Error(E_VALIDATION, "Search query must not be empty");
  }

  std::vector<Transaction> results;
  size_t cap = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cap = effectiveLimit(limit);
    auto it = byOwner_.find(ownerId);
    if (it == byOwner_.end()) {
      return results;
    }
    for (uint64_t id : it->second) {
      const Transaction &tx = byId_.at(id);
      auto recipient = tx.metadata.find("recipientId");
      bool hit = utl::containsIgnoreCase(tx.description, query) ||
                 utl::containsIgnoreCase(tx.remarks, query) ||
                 utl::containsIgnoreCase(tx.transactionId, query) ||
                 utl::containsIgnoreCase(tx.senderDetails.name, query) ||
                 utl::containsIgnoreCase(tx.senderDetails.upiId, query) ||
                 utl::containsIgnoreCase(tx.receiverDetails.name, query) ||
                 utl::containsIgnoreCase(tx.receiverDetails.upiId, query) ||
                 utl::containsIgnoreCase(tx.category, query) ||
                 (recipient != tx.metadata.end() &&
                  utl::containsIgnoreCase(recipient->second, query));
      if (hit) {
        results.push_back(tx);
      }
    }
  }

  std::sort(results.begin(), results.end(),
            [](const Transaction &a, const Transaction &b) {
              return std::make_pair(a.createdAt, a.id) >
                     std::make_pair(b.createdAt, b.id);
            });
  if (results.size() > cap) {
    results.resize(cap);
  }
  return results;
}

LedgerStore::Roe<size_t> LedgerStore::deleteByOwner(uint64_t ownerId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = byOwner_.find(ownerId);
  if (it == byOwner_.end()) {
    return size_t(0);
  }
  size_t count = it->second.size();

  auto journalResult = appendJournal({ { "op", "erase" }, { "ownerId", ownerId } });
  if (!journalResult) {
    log().error << journalResult.error().message;
    return journalResult.error();
  }

  eraseOwner(ownerId);
  log().info << "Erased " << count << " entries of owner " << ownerId;
  return count;
}

std::vector<Transaction> LedgerStore::findStale(TransactionStatus status,
                                                int64_t updatedBeforeMs) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Transaction> stale;
  for (const auto &[id, tx] : byId_) {
    if (tx.status == status && tx.updatedAt < updatedBeforeMs) {
      stale.push_back(tx);
    }
  }
  return stale;
}

void LedgerStore::forEachOwned(
    uint64_t ownerId, const std::function<void(const Transaction &)> &fn) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = byOwner_.find(ownerId);
  if (it == byOwner_.end()) {
    return;
  }
  for (uint64_t id : it->second) {
    fn(byId_.at(id));
  }
}

size_t LedgerStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return byId_.size();
}

} // namespace paisa
