#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include "Transaction.h"

#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace paisa {

/**
 * LedgerStore - durable record of every ledger entry.
 *
 * Entries live in memory, indexed by id, transactionId, owner and
 * (owner, externalReferenceId). When a work directory is given, every
 * mutation is first appended to <workDir>/ledger.journal as one JSON line
 * and the journal is replayed on init, so the in-memory state is always a
 * prefix of what is on disk.
 *
 * The store holds no business policy beyond the status transition table.
 */
class LedgerStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_VALIDATION = 1;
  constexpr static int32_t E_NOT_FOUND = 2;
  constexpr static int32_t E_DUPLICATE = 3;
  constexpr static int32_t E_TRANSITION = 4;
  constexpr static int32_t E_PERSISTENCE = 5;

  constexpr static size_t DEFAULT_LIMIT = 20;
  constexpr static size_t DEFAULT_MAX_LIMIT = 100;
  constexpr static size_t MAX_RECENT = 20;

  constexpr static const char *JOURNAL_FILE = "ledger.journal";

  using Clock = std::function<int64_t()>;
  using IdGenerator = std::function<std::string(int64_t nowMs)>;

  struct InitConfig {
    // Empty keeps the store in memory only
    std::string workDir;
    size_t maxPageLimit{ DEFAULT_MAX_LIMIT };
    uint32_t maxIdAttempts{ 8 };
    Clock clock;
    IdGenerator idGenerator;
  };

  /**
   * Fields a caller supplies for a new entry. Everything else is assigned
   * by the store.
   */
  struct Draft {
    uint64_t ownerId{ 0 };
    std::optional<TransactionType> type;
    // Inferred from type when absent
    std::optional<Direction> direction;
    std::optional<PaymentMethod> paymentMethod;
    int64_t amount{ 0 };
    int64_t fee{ 0 };
    int64_t tax{ 0 };
    std::string currency{ "INR" };
    TransactionStatus initialStatus{ TransactionStatus::PROCESSING };
    // Generated when empty; a caller-supplied id must be unused
    std::string transactionId;
    std::string description;
    std::string remarks;
    std::string category;
    PartyDetails senderDetails;
    PartyDetails receiverDetails;
    std::optional<int64_t> balanceBefore;
    std::optional<int64_t> balanceAfter;
    PaymentMethodDetails paymentMethodDetails;
    std::string externalReferenceId;
    std::string gatewayReference;
    bool affectsBalance{ true };
    std::map<std::string, std::string> metadata;
    std::string reason{ "Transaction initiated" };
    std::string actor{ "system" };
  };

  enum class SortField { CREATED_AT, AMOUNT, UPDATED_AT };

  struct Filter {
    std::set<TransactionType> types;
    std::set<TransactionStatus> statuses;
    std::set<PaymentMethod> methods;
    std::optional<Direction> direction;
    // Inclusive bounds on createdAt
    std::optional<int64_t> fromMs;
    std::optional<int64_t> toMs;
    // Inclusive bounds on amount
    std::optional<int64_t> minAmount;
    std::optional<int64_t> maxAmount;
    std::string category;
    SortField sortBy{ SortField::CREATED_AT };
    bool ascending{ false };
    // 1-based
    size_t page{ 1 };
    // 0 selects DEFAULT_LIMIT; larger values are capped at maxPageLimit
    size_t limit{ 0 };
  };

  struct Page {
    std::vector<Transaction> entries;
    size_t total{ 0 };
    size_t page{ 1 };
    size_t limit{ DEFAULT_LIMIT };
    size_t totalPages{ 0 };
  };

  struct StatusUpdate {
    std::string reason;
    std::string actor{ "system" };
    std::optional<int64_t> balanceAfter;
    std::optional<ErrorDetails> errorDetails;
    std::string gatewayReference;
  };

  LedgerStore();
  ~LedgerStore() override = default;

  /**
   * Reset the store and, when config.workDir is set, replay its journal
   */
  Roe<void> init(const InitConfig &config);

  Roe<Transaction> create(const Draft &draft);

  Roe<Transaction> findById(uint64_t id) const;
  Roe<Transaction> findByTransactionId(const std::string &transactionId) const;
  Roe<Transaction> findByExternalReference(uint64_t ownerId,
                                           const std::string &reference) const;

  Roe<Page> findByOwner(uint64_t ownerId, const Filter &filter) const;

  /**
   * Newest entries of an owner, at most MAX_RECENT
   */
  std::vector<Transaction> getRecent(uint64_t ownerId, size_t limit) const;

  /**
   * The only mutation path for an existing entry. Appends to the status
   * history with a timestamp no earlier than the previous one.
   */
  Roe<Transaction> updateStatus(uint64_t id, TransactionStatus status,
                                const StatusUpdate &update);

  /**
   * Case-insensitive substring match over description, remarks,
   * transactionId, counterpart names and UPI ids, metadata recipientId and
   * category; newest first
   */
  Roe<std::vector<Transaction>> search(uint64_t ownerId,
                                       const std::string &query,
                                       size_t limit) const;

  /**
   * Erase every entry of an owner. Irreversible.
   * @return number of entries removed
   */
  Roe<size_t> deleteByOwner(uint64_t ownerId);

  /**
   * Entries in the given status whose last status change is older than
   * the cutoff
   */
  std::vector<Transaction> findStale(TransactionStatus status,
                                     int64_t updatedBeforeMs) const;

  void forEachOwned(uint64_t ownerId,
                    const std::function<void(const Transaction &)> &fn) const;

  size_t size() const;
  int64_t now() const;

  /**
   * "TXN" + base36 timestamp + 6 random base36 characters
   */
  static std::string generateTransactionId(int64_t nowMs);

private:
  void clear();
  Roe<void> openJournal();
  Roe<void> replayJournal();
  Roe<void> replayRecord(const nlohmann::json &record);
  Roe<void> appendJournal(const nlohmann::json &record);

  size_t effectiveLimit(size_t requested) const;
  bool matches(const Transaction &tx, const Filter &filter) const;

  void insert(const Transaction &tx);
  void applyStatus(Transaction &tx, TransactionStatus status, int64_t timestamp,
                   const StatusUpdate &update) const;
  void eraseOwner(uint64_t ownerId);

  InitConfig config_;
  std::string journalPath_;
  std::ofstream journal_;

  uint64_t nextId_{ 1 };
  std::map<uint64_t, Transaction> byId_;
  std::unordered_map<std::string, uint64_t> byTransactionId_;
  std::unordered_map<uint64_t, std::vector<uint64_t>> byOwner_;
  std::map<std::pair<uint64_t, std::string>, uint64_t> byExternalRef_;

  mutable std::mutex mutex_;
};

} // namespace paisa
