#include "Analytics.h"
#include "Utilities.h"

namespace paisa {

namespace {

bool inRange(const Transaction &tx, const Analytics::DateRange &range) {
  if (range.fromMs && tx.createdAt < *range.fromMs) {
    return false;
  }
  if (range.toMs && tx.createdAt > *range.toMs) {
    return false;
  }
  return true;
}

void addTo(std::map<std::string, Analytics::Bucket> &buckets,
           const std::string &key, int64_t amount) {
  auto &bucket = buckets[key];
  bucket.count++;
  bucket.amount += amount;
}

nlohmann::json bucketsToJson(const std::map<std::string, Analytics::Bucket> &buckets) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[key, bucket] : buckets) {
    j[key] = bucket.toJson();
  }
  return j;
}

} // namespace

nlohmann::json Analytics::Bucket::toJson() const {
  return { { "count", count }, { "amount", amount } };
}

nlohmann::json Analytics::Statistics::toJson() const {
  nlohmann::json j;
  j["totalTransactions"] = count;
  j["totalAmount"] = totalAmount;
  j["totalFees"] = totalFees;
  j["totalDebits"] = totalDebits;
  j["totalCredits"] = totalCredits;
  j["averageAmount"] = averageAmount;
  j["byType"] = bucketsToJson(byType);
  j["byPaymentMethod"] = bucketsToJson(byPaymentMethod);
  j["byStatus"] = bucketsToJson(byStatus);
  return j;
}

nlohmann::json Analytics::MonthlySummary::toJson() const {
  nlohmann::json j;
  j["year"] = year;
  j["month"] = month;
  j["totalTransactions"] = count;
  j["totalDebits"] = totalDebits;
  j["totalCredits"] = totalCredits;
  j["netFlow"] = netFlow;
  j["byType"] = bucketsToJson(byType);
  nlohmann::json days = nlohmann::json::array();
  for (const auto &row : dailyBreakdown) {
    days.push_back({ { "date", row.date },
                     { "debits", row.debits },
                     { "credits", row.credits },
                     { "count", row.count } });
  }
  j["dailyBreakdown"] = days;
  return j;
}

nlohmann::json Analytics::Reconciliation::toJson() const {
  return { { "expected", expected },
           { "actual", actual },
           { "difference", difference },
           { "balanced", balanced } };
}

Analytics::Analytics(const LedgerStore &store)
    : Module("paisa.ledger.analytics"), store_(store) {}

Analytics::Roe<Analytics::Statistics>
Analytics::statistics(uint64_t ownerId, const DateRange &range) const {
  if (range.fromMs && range.toMs && *range.fromMs > *range.toMs) {
    return Error(E_VALIDATION, "Date range start is after its end");
  }

  Statistics stats;
  store_.forEachOwned(ownerId, [&](const Transaction &tx) {
    if (!inRange(tx, range)) {
      return;
    }
    addTo(stats.byStatus, toString(tx.status), tx.amount);
    if (tx.status != TransactionStatus::COMPLETED) {
      return;
    }
    stats.count++;
    stats.totalAmount += tx.amount;
    stats.totalFees += tx.fee;
    if (tx.isDebit()) {
      stats.totalDebits += tx.amount;
    } else {
      stats.totalCredits += tx.amount;
    }
    addTo(stats.byType, toString(tx.type), tx.amount);
    addTo(stats.byPaymentMethod, toString(tx.paymentMethod), tx.amount);
  });

  if (stats.count > 0) {
    stats.averageAmount = stats.totalAmount / static_cast<int64_t>(stats.count);
  }
  return stats;
}

Analytics::Roe<Analytics::MonthlySummary>
Analytics::monthlySummary(uint64_t ownerId, int year, int month) const {
  int64_t startMs = 0;
  int64_t endMs = 0;
  if (!utl::monthRangeMs(year, month, startMs, endMs)) {
    return Error(E_VALIDATION, "Month must be between 1 and 12, got " +
                                   std::to_string(month));
  }

  MonthlySummary summary;
  summary.year = year;
  summary.month = month;

  // Keyed by YYYY-MM-DD, which sorts chronologically
  std::map<std::string, DailyRow> days;
  store_.forEachOwned(ownerId, [&](const Transaction &tx) {
    if (tx.status != TransactionStatus::COMPLETED || tx.createdAt < startMs ||
        tx.createdAt > endMs) {
      return;
    }
    summary.count++;
    std::string date = utl::formatDate(tx.createdAt);
    DailyRow &row = days[date];
    row.date = date;
    row.count++;
    if (tx.isDebit()) {
      summary.totalDebits += tx.amount;
      row.debits += tx.amount;
    } else {
      summary.totalCredits += tx.amount;
      row.credits += tx.amount;
    }
    addTo(summary.byType, toString(tx.type), tx.amount);
  });

  summary.netFlow = summary.totalCredits - summary.totalDebits;
  for (auto &[date, row] : days) {
    summary.dailyBreakdown.push_back(row);
  }
  return summary;
}

Analytics::Reconciliation Analytics::reconcile(uint64_t ownerId,
                                               int64_t openingBalance,
                                               int64_t currentBalance) const {
  Reconciliation result;
  result.expected = openingBalance;
  store_.forEachOwned(ownerId, [&](const Transaction &tx) {
    if (tx.status == TransactionStatus::COMPLETED ||
        tx.status == TransactionStatus::REFUNDED) {
      result.expected += tx.balanceEffect();
    }
  });
  result.actual = currentBalance;
  result.difference = result.actual - result.expected;
  result.balanced = result.difference == 0;
  if (!result.balanced) {
    log().warning << "Owner " << ownerId << " is out of balance by "
                  << result.difference;
  }
  return result;
}

Analytics::Roe<std::vector<Transaction>>
Analytics::search(uint64_t ownerId, const std::string &query,
                  size_t limit) const {
  auto result = store_.search(ownerId, query, limit);
  if (!result) {
    return Error(E_VALIDATION, result.error().message);
  }
  return result.value();
}

} // namespace paisa
