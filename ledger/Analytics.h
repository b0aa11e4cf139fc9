#pragma once

#include "LedgerStore.h"
#include "Module.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace paisa {

/**
 * Analytics - read-only aggregation over a LedgerStore.
 * All sums are int64 minor units over the stored amount field.
 */
class Analytics : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_VALIDATION = 1;

  struct Bucket {
    size_t count{ 0 };
    int64_t amount{ 0 };

    nlohmann::json toJson() const;
  };

  struct DateRange {
    // Inclusive bounds on createdAt
    std::optional<int64_t> fromMs;
    std::optional<int64_t> toMs;
  };

  struct Statistics {
    size_t count{ 0 };
    int64_t totalAmount{ 0 };
    int64_t totalFees{ 0 };
    int64_t totalDebits{ 0 };
    int64_t totalCredits{ 0 };
    int64_t averageAmount{ 0 };
    std::map<std::string, Bucket> byType;
    std::map<std::string, Bucket> byPaymentMethod;
    // Covers every status, not only completed entries
    std::map<std::string, Bucket> byStatus;

    nlohmann::json toJson() const;
  };

  struct DailyRow {
    std::string date;
    int64_t debits{ 0 };
    int64_t credits{ 0 };
    size_t count{ 0 };
  };

  struct MonthlySummary {
    int year{ 0 };
    int month{ 0 };
    size_t count{ 0 };
    int64_t totalDebits{ 0 };
    int64_t totalCredits{ 0 };
    int64_t netFlow{ 0 };
    std::map<std::string, Bucket> byType;
    // Ascending by date
    std::vector<DailyRow> dailyBreakdown;

    nlohmann::json toJson() const;
  };

  struct Reconciliation {
    int64_t expected{ 0 };
    int64_t actual{ 0 };
    int64_t difference{ 0 };
    bool balanced{ false };

    nlohmann::json toJson() const;
  };

  explicit Analytics(const LedgerStore &store);

  Roe<Statistics> statistics(uint64_t ownerId, const DateRange &range) const;

  /**
   * Completed entries created between the first and the last millisecond
   * of the month, UTC
   */
  Roe<MonthlySummary> monthlySummary(uint64_t ownerId, int year,
                                     int month) const;

  /**
   * Replay the owner's applied entries on top of the opening balance and
   * compare with the balance actually held. Completed entries and entries
   * since moved to refunded count; the refund itself is its own credit.
   */
  Reconciliation reconcile(uint64_t ownerId, int64_t openingBalance,
                           int64_t currentBalance) const;

  Roe<std::vector<Transaction>> search(uint64_t ownerId,
                                       const std::string &query,
                                       size_t limit) const;

private:
  const LedgerStore &store_;
};

} // namespace paisa
