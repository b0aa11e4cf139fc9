#ifndef PAISA_WALLET_BALANCE_ACCESSOR_H
#define PAISA_WALLET_BALANCE_ACCESSOR_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>

namespace paisa {

/**
 * BalanceAccessor - the single source of truth for spendable balances.
 *
 * atomicAdjust is a conditional mutation: a debit that would take the
 * balance below zero fails without changing anything, so two concurrent
 * debits can never both pass against the same funds.
 */
class BalanceAccessor {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_ACCOUNT = 1;
  constexpr static int32_t E_BALANCE = 2;
  constexpr static int32_t E_INPUT = 3;
  constexpr static int32_t E_STORAGE = 4;

  struct UserProfile {
    uint64_t userId{ 0 };
    std::string name;
    std::string email;
    std::string phone;
    std::string upiId;
  };

  virtual ~BalanceAccessor() = default;

  virtual Roe<int64_t> getBalance(uint64_t userId) const = 0;

  /**
   * Add delta (negative to debit) to the balance
   * @return the new balance; E_BALANCE if it would go negative
   */
  virtual Roe<int64_t> atomicAdjust(uint64_t userId, int64_t delta) = 0;

  /**
   * Resolve a user by email (case-insensitive), phone or UPI id
   */
  virtual Roe<uint64_t> findUser(const std::string &identifier) const = 0;

  virtual Roe<UserProfile> getProfile(uint64_t userId) const = 0;
};

} // namespace paisa

#endif // PAISA_WALLET_BALANCE_ACCESSOR_H
