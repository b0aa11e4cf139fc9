#ifndef PAISA_WALLET_ACCOUNT_BOOK_H
#define PAISA_WALLET_ACCOUNT_BOOK_H

#include "BalanceAccessor.h"
#include "Module.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace paisa {

/**
 * AccountBook - in-memory wallet accounts behind the BalanceAccessor
 * boundary, optionally persisted to <workDir>/accounts.json after every
 * change.
 */
class AccountBook : public Module, public BalanceAccessor {
public:
  constexpr static uint64_t ID_FIRST_USER = 1001;
  constexpr static const char *ACCOUNTS_FILE = "accounts.json";

  struct Account {
    UserProfile profile;
    int64_t balance{ 0 };
    // Balance the account was opened with; the base for reconciliation
    int64_t openingBalance{ 0 };

    nlohmann::json toJson() const;
    bool fromJson(const nlohmann::json &j);
  };

  struct InitConfig {
    // Empty keeps accounts in memory only
    std::string workDir;
  };

  AccountBook();
  ~AccountBook() override = default;

  Roe<void> init(const InitConfig &config);

  /**
   * Open a wallet. A zero profile.userId draws the next free id.
   * Email, phone and UPI id must not belong to another account.
   */
  Roe<uint64_t> openAccount(const UserProfile &profile, int64_t openingBalance);

  /**
   * Close a wallet. No-op if the id does not exist.
   */
  Roe<void> closeAccount(uint64_t userId);

  bool hasAccount(uint64_t userId) const;
  Roe<Account> getAccount(uint64_t userId) const;
  Roe<int64_t> getOpeningBalance(uint64_t userId) const;
  std::vector<uint64_t> getAccountIds() const;

  // BalanceAccessor
  Roe<int64_t> getBalance(uint64_t userId) const override;
  Roe<int64_t> atomicAdjust(uint64_t userId, int64_t delta) override;
  Roe<uint64_t> findUser(const std::string &identifier) const override;
  Roe<UserProfile> getProfile(uint64_t userId) const override;

private:
  Roe<void> saveLocked() const;
  Roe<void> load();
  bool isIdentityTaken(const UserProfile &profile) const;

  std::string accountsPath_;
  uint64_t nextId_{ ID_FIRST_USER };
  std::map<uint64_t, Account> mAccounts_;
  mutable std::mutex mutex_;
};

} // namespace paisa

#endif // PAISA_WALLET_ACCOUNT_BOOK_H
