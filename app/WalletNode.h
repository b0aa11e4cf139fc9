#ifndef PAISA_APP_WALLET_NODE_H
#define PAISA_APP_WALLET_NODE_H

#include "AccountBook.h"
#include "CredentialVault.h"
#include "LedgerStore.h"
#include "Module.h"
#include "PaymentProcessor.h"
#include "ResultOrError.hpp"
#include "SettlementGateway.h"
#include "StuckEntrySweeper.h"

#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace paisa {

/**
 * WalletNode - one wallet installation rooted at a work directory.
 *
 * Loads (or creates) <workDir>/config.json, opens the ledger journal, the
 * account book and the credential vault found there, and wires them into
 * a PaymentProcessor and a StuckEntrySweeper.
 *
 * A node holds an exclusive lock on <workDir>/paisa.lock for its lifetime;
 * a second node on the same directory, in this process or another, fails
 * to init.
 */
class WalletNode : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_INIT = 2;
  constexpr static int32_t E_STATE = 3;

  constexpr static const char *FILE_CONFIG = "config.json";
  constexpr static const char *FILE_LOG = "paisa.log";
  constexpr static const char *FILE_LOCK = "paisa.lock";

  struct RunFileConfig {
    std::string currency{ "INR" };
    size_t maxPageLimit{ LedgerStore::DEFAULT_MAX_LIMIT };
    int64_t stuckAfterMs{ 300000 };
    int64_t sweepIntervalMs{ 60000 };
    SimulatedGateway::Config settlement;
    // 0 selects libsodium's interactive limits
    unsigned long long pinOpsLimit{ 0 };
    size_t pinMemLimit{ 0 };
    std::string logLevel{ "INFO" };

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  WalletNode();
  ~WalletNode() override;

  Roe<void> init(const std::string &workDir);

  const RunFileConfig &getConfig() const { return config_; }

  AccountBook &getAccountBook() { return book_; }
  CredentialVault &getCredentialVault() { return vault_; }
  LedgerStore &getLedgerStore() { return store_; }
  PaymentProcessor &getPaymentProcessor();
  StuckEntrySweeper &getSweeper();

  /**
   * Open a wallet and enroll its UPI PIN
   */
  Roe<uint64_t> openAccount(const AccountBook::UserProfile &profile,
                            int64_t openingBalance, const std::string &pin);

  /**
   * Remove a user's ledger entries, credentials and account
   * @return number of ledger entries removed
   */
  Roe<size_t> eraseUser(uint64_t userId);

private:
  Roe<void> loadConfig(const std::string &path);
  Roe<void> acquireLock();
  void releaseLock();

  std::string workDir_;
  RunFileConfig config_;
  int lockFd_{ -1 };
  std::shared_ptr<logging::Handler> logHandler_;

  LedgerStore store_;
  AccountBook book_;
  CredentialVault vault_;
  std::unique_ptr<SimulatedGateway> gateway_;
  std::unique_ptr<PaymentProcessor> processor_;
  std::unique_ptr<StuckEntrySweeper> sweeper_;
};

} // namespace paisa

#endif // PAISA_APP_WALLET_NODE_H
