#include "WalletNode.h"
#include "Logger.h"
#include "Utilities.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace paisa {

nlohmann::json WalletNode::RunFileConfig::ltsToJson() const {
  nlohmann::json j;
  j["currency"] = currency;
  j["maxPageLimit"] = maxPageLimit;
  j["stuckAfterMs"] = stuckAfterMs;
  j["sweepIntervalMs"] = sweepIntervalMs;
  j["settlement"] = { { "delayMs", settlement.delayMs },
                      { "timeoutMs", settlement.timeoutMs },
                      { "successRate", settlement.successRate } };
  j["pinHash"] = { { "opsLimit", pinOpsLimit }, { "memLimit", pinMemLimit } };
  j["logLevel"] = logLevel;
  return j;
}

WalletNode::Roe<void> WalletNode::RunFileConfig::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  if (jd.contains("currency")) {
    if (!jd["currency"].is_string() || jd["currency"].get<std::string>().empty()) {
      return Error(E_CONFIG, "'currency' must be a non-empty string");
    }
    currency = jd["currency"].get<std::string>();
  }

  if (jd.contains("maxPageLimit")) {
    if (!jd["maxPageLimit"].is_number_integer() || jd["maxPageLimit"].get<int64_t>() <= 0) {
      return Error(E_CONFIG, "'maxPageLimit' must be a positive integer");
    }
    maxPageLimit = jd["maxPageLimit"].get<size_t>();
  }

  if (jd.contains("stuckAfterMs")) {
    if (!jd["stuckAfterMs"].is_number_integer()) {
      return Error(E_CONFIG, "'stuckAfterMs' must be an integer");
    }
    stuckAfterMs = jd["stuckAfterMs"].get<int64_t>();
  }
  if (jd.contains("sweepIntervalMs")) {
    if (!jd["sweepIntervalMs"].is_number_integer()) {
      return Error(E_CONFIG, "'sweepIntervalMs' must be an integer");
    }
    sweepIntervalMs = jd["sweepIntervalMs"].get<int64_t>();
  }
  if (stuckAfterMs <= 0 || sweepIntervalMs <= 0) {
    return Error(E_CONFIG, "'stuckAfterMs' and 'sweepIntervalMs' must be positive");
  }

  if (jd.contains("settlement")) {
    const auto &s = jd["settlement"];
    if (!s.is_object()) {
      return Error(E_CONFIG, "'settlement' must be an object");
    }
    if (s.contains("delayMs")) {
      if (!s["delayMs"].is_number_integer() || s["delayMs"].get<int64_t>() < 0) {
        return Error(E_CONFIG, "'settlement.delayMs' must be a non-negative integer");
      }
      settlement.delayMs = s["delayMs"].get<int64_t>();
    }
    if (s.contains("timeoutMs")) {
      if (!s["timeoutMs"].is_number_integer() || s["timeoutMs"].get<int64_t>() <= 0) {
        return Error(E_CONFIG, "'settlement.timeoutMs' must be a positive integer");
      }
      settlement.timeoutMs = s["timeoutMs"].get<int64_t>();
    }
    if (s.contains("successRate")) {
      if (!s["successRate"].is_number()) {
        return Error(E_CONFIG, "'settlement.successRate' must be a number");
      }
      double rate = s["successRate"].get<double>();
      if (rate < 0.0 || rate > 1.0) {
        return Error(E_CONFIG, "'settlement.successRate' must be between 0 and 1");
      }
      settlement.successRate = rate;
    }
  }

  if (jd.contains("pinHash")) {
    const auto &p = jd["pinHash"];
    if (!p.is_object()) {
      return Error(E_CONFIG, "'pinHash' must be an object");
    }
    if (p.contains("opsLimit")) {
      if (!p["opsLimit"].is_number_integer() || p["opsLimit"].get<int64_t>() < 0) {
        return Error(E_CONFIG, "'pinHash.opsLimit' must be a non-negative integer");
      }
      pinOpsLimit = p["opsLimit"].get<unsigned long long>();
    }
    if (p.contains("memLimit")) {
      if (!p["memLimit"].is_number_integer() || p["memLimit"].get<int64_t>() < 0) {
        return Error(E_CONFIG, "'pinHash.memLimit' must be a non-negative integer");
      }
      pinMemLimit = p["memLimit"].get<size_t>();
    }
  }

  if (jd.contains("logLevel")) {
    logging::Level level;
    if (!jd["logLevel"].is_string() ||
        !logging::levelFromString(jd["logLevel"].get<std::string>(), level)) {
      return Error(E_CONFIG, "'logLevel' must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL");
    }
    logLevel = jd["logLevel"].get<std::string>();
  }
  return {};
}

WalletNode::WalletNode() : Module("paisa.node") {}

WalletNode::~WalletNode() {
  sweeper_.reset();
  processor_.reset();
  if (logHandler_) {
    logging::getLogger("paisa").removeHandler(logHandler_);
  }
  releaseLock();
}

WalletNode::Roe<void> WalletNode::acquireLock() {
  std::string path = (std::filesystem::path(workDir_) / FILE_LOCK).string();
  int fd = ::open(path.c_str(), O_CREAT | O_RDWR, 0644);
  if (fd < 0) {
    return Error(E_INIT, "Failed to create " + path + ": " + std::strerror(errno));
  }
  if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
    int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      return Error(E_INIT, workDir_ + " is in use by another wallet node");
    }
    return Error(E_INIT, "Failed to lock " + path + ": " + std::strerror(err));
  }
  lockFd_ = fd;
  return {};
}

void WalletNode::releaseLock() {
  if (lockFd_ < 0) {
    return;
  }
  ::flock(lockFd_, LOCK_UN);
  ::close(lockFd_);
  lockFd_ = -1;
}

PaymentProcessor &WalletNode::getPaymentProcessor() {
  // Only valid after a successful init()
  return *processor_;
}

StuckEntrySweeper &WalletNode::getSweeper() { return *sweeper_; }

WalletNode::Roe<void> WalletNode::loadConfig(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_CONFIG, jsonResult.error().message);
  }
  RunFileConfig config;
  auto parsed = config.ltsFromJson(jsonResult.value());
  if (!parsed) {
    return Error(E_CONFIG, "Invalid " + path + ": " + parsed.error().message);
  }
  config_ = config;
  return {};
}

WalletNode::Roe<void> WalletNode::init(const std::string &workDir) {
  if (workDir.empty()) {
    return Error(E_INIT, "Work directory is required");
  }
  if (lockFd_ >= 0) {
    return Error(E_INIT, "Wallet node already initialized at " + workDir_);
  }
  workDir_ = workDir;

  std::error_code ec;
  std::filesystem::create_directories(workDir_, ec);
  if (ec) {
    return Error(E_INIT, "Failed to create " + workDir_ + ": " + ec.message());
  }
  auto locked = acquireLock();
  if (!locked) {
    return locked.error();
  }

  std::filesystem::path configPath = std::filesystem::path(workDir_) / FILE_CONFIG;
  if (!std::filesystem::exists(configPath)) {
    log().info << "No " << FILE_CONFIG << " found, creating with default values";
    auto saved = utl::saveJsonFile(configPath.string(), RunFileConfig().ltsToJson());
    if (!saved) {
      return Error(E_CONFIG, "Failed to create " + std::string(FILE_CONFIG) + ": " +
                                 saved.error().message);
    }
    log().info << "Created " << FILE_CONFIG << " at: " << configPath.string();
  }

  auto loaded = loadConfig(configPath.string());
  if (!loaded) {
    return loaded.error();
  }

  logging::Level level = logging::Level::INFO;
  logging::levelFromString(config_.logLevel, level);
  auto root = logging::getLogger("paisa");
  root.setLevel(level);
  try {
    logHandler_ = root.addFileHandler(
        (std::filesystem::path(workDir_) / FILE_LOG).string(), logging::Level::DEBUG);
  } catch (const std::runtime_error &e) {
    return Error(E_INIT, e.what());
  }

  LedgerStore::InitConfig storeConfig;
  storeConfig.workDir = workDir_;
  storeConfig.maxPageLimit = config_.maxPageLimit;
  auto storeResult = store_.init(storeConfig);
  if (!storeResult) {
    return Error(E_INIT, "Failed to open ledger: " + storeResult.error().message);
  }

  AccountBook::InitConfig bookConfig;
  bookConfig.workDir = workDir_;
  auto bookResult = book_.init(bookConfig);
  if (!bookResult) {
    return Error(E_INIT, "Failed to open accounts: " + bookResult.error().message);
  }

  CredentialVault::InitConfig vaultConfig;
  vaultConfig.workDir = workDir_;
  vaultConfig.opsLimit = config_.pinOpsLimit;
  vaultConfig.memLimit = config_.pinMemLimit;
  auto vaultResult = vault_.init(vaultConfig);
  if (!vaultResult) {
    return Error(E_INIT, "Failed to open credentials: " + vaultResult.error().message);
  }

  gateway_ = std::make_unique<SimulatedGateway>(config_.settlement);

  PaymentProcessor::Config processorConfig;
  processorConfig.currency = config_.currency;
  processor_ = std::make_unique<PaymentProcessor>(store_, book_, vault_, *gateway_,
                                                  processorConfig);

  StuckEntrySweeper::Config sweeperConfig;
  sweeperConfig.stuckAfterMs = config_.stuckAfterMs;
  sweeperConfig.sweepIntervalMs = config_.sweepIntervalMs;
  sweeper_ = std::make_unique<StuckEntrySweeper>(store_, sweeperConfig);

  log().info << "Wallet node ready at " << workDir_ << " (" << store_.size()
             << " ledger entries, " << book_.getAccountIds().size() << " accounts)";
  return {};
}

WalletNode::Roe<uint64_t> WalletNode::openAccount(const AccountBook::UserProfile &profile,
                                                  int64_t openingBalance,
                                                  const std::string &pin) {
  auto opened = book_.openAccount(profile, openingBalance);
  if (!opened) {
    return Error(E_STATE, opened.error().message);
  }
  auto enrolled = vault_.enrollPin(opened.value(), pin);
  if (!enrolled) {
    // An account without a PIN cannot authorize anything
    auto closed = book_.closeAccount(opened.value());
    if (!closed) {
      log().error << "Failed to roll back account " << opened.value() << ": "
                  << closed.error().message;
    }
    return Error(E_STATE, enrolled.error().message);
  }
  log().info << "Opened wallet " << opened.value() << " for " << profile.name;
  return opened.value();
}

WalletNode::Roe<size_t> WalletNode::eraseUser(uint64_t userId) {
  if (!book_.hasAccount(userId)) {
    return Error(E_STATE, "Account not found: " + std::to_string(userId));
  }
  auto removed = store_.deleteByOwner(userId);
  if (!removed) {
    return Error(E_STATE, removed.error().message);
  }
  auto revoked = vault_.revoke(userId);
  if (!revoked) {
    return Error(E_STATE, revoked.error().message);
  }
  auto closed = book_.closeAccount(userId);
  if (!closed) {
    return Error(E_STATE, closed.error().message);
  }
  if (processor_) {
    processor_->releaseUser(userId);
  }
  log().warning << "Erased user " << userId << " (" << removed.value()
                << " ledger entries)";
  return removed.value();
}

} // namespace paisa
