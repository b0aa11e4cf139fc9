#include "AccountBook.h"
#include "Utilities.h"

#include <filesystem>
#include <limits>

namespace paisa {

nlohmann::json AccountBook::Account::toJson() const {
  return { { "id", profile.userId },
           { "name", profile.name },
           { "email", profile.email },
           { "phone", profile.phone },
           { "upiId", profile.upiId },
           { "balance", balance },
           { "openingBalance", openingBalance } };
}

bool AccountBook::Account::fromJson(const nlohmann::json &j) {
  try {
    profile.userId = j.at("id").get<uint64_t>();
    profile.name = j.value("name", std::string());
    profile.email = j.value("email", std::string());
    profile.phone = j.value("phone", std::string());
    profile.upiId = j.value("upiId", std::string());
    balance = j.at("balance").get<int64_t>();
    openingBalance = j.value("openingBalance", balance);
  } catch (const nlohmann::json::exception &) {
    return false;
  }
  return profile.userId != 0 && balance >= 0;
}

AccountBook::AccountBook() : Module("paisa.wallet.accounts") {}

AccountBook::Roe<void> AccountBook::init(const InitConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  mAccounts_.clear();
  nextId_ = ID_FIRST_USER;
  accountsPath_.clear();

  if (config.workDir.empty()) {
    return {};
  }

  std::error_code ec;
  std::filesystem::create_directories(config.workDir, ec);
  if (ec || !std::filesystem::is_directory(config.workDir)) {
    return Error(E_STORAGE, "Failed to create work directory " + config.workDir);
  }
  accountsPath_ = config.workDir + "/" + ACCOUNTS_FILE;

  if (!std::filesystem::exists(accountsPath_)) {
    log().info << "No accounts file yet at " << accountsPath_;
    return {};
  }
  return load();
}

AccountBook::Roe<void> AccountBook::load() {
  auto json = utl::loadJsonFile(accountsPath_);
  if (!json) {
    return Error(E_STORAGE, json.error().message);
  }
  const auto &root = json.value();
  if (!root.is_object() || !root.contains("accounts") ||
      !root["accounts"].is_array()) {
    return Error(E_STORAGE, "Malformed accounts file: " + accountsPath_);
  }

  for (const auto &item : root["accounts"]) {
    Account account;
    if (!account.fromJson(item)) {
      return Error(E_STORAGE, "Malformed account record in " + accountsPath_);
    }
    mAccounts_[account.profile.userId] = account;
    nextId_ = std::max(nextId_, account.profile.userId + 1);
  }
  nextId_ = std::max(nextId_, root.value("nextId", ID_FIRST_USER));

  log().info << "Loaded " << mAccounts_.size() << " accounts";
  return {};
}

AccountBook::Roe<void> AccountBook::saveLocked() const {
  if (accountsPath_.empty()) {
    return {};
  }
  nlohmann::json accounts = nlohmann::json::array();
  for (const auto &[id, account] : mAccounts_) {
    accounts.push_back(account.toJson());
  }
  nlohmann::json root = { { "nextId", nextId_ }, { "accounts", accounts } };

  auto result = utl::saveJsonFile(accountsPath_, root);
  if (!result) {
    return Error(E_STORAGE, result.error().message);
  }
  return {};
}

bool AccountBook::isIdentityTaken(const UserProfile &profile) const {
  for (const auto &[id, account] : mAccounts_) {
    const auto &p = account.profile;
    if (!profile.email.empty() && utl::toLower(p.email) == utl::toLower(profile.email)) {
      return true;
    }
    if (!profile.phone.empty() && p.phone == profile.phone) {
      return true;
    }
    if (!profile.upiId.empty() && utl::toLower(p.upiId) == utl::toLower(profile.upiId)) {
      return true;
    }
  }
  return false;
}

AccountBook::Roe<uint64_t> AccountBook::openAccount(const UserProfile &profile,
                                                    int64_t openingBalance) {
  if (openingBalance < 0) {
    return Error(E_INPUT, "Opening balance must be non-negative");
  }
  if (profile.email.empty() && profile.phone.empty() && profile.upiId.empty()) {
    return Error(E_INPUT, "An email, phone or UPI id is required");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (profile.userId != 0 && mAccounts_.count(profile.userId) > 0) {
    return Error(E_ACCOUNT, "Account already exists: " +
                                std::to_string(profile.userId));
  }
  if (isIdentityTaken(profile)) {
    return Error(E_ACCOUNT, "Email, phone or UPI id already registered");
  }

  Account account;
  account.profile = profile;
  account.profile.userId = profile.userId != 0 ? profile.userId : nextId_;
  account.balance = openingBalance;
  account.openingBalance = openingBalance;

  uint64_t previousNextId = nextId_;
  mAccounts_[account.profile.userId] = account;
  nextId_ = std::max(nextId_, account.profile.userId + 1);

  auto saved = saveLocked();
  if (!saved) {
    mAccounts_.erase(account.profile.userId);
    nextId_ = previousNextId;
    return saved.error();
  }

  log().info << "Opened account " << account.profile.userId
             << " with balance " << utl::formatAmount(openingBalance);
  return account.profile.userId;
}

AccountBook::Roe<void> AccountBook::closeAccount(uint64_t userId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mAccounts_.find(userId);
  if (it == mAccounts_.end()) {
    return {};
  }
  Account removed = it->second;
  mAccounts_.erase(it);

  auto saved = saveLocked();
  if (!saved) {
    mAccounts_[userId] = removed;
    return saved;
  }
  log().info << "Closed account " << userId;
  return {};
}

bool AccountBook::hasAccount(uint64_t userId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mAccounts_.find(userId) != mAccounts_.end();
}

AccountBook::Roe<AccountBook::Account>
AccountBook::getAccount(uint64_t userId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mAccounts_.find(userId);
  if (it == mAccounts_.end()) {
    return Error(E_ACCOUNT, "Account not found: " + std::to_string(userId));
  }
  return it->second;
}

AccountBook::Roe<int64_t> AccountBook::getOpeningBalance(uint64_t userId) const {
  auto account = getAccount(userId);
  if (!account) {
    return account.error();
  }
  return account->openingBalance;
}

std::vector<uint64_t> AccountBook::getAccountIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint64_t> ids;
  for (const auto &[id, account] : mAccounts_) {
    ids.push_back(id);
  }
  return ids;
}

AccountBook::Roe<int64_t> AccountBook::getBalance(uint64_t userId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mAccounts_.find(userId);
  if (it == mAccounts_.end()) {
    return Error(E_ACCOUNT, "Account not found: " + std::to_string(userId));
  }
  return it->second.balance;
}

AccountBook::Roe<int64_t> AccountBook::atomicAdjust(uint64_t userId,
                                                    int64_t delta) {
  if (delta == std::numeric_limits<int64_t>::min()) {
    return Error(E_INPUT, "Adjustment out of range");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mAccounts_.find(userId);
  if (it == mAccounts_.end()) {
    return Error(E_ACCOUNT, "Account not found: " + std::to_string(userId));
  }

  int64_t &balance = it->second.balance;
  if (delta < 0 && balance < -delta) {
    return Error(E_BALANCE, "Insufficient balance");
  }
  if (delta > 0 && balance > std::numeric_limits<int64_t>::max() - delta) {
    return Error(E_INPUT, "Deposit would cause balance overflow");
  }

  balance += delta;
  auto saved = saveLocked();
  if (!saved) {
    balance -= delta;
    log().error << "Balance change for " << userId
                << " rolled back: " << saved.error().message;
    return saved.error();
  }
  return balance;
}

AccountBook::Roe<uint64_t>
AccountBook::findUser(const std::string &identifier) const {
  if (identifier.empty()) {
    return Error(E_INPUT, "Identifier is required");
  }
  std::string lowered = utl::toLower(identifier);

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, account] : mAccounts_) {
    const auto &p = account.profile;
    if ((!p.email.empty() && utl::toLower(p.email) == lowered) ||
        (!p.phone.empty() && p.phone == identifier) ||
        (!p.upiId.empty() && utl::toLower(p.upiId) == lowered)) {
      return id;
    }
  }
  return Error(E_ACCOUNT, "No user matches " + identifier);
}

AccountBook::Roe<AccountBook::UserProfile>
AccountBook::getProfile(uint64_t userId) const {
  auto account = getAccount(userId);
  if (!account) {
    return account.error();
  }
  return account->profile;
}

} // namespace paisa
