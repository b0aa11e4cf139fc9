#include "CredentialVault.h"
#include "Utilities.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sodium.h>

namespace paisa {

namespace {

const char *const BIOMETRIC_TYPES[] = { "fingerprint", "face", "voice", "pattern" };

bool isValidPin(const std::string &pin) {
  return (pin.size() == 4 || pin.size() == 6) &&
         std::all_of(pin.begin(), pin.end(),
                     [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

CredentialVault::CredentialVault() : Module("paisa.wallet.credentials") {}

bool CredentialVault::isSupportedBiometric(const std::string &biometricType) {
  for (const char *type : BIOMETRIC_TYPES) {
    if (biometricType == type) {
      return true;
    }
  }
  return false;
}

CredentialVault::Roe<void> CredentialVault::init(const InitConfig &config) {
  if (sodium_init() < 0) {
    return Error(E_HASH, "Failed to initialize libsodium");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;
  if (config_.opsLimit == 0) {
    config_.opsLimit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
  }
  if (config_.memLimit == 0) {
    config_.memLimit = crypto_pwhash_MEMLIMIT_INTERACTIVE;
  }
  credentials_.clear();
  credentialsPath_.clear();

  if (config_.workDir.empty()) {
    return {};
  }

  std::error_code ec;
  std::filesystem::create_directories(config_.workDir, ec);
  if (ec || !std::filesystem::is_directory(config_.workDir)) {
    return Error(E_STORAGE, "Failed to create work directory " + config_.workDir);
  }
  credentialsPath_ = config_.workDir + "/" + CREDENTIALS_FILE;
  if (!std::filesystem::exists(credentialsPath_)) {
    return {};
  }
  return load();
}

CredentialVault::Roe<void> CredentialVault::load() {
  auto json = utl::loadJsonFile(credentialsPath_);
  if (!json) {
    return Error(E_STORAGE, json.error().message);
  }
  const auto &root = json.value();
  if (!root.is_object()) {
    return Error(E_STORAGE, "Malformed credentials file: " + credentialsPath_);
  }

  try {
    nlohmann::json users = root.value("users", nlohmann::json::object());
    for (const auto &[key, value] : users.items()) {
      uint64_t userId = 0;
      if (!utl::parseUInt64(key, userId)) {
        return Error(E_STORAGE, "Malformed user id in credentials: " + key);
      }
      Credentials creds;
      creds.pinHash = value.value("pinHash", std::string());
      if (value.contains("biometrics")) {
        creds.biometrics =
            value["biometrics"].get<std::map<std::string, std::string>>();
      }
      credentials_[userId] = creds;
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_STORAGE, std::string("Malformed credentials file: ") + e.what());
  }
  return {};
}

CredentialVault::Roe<void> CredentialVault::saveLocked() const {
  if (credentialsPath_.empty()) {
    return {};
  }
  nlohmann::json users = nlohmann::json::object();
  for (const auto &[userId, creds] : credentials_) {
    nlohmann::json entry = nlohmann::json::object();
    if (!creds.pinHash.empty()) {
      entry["pinHash"] = creds.pinHash;
    }
    if (!creds.biometrics.empty()) {
      entry["biometrics"] = creds.biometrics;
    }
    users[std::to_string(userId)] = entry;
  }

  auto result = utl::saveJsonFile(credentialsPath_, { { "users", users } });
  if (!result) {
    return Error(E_STORAGE, result.error().message);
  }
  return {};
}

std::string CredentialVault::digest(uint64_t userId,
                                    const std::string &biometricType,
                                    const std::string &templateData) const {
  // Bind the digest to its owner and modality
  std::string input = std::to_string(userId) + ":" + biometricType + ":" + templateData;
  unsigned char hash[crypto_generichash_BYTES];
  crypto_generichash(hash, sizeof(hash),
                     reinterpret_cast<const unsigned char *>(input.data()),
                     input.size(), nullptr, 0);

  char hex[crypto_generichash_BYTES * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), hash, sizeof(hash));
  return std::string(hex);
}

CredentialVault::Roe<void> CredentialVault::enrollPin(uint64_t userId,
                                                      const std::string &pin) {
  if (!isValidPin(pin)) {
    return Error(E_INPUT, "PIN must be 4 or 6 digits");
  }

  char hashed[crypto_pwhash_STRBYTES];
  if (crypto_pwhash_str(hashed, pin.data(), pin.size(), config_.opsLimit,
                        config_.memLimit) != 0) {
    return Error(E_HASH, "Failed to hash PIN");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  Credentials previous = credentials_[userId];
  credentials_[userId].pinHash = hashed;
  auto saved = saveLocked();
  if (!saved) {
    credentials_[userId] = previous;
    return saved;
  }
  log().info << "PIN enrolled for user " << userId;
  return {};
}

CredentialVault::Roe<void>
CredentialVault::enrollBiometric(uint64_t userId, const std::string &biometricType,
                                 const std::string &templateData) {
  if (!isSupportedBiometric(biometricType)) {
    return Error(E_INPUT, "Unsupported biometric type: " + biometricType);
  }
  if (templateData.empty()) {
    return Error(E_INPUT, "Biometric template is empty");
  }

  std::string hex = digest(userId, biometricType, templateData);

  std::lock_guard<std::mutex> lock(mutex_);
  Credentials previous = credentials_[userId];
  credentials_[userId].biometrics[biometricType] = hex;
  auto saved = saveLocked();
  if (!saved) {
    credentials_[userId] = previous;
    return saved;
  }
  log().info << "Biometric " << biometricType << " enrolled for user " << userId;
  return {};
}

CredentialVault::Roe<void> CredentialVault::revoke(uint64_t userId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = credentials_.find(userId);
  if (it == credentials_.end()) {
    return {};
  }
  Credentials previous = it->second;
  credentials_.erase(it);
  auto saved = saveLocked();
  if (!saved) {
    credentials_[userId] = previous;
    return saved;
  }
  log().info << "Credentials revoked for user " << userId;
  return {};
}

bool CredentialVault::hasPin(uint64_t userId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = credentials_.find(userId);
  return it != credentials_.end() && !it->second.pinHash.empty();
}

bool CredentialVault::hasBiometric(uint64_t userId,
                                   const std::string &biometricType) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = credentials_.find(userId);
  return it != credentials_.end() &&
         it->second.biometrics.count(biometricType) > 0;
}

bool CredentialVault::verify(uint64_t userId, const AuthProof &proof) {
  if (!proof.isPresent()) {
    return false;
  }

  std::string stored;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = credentials_.find(userId);
    if (it == credentials_.end()) {
      log().warning << "No credentials enrolled for user " << userId;
      return false;
    }
    if (proof.method == AuthMethod::PIN) {
      stored = it->second.pinHash;
    } else {
      auto bio = it->second.biometrics.find(proof.biometricType);
      if (bio != it->second.biometrics.end()) {
        stored = bio->second;
      }
    }
  }
  if (stored.empty()) {
    log().warning << "User " << userId << " has no credential for this method";
    return false;
  }

  bool ok = false;
  if (proof.method == AuthMethod::PIN) {
    // Slow by construction, so it runs outside the lock
    ok = crypto_pwhash_str_verify(stored.c_str(), proof.secret.data(),
                                  proof.secret.size()) == 0;
  } else {
    std::string candidate = digest(userId, proof.biometricType, proof.secret);
    ok = candidate.size() == stored.size() &&
         sodium_memcmp(candidate.data(), stored.data(), stored.size()) == 0;
  }

  if (!ok) {
    log().warning << "Verification failed for user " << userId;
  }
  return ok;
}

} // namespace paisa
