#ifndef PAISA_WALLET_CREDENTIAL_VAULT_H
#define PAISA_WALLET_CREDENTIAL_VAULT_H

#include "Module.h"
#include "ResultOrError.hpp"
#include "VerificationGate.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace paisa {

/**
 * CredentialVault - stores per-user PIN hashes (libsodium crypto_pwhash_str)
 * and biometric template digests (crypto_generichash), and answers
 * VerificationGate::verify from them. Nothing in clear text is kept.
 */
class CredentialVault : public Module, public VerificationGate {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INPUT = 1;
  constexpr static int32_t E_HASH = 2;
  constexpr static int32_t E_STORAGE = 3;

  constexpr static const char *CREDENTIALS_FILE = "credentials.json";

  struct InitConfig {
    // Empty keeps credentials in memory only
    std::string workDir;
    // 0 selects libsodium's interactive limits
    unsigned long long opsLimit{ 0 };
    size_t memLimit{ 0 };
  };

  CredentialVault();
  ~CredentialVault() override = default;

  Roe<void> init(const InitConfig &config);

  /**
   * Set or replace a user's PIN. UPI PINs are 4 or 6 digits.
   */
  Roe<void> enrollPin(uint64_t userId, const std::string &pin);

  /**
   * Register a biometric template for one modality
   */
  Roe<void> enrollBiometric(uint64_t userId, const std::string &biometricType,
                            const std::string &templateData);

  /**
   * Drop every credential of a user
   */
  Roe<void> revoke(uint64_t userId);

  bool hasPin(uint64_t userId) const;
  bool hasBiometric(uint64_t userId, const std::string &biometricType) const;

  bool verify(uint64_t userId, const AuthProof &proof) override;

  static bool isSupportedBiometric(const std::string &biometricType);

private:
  struct Credentials {
    std::string pinHash;
    // modality -> hex digest
    std::map<std::string, std::string> biometrics;
  };

  Roe<void> saveLocked() const;
  Roe<void> load();
  std::string digest(uint64_t userId, const std::string &biometricType,
                     const std::string &templateData) const;

  InitConfig config_;
  std::string credentialsPath_;
  std::map<uint64_t, Credentials> credentials_;
  mutable std::mutex mutex_;
};

} // namespace paisa

#endif // PAISA_WALLET_CREDENTIAL_VAULT_H
