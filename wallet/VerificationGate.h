#ifndef PAISA_WALLET_VERIFICATION_GATE_H
#define PAISA_WALLET_VERIFICATION_GATE_H

#include <cstdint>
#include <string>

namespace paisa {

enum class AuthMethod { PIN, BIOMETRIC };

/**
 * What the caller presents to authorize a funds movement. For a PIN the
 * secret is the PIN itself; for a biometric it is the captured template
 * and biometricType names the modality (fingerprint, face, voice, pattern).
 */
struct AuthProof {
  AuthMethod method{ AuthMethod::PIN };
  std::string secret;
  std::string biometricType;

  bool isPresent() const { return !secret.empty(); }
};

/**
 * VerificationGate - PIN or biometric check with a yes/no verdict only
 */
class VerificationGate {
public:
  virtual ~VerificationGate() = default;

  virtual bool verify(uint64_t userId, const AuthProof &proof) = 0;
};

} // namespace paisa

#endif // PAISA_WALLET_VERIFICATION_GATE_H
