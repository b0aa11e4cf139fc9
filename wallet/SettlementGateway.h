#ifndef PAISA_WALLET_SETTLEMENT_GATEWAY_H
#define PAISA_WALLET_SETTLEMENT_GATEWAY_H

#include "Module.h"
#include "ResultOrError.hpp"
#include "Transaction.h"

#include <cstdint>
#include <map>
#include <string>

namespace paisa {

/**
 * SettlementGateway - an external system that moves money outside the
 * wallet (card networks, operators, banks). Injected; holds no shared state.
 */
class SettlementGateway {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_DECLINED = 1;
  // No answer in time; the outcome is unknown
  constexpr static int32_t E_TIMEOUT = 2;
  constexpr static int32_t E_INPUT = 3;

  struct Request {
    std::string reference;
    int64_t amount{ 0 };
    PaymentMethod method{ PaymentMethod::CARD };
    std::map<std::string, std::string> metadata;
  };

  struct Receipt {
    std::string gatewayReference;
  };

  virtual ~SettlementGateway() = default;

  virtual Roe<Receipt> settle(const Request &request) = 0;
};

/**
 * SimulatedGateway - waits a fixed delay and then draws success with a
 * configured probability
 */
class SimulatedGateway : public Module, public SettlementGateway {
public:
  struct Config {
    int64_t delayMs{ 500 };
    int64_t timeoutMs{ 5000 };
    // Probability in [0, 1]
    double successRate{ 0.9 };
  };

  SimulatedGateway();
  explicit SimulatedGateway(const Config &config);
  ~SimulatedGateway() override = default;

  const Config &getConfig() const { return config_; }

  Roe<Receipt> settle(const Request &request) override;

  /**
   * "pi_" followed by 24 random alphanumerics
   */
  static std::string generateReference();

private:
  Config config_;
};

} // namespace paisa

#endif // PAISA_WALLET_SETTLEMENT_GATEWAY_H
