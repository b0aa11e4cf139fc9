#include "SettlementGateway.h"
#include "Utilities.h"

#include <algorithm>
#include <chrono>
#include <sodium.h>
#include <thread>

namespace paisa {

namespace {

const std::string ALPHANUMERIC =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

constexpr uint32_t DRAW_RESOLUTION = 1000000;

} // namespace

SimulatedGateway::SimulatedGateway() : SimulatedGateway(Config()) {}

SimulatedGateway::SimulatedGateway(const Config &config)
    : Module("paisa.wallet.gateway"), config_(config) {}

std::string SimulatedGateway::generateReference() {
  return "pi_" + utl::randomString(24, ALPHANUMERIC);
}

SimulatedGateway::Roe<SimulatedGateway::Receipt>
SimulatedGateway::settle(const Request &request) {
  if (request.amount <= 0) {
    return Error(E_INPUT, "Settlement amount must be positive");
  }

  int64_t wait = std::max<int64_t>(0, std::min(config_.delayMs, config_.timeoutMs));
  if (wait > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(wait));
  }
  if (config_.delayMs > config_.timeoutMs) {
    log().warning << "Settlement of " << request.reference << " timed out after "
                  << config_.timeoutMs << " ms";
    return Error(E_TIMEOUT, "Gateway did not answer within " +
                                std::to_string(config_.timeoutMs) + " ms");
  }

  double rate = std::clamp(config_.successRate, 0.0, 1.0);
  uint32_t threshold = static_cast<uint32_t>(rate * DRAW_RESOLUTION);
  if (randombytes_uniform(DRAW_RESOLUTION) >= threshold) {
    log().info << "Settlement of " << request.reference << " declined";
    return Error(E_DECLINED, "Payment declined by gateway");
  }

  Receipt receipt;
  receipt.gatewayReference = generateReference();
  log().info << "Settled " << request.reference << " for "
             << utl::formatAmount(request.amount) << " as "
             << receipt.gatewayReference;
  return receipt;
}

} // namespace paisa
