#include "StuckEntrySweeper.h"

namespace paisa {

StuckEntrySweeper::StuckEntrySweeper(LedgerStore &store)
    : StuckEntrySweeper(store, Config()) {}

StuckEntrySweeper::StuckEntrySweeper(LedgerStore &store, const Config &config)
    : Service("paisa.payment.sweeper"), store_(store), config_(config) {}

StuckEntrySweeper::~StuckEntrySweeper() {
  if (isRunning()) {
    stop();
  }
}

StuckEntrySweeper::Roe<void> StuckEntrySweeper::onStart() {
  if (config_.stuckAfterMs <= 0 || config_.sweepIntervalMs <= 0) {
    return Error(E_START, "Sweep interval and stuck threshold must be positive");
  }
  log().info << "Sweeping every " << config_.sweepIntervalMs
             << " ms for entries processing longer than " << config_.stuckAfterMs
             << " ms";
  return {};
}

size_t StuckEntrySweeper::sweepOnce(int64_t nowMs) {
  auto stale = store_.findStale(TransactionStatus::PROCESSING,
                                nowMs - config_.stuckAfterMs);
  size_t moved = 0;
  for (const auto &entry : stale) {
    LedgerStore::StatusUpdate update;
    update.reason = REASON;
    update.actor = ACTOR;
    auto result = store_.updateStatus(entry.id, TransactionStatus::ON_HOLD, update);
    if (!result) {
      // Finished concurrently, or the journal refused the write
      log().warning << "Could not hold " << entry.transactionId << ": "
                    << result.error().message;
      continue;
    }
    log().warning << entry.transactionId << " stuck in processing since "
                  << entry.updatedAt << "; moved to on_hold";
    ++moved;
  }
  return moved;
}

void StuckEntrySweeper::runLoop() {
  while (!isStopSet()) {
    size_t moved = sweepOnce(store_.now());
    if (moved > 0) {
      log().info << "Sweep moved " << moved << " entries to on_hold";
    }
    if (!waitFor(std::chrono::milliseconds(config_.sweepIntervalMs))) {
      break;
    }
  }
}

} // namespace paisa
