#ifndef PAISA_PAYMENT_STUCK_ENTRY_SWEEPER_H
#define PAISA_PAYMENT_STUCK_ENTRY_SWEEPER_H

#include "LedgerStore.h"
#include "Service.h"

#include <cstdint>

namespace paisa {

/**
 * StuckEntrySweeper - periodically moves entries that sat in processing
 * for too long to on_hold, so none stays in flight with no recovery path.
 */
class StuckEntrySweeper : public Service {
public:
  constexpr static const char *ACTOR = "sweeper";
  constexpr static const char *REASON =
      "Stuck in processing; manual reconciliation required";

  struct Config {
    int64_t stuckAfterMs{ 300000 };
    int64_t sweepIntervalMs{ 60000 };
  };

  explicit StuckEntrySweeper(LedgerStore &store);
  StuckEntrySweeper(LedgerStore &store, const Config &config);
  ~StuckEntrySweeper() override;

  const Config &getConfig() const { return config_; }

  /**
   * One pass against the given time
   * @return number of entries moved to on_hold
   */
  size_t sweepOnce(int64_t nowMs);

protected:
  Roe<void> onStart() override;
  void runLoop() override;

private:
  LedgerStore &store_;
  Config config_;
};

} // namespace paisa

#endif // PAISA_PAYMENT_STUCK_ENTRY_SWEEPER_H
