#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace paisa {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Derived classes implement runLoop(), which executes in the service thread
 * (start) or in the calling thread (run). The loop should check isStopSet()
 * and use waitFor() between iterations so that stop() returns promptly.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_RUNNING = 1;
  constexpr static int32_t E_START = 2;

  explicit Service(const std::string &name);

  /**
   * Stops the thread if still running. Derived classes that override
   * onStop() must call stop() in their own destructor.
   */
  ~Service() override;

  bool isRunning() const { return isRunning_; }
  bool isStopSet() const { return isStopSet_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  virtual void runLoop() = 0;

  /**
   * Called in the caller's thread before the loop starts.
   * Returning an error aborts start()/run().
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called in the caller's thread after the loop has finished.
   */
  virtual void onStop() {}

  /**
   * Sleep up to the given duration; wakes early when stop() is called.
   * @return false if the service was asked to stop
   */
  bool waitFor(std::chrono::milliseconds duration);

private:
  std::atomic<bool> isStopSet_{ false };
  std::atomic<bool> isRunning_{ false };
  std::mutex waitMutex_;
  std::condition_variable waitCv_;
  std::thread thread_;
};

} // namespace paisa
