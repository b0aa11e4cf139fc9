#include "Service.h"

namespace paisa {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  if (isRunning_) {
    stop();
  }
}

Service::Roe<void> Service::start() {
  if (isRunning_) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_START, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (!isRunning_) {
    log().warning << "Service is not running";
    return;
  }

  log().info << "Stopping service";
  {
    std::lock_guard<std::mutex> lock(waitMutex_);
    isStopSet_ = true;
  }
  waitCv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
  isRunning_ = false;

  onStop();
  log().info << "Service stopped";
}

Service::Roe<void> Service::run() {
  if (isRunning_) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_START, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  log().info << "Service running in current thread";
  runLoop();
  isRunning_ = false;
  isStopSet_ = true;
  onStop();
  log().info << "Service stopped (current thread)";
  return {};
}

bool Service::waitFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(waitMutex_);
  waitCv_.wait_for(lock, duration, [this] { return isStopSet_.load(); });
  return !isStopSet_;
}

} // namespace paisa
