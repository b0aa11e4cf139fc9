#pragma once

#include "Logger.h"
#include <string>

namespace paisa {

/**
 * Base class for components that need logging.
 * Every module owns one named logger in the logging tree.
 */
class Module {
public:
  /**
   * @param name Hierarchical logger name (e.g. "paisa.ledger.store")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Re-parent this module's logger under another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  const std::string &getLoggerName() const { return loggerName_; }

  /**
   * Logger for this module; use it in derived classes and externally.
   */
  logging::Logger &log() const { return logger_; }

private:
  std::string loggerName_;
  mutable logging::Logger logger_;
};

} // namespace paisa
