#include "Module.h"

namespace paisa {

Module::Module(const std::string &name)
    : loggerName_(name), logger_(logging::getLogger(name)) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  logger_.redirectTo(targetLoggerName);
}

} // namespace paisa
