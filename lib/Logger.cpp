#include "Logger.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace paisa {
namespace logging {

static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

static std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &
getLoggerRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&time, &local);
  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

bool levelFromString(const std::string &str, Level &level) {
  static const std::pair<const char *, Level> names[] = {
      {"DEBUG", Level::DEBUG},     {"INFO", Level::INFO},
      {"WARNING", Level::WARNING}, {"ERROR", Level::ERROR},
      {"CRITICAL", Level::CRITICAL}};
  for (const auto &[name, value] : names) {
    if (str == name) {
      level = value;
      return true;
    }
  }
  return false;
}

void ConsoleHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  if (level >= Level::ERROR) {
    std::cerr << message << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_ << message << std::endl;
  }
}

LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

// ========== LoggerNode ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level LoggerNode::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::removeHandler(const std::shared_ptr<Handler> &spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.erase(std::remove(spHandlers_.begin(), spHandlers_.end(), spHandler),
                    spHandlers_.end());
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool LoggerNode::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void LoggerNode::setParent(std::shared_ptr<LoggerNode> parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  parent_ = parent;
}

std::shared_ptr<LoggerNode> LoggerNode::getParent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parent_.lock();
}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;
  auto current = shared_from_this();
  while (current && !current->getName().empty()) {
    parts.push_back(current->getName());
    current = current->getParent();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::log(Level level, const std::string &message,
                     const std::string &originName) {
  std::vector<std::shared_ptr<Handler>> handlers;
  std::shared_ptr<LoggerNode> parent;
  bool passes = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    passes = level >= level_;
    if (passes) {
      handlers = spHandlers_;
    }
    if (propagate_) {
      parent = parent_.lock();
    }
  }

  // A node that filters the level also stops it from reaching ancestors
  if (!passes) {
    return;
  }

  if (!handlers.empty()) {
    std::string formatted = formatMessage(level, message, originName);
    for (auto &spHandler : handlers) {
      spHandler->emit(level, formatted);
    }
  }

  if (parent) {
    parent->log(level, message, originName);
  }
}

std::string LoggerNode::formatMessage(Level level, const std::string &message,
                                      const std::string &originName) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(node) {
  if (!spNode_) {
    throw std::invalid_argument("Logger requires a node");
  }
}

Logger::Logger(const Logger &other)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

std::shared_ptr<Handler> Logger::addFileHandler(const std::string &filename,
                                                Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
  return spHandler;
}

void Logger::log(Level level, const std::string &message) {
  spNode_->log(level, message, spNode_->getFullName());
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  auto target = getLogger(targetLoggerName);
  if (target.spNode_ == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  auto ancestor = target.spNode_;
  while (ancestor) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
    ancestor = ancestor->getParent();
  }

  spNode_->setParent(target.spNode_);
}

// ========== Global logger management ==========

Logger getLogger(const std::string &name) {
  std::string trimmedName = trimLeadingDot(name);

  std::string parentPath;
  std::string nodeName = trimmedName;
  auto lastDot = trimmedName.rfind('.');
  if (lastDot != std::string::npos) {
    parentPath = trimmedName.substr(0, lastDot);
    nodeName = trimmedName.substr(lastDot + 1);
  }

  {
    std::lock_guard<std::mutex> lock(getRegistryMutex());
    auto &registry = getLoggerRegistry();
    auto it = registry.find(trimmedName);
    if (it != registry.end()) {
      return Logger(it->second);
    }
  }

  // Resolve the parent first so the registry lock is never held recursively
  std::shared_ptr<LoggerNode> parentNode;
  if (!trimmedName.empty()) {
    Logger parent = getLogger(parentPath);
    parentNode = parent.spNode_;
  }

  std::lock_guard<std::mutex> lock(getRegistryMutex());
  auto &registry = getLoggerRegistry();
  auto it = registry.find(trimmedName);
  if (it != registry.end()) {
    return Logger(it->second);
  }

  auto node = std::make_shared<LoggerNode>(nodeName);
  if (parentNode) {
    node->setParent(parentNode);
  } else {
    // Root logger owns the only default console handler
    node->addHandler(std::make_shared<ConsoleHandler>());
  }
  registry[trimmedName] = node;
  return Logger(node);
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace paisa
