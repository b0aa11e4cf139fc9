#ifndef PAISA_LOGGER_H
#define PAISA_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace paisa {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);
bool levelFromString(const std::string &str, Level &level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &message) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &message) override;

private:
  std::mutex mutex_;
  std::ofstream file_;
  std::string filename_;
};

class Logger;
class LogStream;
class LoggerNode;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  LogStream(LogStream &&other) noexcept;
  LogStream &operator=(LogStream &&other) = delete;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

// Tree node shared by every Logger handle with the same name
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(const std::string &name);

  void setLevel(Level level);
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void removeHandler(const std::shared_ptr<Handler> &spHandler);
  void clearHandlers();

  void setPropagate(bool propagate);
  bool getPropagate() const;

  void setParent(std::shared_ptr<LoggerNode> parent);
  std::shared_ptr<LoggerNode> getParent() const;

  const std::string &getName() const { return name_; }
  std::string getFullName() const;

  void log(Level level, const std::string &message,
           const std::string &originName);

private:
  std::string formatMessage(Level level, const std::string &message,
                            const std::string &originName) const;

  std::string name_;
  std::weak_ptr<LoggerNode> parent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);
  ~Logger() = default;

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) {
    spNode_->addHandler(spHandler);
  }
  void removeHandler(const std::shared_ptr<Handler> &spHandler) {
    spNode_->removeHandler(spHandler);
  }
  /**
   * @return the handler, so the caller can remove it again
   */
  std::shared_ptr<Handler> addFileHandler(const std::string &filename,
                                          Level level = Level::DEBUG);

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  /**
   * Re-parent this logger under another one.
   * Messages then propagate through the target's handlers.
   */
  void redirectTo(const std::string &targetLoggerName);

  const std::string &getName() const { return spNode_->getName(); }
  std::string getFullName() const { return spNode_->getFullName(); }

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  friend class LogStream;
  friend Logger getLogger(const std::string &name);

  void log(Level level, const std::string &message);

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace paisa

#endif // PAISA_LOGGER_H
