#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace hl {
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

  std::tm tmLocal{};
  localtime_r(&time, &tmLocal);

  std::stringstream ss;
  ss << std::put_time(&tmLocal, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  // stdout is reserved for program output (e.g. request responses)
  std::cerr << message << std::endl;
}

// FileHandler implementation
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

void FileHandler::emit(Level level, const std::string &loggerName,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// LogProxy implementation
LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

// LogStream implementation
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

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode Implementation ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;

  auto current = const_cast<LoggerNode *>(this)->shared_from_this();
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

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::addChild(std::shared_ptr<LoggerNode> child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.push_back(child);
}

void LoggerNode::removeChild(LoggerNode *child) {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.erase(std::remove_if(children_.begin(), children_.end(),
                                 [child](const std::weak_ptr<LoggerNode> &weak) {
                                   auto ptr = weak.lock();
                                   return !ptr || ptr.get() == child;
                                 }),
                  children_.end());
}

void LoggerNode::log(Level level, const std::string &message) {
  logWithOrigin(level, message, getFullName());
}

void LoggerNode::logWithOrigin(Level level, const std::string &message,
                               const std::string &originName) {
  if (level < level_) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!spHandlers_.empty()) {
      std::string formatted = formatMessage(level, message, originName);
      for (auto &spHandler : spHandlers_) {
        spHandler->emit(level, originName, formatted);
      }
    }
  }

  if (propagate_) {
    auto parentNode = getParent();
    if (parentNode) {
      parentNode->logWithOrigin(level, message, originName);
    }
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

std::string LoggerNode::levelToString(Level level) {
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

// ========== Logger Implementation ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(node) {}

// Proxies must point at this instance, never at the source
Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

Logger Logger::getParent() const {
  return Logger(spNode_ ? spNode_->getParent() : nullptr);
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  auto targetNode = logging::getLogger(targetLoggerName).getNode();

  if (targetNode == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  // Target must not be a descendant of this logger
  auto ancestor = targetNode;
  while (ancestor) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
    ancestor = ancestor->getParent();
  }

  auto oldParent = spNode_->getParent();
  if (oldParent) {
    oldParent->removeChild(spNode_.get());
  }

  spNode_->setParent(targetNode);
  targetNode->addChild(spNode_);
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

  // Resolve the parent first so the registry lock is never held recursively
  std::shared_ptr<LoggerNode> parentNode;
  if (!trimmedName.empty()) {
    parentNode = getLogger(parentPath).getNode();
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
    parentNode->addChild(node);
  } else {
    // Root logger prints to the console by default
    node->addHandler(std::make_shared<ConsoleHandler>());
  }
  registry[trimmedName] = node;

  return Logger(node);
}

Logger getRootLogger() { return getLogger(""); }

Level parseLevel(const std::string &name, Level fallback) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug") {
    return Level::DEBUG;
  }
  if (lower == "info") {
    return Level::INFO;
  }
  if (lower == "warning" || lower == "warn") {
    return Level::WARNING;
  }
  if (lower == "error") {
    return Level::ERROR;
  }
  if (lower == "critical") {
    return Level::CRITICAL;
  }
  return fallback;
}

} // namespace logging
} // namespace hl
