#include "utilities/logger.h"
#include "utilities/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio> // For std::rename and std::remove
#include <ctime>
#include <iostream>
#include <new>
#include <nlohmann/json.hpp>

namespace chunkvault {

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

LogLevel parseLogLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return LogLevel::TRACE;
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "INFO")
    return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "FATAL")
    return LogLevel::FATAL;
  throw VaultException(ErrorCode::InvalidConfig,
                       "Unknown log level '" + name + "'");
}

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    std::cerr << "[Logger::init] allocation failed: " << bae.what()
              << std::endl;
  }
}

Logger &Logger::getInstance() {
  {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_instance)
      return *s_instance;
  }
  std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
               "Logger::init(). Falling back to console output."
            << std::endl;
  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    throw std::runtime_error("Logger not initialized. Call Logger::init() "
                             "first. Emergency init also failed.");
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel_(level), logFilePath_(logFile),
      maxFileSize_(maxFileSizeVal), maxBackupFiles_(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream_.open(logFilePath_, std::ios::app);
    if (!logFileStream_.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath_
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream_.is_open()) {
    logFileStream_.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel_ = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(s_mutex);
  return currentLogLevel_;
}

const char *Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

std::string Logger::formatRecord(LogLevel level,
                                 const std::string &message) const {
  nlohmann::ordered_json record;
  record["timestamp"] = getTimestamp();
  record["level"] = levelToString(level);
  record["message"] = message;
  // Messages may carry client-supplied bytes that are not valid UTF-8.
  return record.dump(-1, ' ', false,
                     nlohmann::json::error_handler_t::replace);
}

// Caller holds s_mutex.
void Logger::rotateIfNeeded() {
  if (!logFileStream_.is_open() || maxFileSize_ <= 0)
    return;
  logFileStream_.flush();
  if (logFileStream_.tellp() < maxFileSize_)
    return;

  logFileStream_.close();
  if (maxBackupFiles_ == 0) {
    std::remove(logFilePath_.c_str());
  } else {
    std::string oldest =
        logFilePath_ + "." + std::to_string(maxBackupFiles_);
    std::remove(oldest.c_str());
    for (int i = maxBackupFiles_ - 1; i >= 1; --i) {
      std::string from = logFilePath_ + "." + std::to_string(i);
      std::string to = logFilePath_ + "." + std::to_string(i + 1);
      std::ifstream probe(from.c_str());
      if (probe.good()) {
        probe.close();
        std::rename(from.c_str(), to.c_str());
      }
    }
    std::rename(logFilePath_.c_str(), (logFilePath_ + ".1").c_str());
  }
  logFileStream_.open(logFilePath_, std::ios::app);
  if (!logFileStream_.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath_ << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel_) {
    return;
  }
  const std::string record = formatRecord(level, message);
  if (logFilePath_ == CONSOLE_ONLY_OUTPUT) {
    std::cout << record << std::endl;
    return;
  }
  rotateIfNeeded();
  if (logFileStream_.is_open()) {
    logFileStream_ << record << std::endl;
  }
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}

} // namespace chunkvault
