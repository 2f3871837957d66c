#pragma once
#ifndef CHUNKVAULT_LOGGER_H
#define CHUNKVAULT_LOGGER_H
#include <fstream>
#include <mutex>
#include <string>

namespace chunkvault {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name such as "info" or "WARN".
 * @throws VaultException(InvalidConfig) for unknown names.
 */
LogLevel parseLogLevel(const std::string &name);

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Every record is written as one JSON object with "timestamp", "level" and
 * "message" keys. When the active file grows past maxFileSize it is renamed
 * to "<file>.1", older backups shift up, and at most maxBackupFiles are kept.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Log to stdout only

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  /**
   * @brief Access the active logger.
   *
   * Falls back to a console logger at WARN level if init() was never called.
   */
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSize,
         int maxBackupFiles);

  void rotateIfNeeded();
  std::string formatRecord(LogLevel level, const std::string &message) const;
  static std::string getTimestamp();
  static const char *levelToString(LogLevel level);

  std::ofstream logFileStream_;
  LogLevel currentLogLevel_;
  std::string logFilePath_;
  long long maxFileSize_;
  int maxBackupFiles_;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace chunkvault

#endif // CHUNKVAULT_LOGGER_H
