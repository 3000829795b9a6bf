#pragma once
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

enum class LogLevel { Info, Warning, Error };

// Asynchronous logger writing to stderr and partslabel.log. Messages are
// queued by any thread and written in order by a single worker.
class Logger {
public:
  // Access singleton instance, creating log file on first use.
  static Logger &Instance();

  // Queue a message to be logged.
  void Log(LogLevel level, const std::string &msg);

  void Info(const std::string &msg) { Log(LogLevel::Info, msg); }
  void Warning(const std::string &msg) { Log(LogLevel::Warning, msg); }
  void Error(const std::string &msg) { Log(LogLevel::Error, msg); }

  // Mirror messages on stderr (on by default).
  void SetEchoToStderr(bool echo);

  static const char *LevelPrefix(LogLevel level);

private:
  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Worker();

  std::ofstream file_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  bool done_ = false;
  bool echo_ = true;
  std::thread worker_;
};
