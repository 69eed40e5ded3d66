#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <deque>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// Process-wide asynchronous logger. Lines are
//   2024-01-01 12:00:00.123 UTC [INFO] (thread) message
// Log calls made before Initialize (or after Shutdown) are dropped, so engine
// code and tests may log unconditionally.
class Logger {
public:
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO, bool echo_stderr = false);
  // Writes everything queued so far, then stops the worker.
  static void Shutdown();

  static void Log(LogLevel level, const std::string& message);
  static void Debug(const std::string& message) { Log(LogLevel::DEBUG, message); }
  static void Info(const std::string& message) { Log(LogLevel::INFO, message); }
  static void Warning(const std::string& message) { Log(LogLevel::WARNING, message); }
  static void Error(const std::string& message) { Log(LogLevel::ERROR, message); }
  static void Critical(const std::string& message) { Log(LogLevel::CRITICAL, message); }

  static const char* LevelName(LogLevel level);
  // DEBUG/INFO/WARN/WARNING/ERROR/CRIT/CRITICAL, any case.
  static LogLevel ParseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

  ~Logger();

private:
  struct Line {
    std::chrono::system_clock::time_point at;
    LogLevel level;
    std::thread::id thread;
    std::string text;
  };

  Logger() = default;
  void Worker();
  static std::string Format(const Line& line);

  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;

  std::ofstream file_;
  bool echo_stderr_ = false;
  LogLevel min_level_ = LogLevel::INFO;

  std::mutex queue_mutex_;
  std::condition_variable cv_;
  std::deque<Line> pending_;
  bool running_ = false;
  std::thread worker_;
};
