#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

void Logger::Initialize(const std::string& path, LogLevel min_level, bool echo_stderr) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) instance_.reset(new Logger());
  Logger& log = *instance_;
  log.min_level_ = min_level;
  log.echo_stderr_ = echo_stderr;
  if (log.running_) return;  // reconfigure only
  if (!path.empty()) {
    log.file_.open(path, std::ios::out | std::ios::app);
    if (!log.file_.is_open()) std::cerr << "Failed to open log file: " << path << std::endl;
  }
  log.running_ = true;
  log.worker_ = std::thread(&Logger::Worker, &log);
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> log;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    log = std::move(instance_);
  }
  // ~Logger drains and joins
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void Logger::Worker() {
  std::deque<Line> batch;
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      cv_.wait(lock, [this]{ return !pending_.empty() || !running_; });
      if (pending_.empty() && !running_) break;
      batch.swap(pending_);
    }
    std::string out;
    for (const Line& l : batch) out += Format(l);
    batch.clear();
    if (file_.is_open()) {
      file_ << out;
      file_.flush();
    }
    if (echo_stderr_) std::cerr << out;
  }
}

void Logger::Log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_ || level < instance_->min_level_) return;
  Logger& log = *instance_;
  {
    std::lock_guard<std::mutex> qlock(log.queue_mutex_);
    log.pending_.push_back(Line{std::chrono::system_clock::now(), level, std::this_thread::get_id(), message});
  }
  log.cv_.notify_one();
}

const char* Logger::LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARNING: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::CRITICAL: return "CRIT";
  }
  return "UNK";
}

LogLevel Logger::ParseLevel(const std::string& name, LogLevel fallback) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); });
  if (s == "DEBUG") return LogLevel::DEBUG;
  if (s == "INFO") return LogLevel::INFO;
  if (s == "WARN" || s == "WARNING") return LogLevel::WARNING;
  if (s == "ERROR") return LogLevel::ERROR;
  if (s == "CRIT" || s == "CRITICAL") return LogLevel::CRITICAL;
  return fallback;
}

std::string Logger::Format(const Line& line) {
  const std::time_t t = std::chrono::system_clock::to_time_t(line.at);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(line.at.time_since_epoch()) % 1000;
  std::tm utc{};
  gmtime_r(&t, &utc);
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count()
      << " UTC [" << LevelName(line.level) << "] (" << line.thread << ") " << line.text << '\n';
  return oss.str();
}
