#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include <fstream>

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger sink;
  return sink;
}

StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  if (worker_.joinable()) worker_.join();
  running_ = true;
  worker_ = std::thread(&StructuredLogger::Worker, this, file_path);
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool StructuredLogger::LogEvent(nlohmann::json event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return false;
    pending_.push_back(std::move(event));
  }
  cv_.notify_one();
  return true;
}

void StructuredLogger::Worker(std::string file_path) {
  std::ofstream out(file_path, std::ios::app | std::ios::out);
  if (!out.is_open()) Logger::Error("Cannot open metrics file " + file_path);
  std::vector<nlohmann::json> batch;
  bool stopping = false;
  while (!stopping) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]{ return !pending_.empty() || !running_; });
      batch.swap(pending_);
      stopping = !running_;
    }
    if (batch.empty()) continue;
    std::string text;
    for (const auto& e : batch) {
      text += e.dump();
      text += '\n';
    }
    batch.clear();
    if (out.is_open()) {
      out << text;
      out.flush();
    }
  }
}
