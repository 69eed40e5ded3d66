#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <nlohmann/json.hpp>

// JSON-lines event sink: each event becomes one line in the metrics file.
// Events are serialized and written by a background worker.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Starts the worker appending to `file_path`. Ignored while already running.
  void Initialize(const std::string& file_path);
  // Writes what is queued and stops; Initialize may be called again afterwards.
  void Shutdown();
  // false when the sink is stopped and the event was dropped
  bool LogEvent(nlohmann::json event);

private:
  StructuredLogger() = default;
  ~StructuredLogger();
  void Worker(std::string file_path);

  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<nlohmann::json> pending_;
  std::thread worker_;
  bool running_ = false;
};
