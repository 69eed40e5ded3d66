#pragma once
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <cstdint>

// One row of the liquidation audit. Amounts are pre-formatted decimals so the
// file keeps full 18-digit precision.
struct LiquidationRecord {
  std::uint64_t event_time = 0;
  std::uint64_t loan_id = 0;
  std::string borrower;
  std::string liquidator;
  std::string borrow_asset;
  std::string collateral_asset;
  std::string repaid;
  std::string interest_paid;
  std::string principal_paid;
  std::string collateral_seized;
  std::string bonus;
  std::string collateral_returned;
  std::string health_factor;
  bool capped = false;
  bool closed = false;
};

// Append-only liquidation audit. Rows are buffered and written when the
// buffer fills, when the flush interval passes, on Flush, or on destruction.
// The header is written only when the file does not already start with one.
class CsvLogger {
public:
  explicit CsvLogger(const std::string& filename);
  ~CsvLogger();

  bool IsOpen() const { return file_.is_open(); }
  void LogLiquidation(const LiquidationRecord& record);
  void Flush();

private:
  static constexpr size_t kMaxBufferedRows = 100;
  static constexpr std::chrono::seconds kFlushInterval{5};

  void Append(std::string row);
  void WriteBufferLocked();

  std::ofstream file_;
  std::mutex mutex_;
  std::string buffer_;
  size_t buffered_rows_ = 0;
  std::chrono::steady_clock::time_point last_write_;
};
