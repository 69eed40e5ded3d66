#include "telemetry/csv_logger.hpp"
#include "common/logger.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

const char* kHeader =
  "Logged_At,Event_Time,Loan_ID,Borrower,Liquidator,Borrow_Asset,Collateral_Asset,"
  "Repaid,Interest_Paid,Principal_Paid,Collateral_Seized,Bonus,Collateral_Returned,"
  "Health_Factor,Capped,Closed,Status";

// Builds one comma separated line. Text() fields are quoted, Raw() fields
// (numbers, booleans) are written as is.
class CsvRow {
public:
  CsvRow& Text(const std::string& field) {
    Separate();
    line_ += '"';
    for (char c : field) {
      if (c == '"') line_ += '"';
      line_ += c;
    }
    line_ += '"';
    return *this;
  }
  template <typename T>
  CsvRow& Raw(const T& value) {
    Separate();
    std::ostringstream oss;
    oss << std::boolalpha << value;
    line_ += oss.str();
    return *this;
  }
  std::string Finish() { return line_ + '\n'; }

private:
  void Separate() {
    if (!line_.empty()) line_ += ',';
  }
  std::string line_;
};

std::string UtcNow() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::tm utc{};
  gmtime_r(&t, &utc);
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count() << " UTC";
  return oss.str();
}

bool StartsWithHeader(const std::string& filename) {
  std::ifstream in(filename);
  std::string first;
  return in && std::getline(in, first) && first.find("Loan_ID") != std::string::npos;
}

}

CsvLogger::CsvLogger(const std::string& filename) : last_write_(std::chrono::steady_clock::now()) {
  const bool has_header = StartsWithHeader(filename);
  file_.open(filename, std::ios::app);
  if (!file_.is_open()) {
    Logger::Error("Failed to open liquidation CSV: " + filename);
    return;
  }
  if (!has_header) {
    file_ << kHeader << '\n';
    file_.flush();
  }
}

CsvLogger::~CsvLogger() {
  if (file_.is_open()) Flush();
}

void CsvLogger::LogLiquidation(const LiquidationRecord& r) {
  CsvRow row;
  row.Text(UtcNow()).Raw(r.event_time).Raw(r.loan_id)
     .Text(r.borrower).Text(r.liquidator).Text(r.borrow_asset).Text(r.collateral_asset)
     .Raw(r.repaid).Raw(r.interest_paid).Raw(r.principal_paid)
     .Raw(r.collateral_seized).Raw(r.bonus).Raw(r.collateral_returned).Raw(r.health_factor)
     .Raw(r.capped).Raw(r.closed)
     .Text(r.closed ? "LIQUIDATED" : "PARTIAL");
  Append(row.Finish());
}

void CsvLogger::Append(std::string row) {
  std::lock_guard<std::mutex> lock(mutex_);
  buffer_ += row;
  ++buffered_rows_;
  if (buffered_rows_ >= kMaxBufferedRows || std::chrono::steady_clock::now() - last_write_ >= kFlushInterval) {
    WriteBufferLocked();
  }
}

void CsvLogger::WriteBufferLocked() {
  if (buffer_.empty()) return;
  file_ << buffer_;
  file_.flush();
  buffer_.clear();
  buffered_rows_ = 0;
  last_write_ = std::chrono::steady_clock::now();
}

void CsvLogger::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  WriteBufferLocked();
}
