#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "math/fixed_point.hpp"

class CsvLogger;

enum class ActivityKind {
  Deposit,
  Withdraw,
  Borrow,
  Repay,
  Liquidate,
  ReservesWithdrawn,
};

const char* ToString(ActivityKind kind);

// A committed state change, published after the engine lock is released.
// Fields that do not apply to the kind stay empty or zero.
struct ActivityEvent {
  ActivityKind kind = ActivityKind::Deposit;
  std::uint64_t timestamp = 0;
  std::string account;          // depositor, borrower, liquidator or fee recipient
  std::string asset;            // asset moved by `account`
  Amount amount;
  std::uint64_t loan_id = 0;
  std::string borrower;         // liquidations: owner of the loan
  std::string collateral_asset;
  Amount collateral_amount;     // posted (borrow), released (repay) or seized (liquidate)
  Amount interest_paid;
  Amount principal_paid;
  Amount bonus;
  Amount collateral_returned;
  Amount health_factor;
  bool capped = false;
  bool closed = false;
};

nlohmann::json ToJson(const ActivityEvent& event);

struct NotifyResult {
  std::string notifier;
  bool delivered = false;
  std::string error;

  static NotifyResult Ok(const std::string& notifier) { return NotifyResult{notifier, true, ""}; }
  static NotifyResult Failed(const std::string& notifier, const std::string& error) {
    return NotifyResult{notifier, false, error};
  }
};

class ActivityNotifier {
public:
  virtual ~ActivityNotifier() = default;
  virtual std::string Name() const = 0;
  virtual NotifyResult Notify(const ActivityEvent& event) = 0;
};

// Every event as one JSON line through StructuredLogger.
class StructuredActivityNotifier : public ActivityNotifier {
public:
  std::string Name() const override { return "structured"; }
  NotifyResult Notify(const ActivityEvent& event) override;
};

// Liquidations only, as rows of the CSV audit. Other kinds are acknowledged
// without writing anything.
class LiquidationCsvNotifier : public ActivityNotifier {
public:
  explicit LiquidationCsvNotifier(CsvLogger& csv) : csv_(csv) {}
  std::string Name() const override { return "liquidation_csv"; }
  NotifyResult Notify(const ActivityEvent& event) override;
private:
  CsvLogger& csv_;
};
