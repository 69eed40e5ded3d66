#include "notify/activity_notifier.hpp"
#include "telemetry/structured_logger.hpp"
#include "telemetry/csv_logger.hpp"

using FixedPoint::FormatDecimal;

const char* ToString(ActivityKind kind) {
  switch (kind) {
    case ActivityKind::Deposit: return "deposit";
    case ActivityKind::Withdraw: return "withdraw";
    case ActivityKind::Borrow: return "borrow";
    case ActivityKind::Repay: return "repay";
    case ActivityKind::Liquidate: return "liquidate";
    case ActivityKind::ReservesWithdrawn: return "reserves_withdrawn";
  }
  return "unknown";
}

nlohmann::json ToJson(const ActivityEvent& e) {
  nlohmann::json j;
  j["event"] = ToString(e.kind);
  j["ts"] = e.timestamp;
  j["account"] = e.account;
  j["asset"] = e.asset;
  j["amount"] = FormatDecimal(e.amount);
  switch (e.kind) {
    case ActivityKind::Borrow:
      j["loan_id"] = e.loan_id;
      j["collateral_asset"] = e.collateral_asset;
      j["collateral_amount"] = FormatDecimal(e.collateral_amount);
      break;
    case ActivityKind::Repay:
      j["loan_id"] = e.loan_id;
      j["interest_paid"] = FormatDecimal(e.interest_paid);
      j["principal_paid"] = FormatDecimal(e.principal_paid);
      j["collateral_released"] = FormatDecimal(e.collateral_amount);
      j["closed"] = e.closed;
      break;
    case ActivityKind::Liquidate:
      j["loan_id"] = e.loan_id;
      j["borrower"] = e.borrower;
      j["collateral_asset"] = e.collateral_asset;
      j["collateral_seized"] = FormatDecimal(e.collateral_amount);
      j["bonus"] = FormatDecimal(e.bonus);
      j["interest_paid"] = FormatDecimal(e.interest_paid);
      j["principal_paid"] = FormatDecimal(e.principal_paid);
      j["collateral_returned"] = FormatDecimal(e.collateral_returned);
      j["health_factor"] = FormatDecimal(e.health_factor);
      j["capped"] = e.capped;
      j["closed"] = e.closed;
      break;
    default:
      break;
  }
  return j;
}

NotifyResult StructuredActivityNotifier::Notify(const ActivityEvent& event) {
  if (!StructuredLogger::Instance().LogEvent(ToJson(event))) {
    return NotifyResult::Failed(Name(), "structured sink is not running");
  }
  return NotifyResult::Ok(Name());
}

NotifyResult LiquidationCsvNotifier::Notify(const ActivityEvent& event) {
  if (event.kind != ActivityKind::Liquidate) return NotifyResult::Ok(Name());
  if (!csv_.IsOpen()) return NotifyResult::Failed(Name(), "liquidation CSV is not open");
  LiquidationRecord r;
  r.event_time = event.timestamp;
  r.loan_id = event.loan_id;
  r.borrower = event.borrower;
  r.liquidator = event.account;
  r.borrow_asset = event.asset;
  r.collateral_asset = event.collateral_asset;
  r.repaid = FormatDecimal(event.amount);
  r.interest_paid = FormatDecimal(event.interest_paid);
  r.principal_paid = FormatDecimal(event.principal_paid);
  r.collateral_seized = FormatDecimal(event.collateral_amount);
  r.bonus = FormatDecimal(event.bonus);
  r.collateral_returned = FormatDecimal(event.collateral_returned);
  r.health_factor = FormatDecimal(event.health_factor);
  r.capped = event.capped;
  r.closed = event.closed;
  csv_.LogLiquidation(r);
  return NotifyResult::Ok(Name());
}
