#include "app/command_journal.hpp"
#include "engine/lending_pool.hpp"
#include "access/access_gate.hpp"
#include "common/clock.hpp"
#include "common/lending_error.hpp"
#include "common/logger.hpp"
#include "oracle/static_price_feed.hpp"
#include "liquidation/liquidation_keeper.hpp"
#include <istream>
#include <ostream>

using nlohmann::json;
using FixedPoint::FormatDecimal;

namespace {

std::string Str(const json& cmd, const char* key) {
  if (!cmd.contains(key) || !cmd.at(key).is_string()) {
    throw LendingError(LendingErrc::InvalidParameter, std::string("missing string field '") + key + "'");
  }
  return cmd.at(key).get<std::string>();
}

std::uint64_t Uint(const json& cmd, const char* key) {
  if (!cmd.contains(key) || !cmd.at(key).is_number_unsigned()) {
    throw LendingError(LendingErrc::InvalidParameter, std::string("missing unsigned field '") + key + "'");
  }
  return cmd.at(key).get<std::uint64_t>();
}

std::uint32_t Bps(const json& cmd, const char* key) {
  const std::uint64_t v = Uint(cmd, key);
  if (v > 0xFFFFFFFFULL) throw LendingError(LendingErrc::InvalidParameter, std::string(key) + " is out of range");
  return static_cast<std::uint32_t>(v);
}

Amount Decimal(const json& cmd, const char* key) {
  if (cmd.contains(key)) {
    const json& v = cmd.at(key);
    if (v.is_string()) return FixedPoint::ParseDecimal(v.get<std::string>());
    if (v.is_number_unsigned()) return FixedPoint::Tokens(v.get<std::uint64_t>());
  }
  throw LendingError(LendingErrc::InvalidParameter, std::string("missing decimal field '") + key + "'");
}

InterestRateCurve Curve(const json& cmd, const InterestRateCurve& base) {
  InterestRateCurve c = base;
  if (cmd.contains("base_rate_bps")) c.base_rate_bps = Bps(cmd, "base_rate_bps");
  if (cmd.contains("slope1_bps")) c.slope1_bps = Bps(cmd, "slope1_bps");
  if (cmd.contains("slope2_bps")) c.slope2_bps = Bps(cmd, "slope2_bps");
  if (cmd.contains("optimal_utilization_bps")) c.optimal_utilization_bps = Bps(cmd, "optimal_utilization_bps");
  if (cmd.contains("reserve_factor_bps")) c.reserve_factor_bps = Bps(cmd, "reserve_factor_bps");
  return c;
}

json Notifications(const Receipt& r) {
  json out = json::array();
  for (const auto& n : r.notifications) {
    json j{{"notifier", n.notifier}, {"delivered", n.delivered}};
    if (!n.delivered) j["error"] = n.error;
    out.push_back(j);
  }
  return out;
}

json PoolJson(const Pool& p) {
  return json{
    {"asset", p.asset},
    {"total_deposits", FormatDecimal(p.total_deposits)},
    {"total_borrows", FormatDecimal(p.total_borrows)},
    {"total_reserves", FormatDecimal(p.total_reserves)},
    {"last_update_time", p.last_update_time},
    {"is_active", p.is_active},
    {"deposits_enabled", p.deposits_enabled},
    {"borrowing_enabled", p.borrowing_enabled},
    {"delisted", p.delisted},
    {"collateral_factor_bps", p.risk.collateral_factor_bps},
    {"liquidation_bonus_bps", p.risk.liquidation_bonus_bps},
    {"liquidation_threshold_bps", p.risk.liquidation_threshold_bps},
  };
}

json LoanJson(const Loan& l) {
  return json{
    {"id", l.id},
    {"borrower", l.borrower},
    {"status", ToString(l.status)},
    {"collateral_asset", l.collateral_asset},
    {"borrow_asset", l.borrow_asset},
    {"collateral_amount", FormatDecimal(l.collateral_amount)},
    {"principal", FormatDecimal(l.principal)},
    {"accrued_interest", FormatDecimal(l.accrued_interest)},
    {"total_debt", FormatDecimal(l.TotalDebt())},
    {"interest_rate_bps", l.interest_rate_bps},
    {"liquidation_threshold_bps", l.liquidation_threshold_bps},
    {"start_time", l.start_time},
    {"last_accrual_time", l.last_accrual_time},
    {"repaid_principal", FormatDecimal(l.repaid_principal)},
    {"repaid_interest", FormatDecimal(l.repaid_interest)},
    {"collateral_seized", FormatDecimal(l.collateral_seized)},
    {"collateral_returned", FormatDecimal(l.collateral_returned)},
    {"closed_time", l.closed_time},
  };
}

json HealthJson(const HealthReport& h) {
  return json{
    {"collateral_value_usd", FormatDecimal(h.collateral_value_usd)},
    {"debt_value_usd", FormatDecimal(h.debt_value_usd)},
    {"health_factor", h.debt_value_usd == 0 ? json(nullptr) : json(FormatDecimal(h.health_factor))},
    {"liquidatable", h.liquidatable},
  };
}

json BalanceJson(const BalanceReceipt& r) {
  return json{{"asset", r.asset}, {"balance", FormatDecimal(r.balance)}, {"pool", PoolJson(r.pool)},
              {"notifications", Notifications(r)}};
}

json LiquidationJson(const LiquidationReceipt& r) {
  return json{
    {"loan", LoanJson(r.loan)},
    {"health_before", HealthJson(r.health_before)},
    {"repaid", FormatDecimal(r.plan.repay_amount)},
    {"interest_paid", FormatDecimal(r.outcome.split.interest_paid)},
    {"principal_paid", FormatDecimal(r.outcome.split.principal_paid)},
    {"collateral_seized", FormatDecimal(r.plan.collateral_to_seize)},
    {"bonus", FormatDecimal(r.plan.bonus)},
    {"collateral_to_liquidator", FormatDecimal(r.outcome.collateral_to_liquidator)},
    {"collateral_to_borrower", FormatDecimal(r.outcome.collateral_to_borrower)},
    {"capped", r.plan.capped},
    {"closed", r.outcome.closed},
    {"notifications", Notifications(r)},
  };
}

json ErrorJson(const std::string& code, const std::string& message) {
  return json{{"code", code}, {"message", message}};
}

}

json CommandJournal::Execute(const json& command) {
  json out = json::object();
  std::string op;
  try {
    if (!command.is_object()) throw LendingError(LendingErrc::InvalidParameter, "command must be a JSON object");
    op = Str(command, "op");
    out["op"] = op;
    if (command.contains("ts")) {
      if (!clock_) throw LendingError(LendingErrc::InvalidParameter, "\"ts\" needs the manual clock");
      clock_->Set(Uint(command, "ts"));
    }
    out["result"] = Dispatch(op, command);
    out["ok"] = true;
  } catch (const LendingError& e) {
    out.erase("result");
    out["ok"] = false;
    out["error"] = ErrorJson(ToString(e.code()), e.what());
  } catch (const json::exception& e) {
    out.erase("result");
    out["ok"] = false;
    out["error"] = ErrorJson("bad_command", e.what());
  }
  return out;
}

json CommandJournal::Dispatch(const std::string& op, const json& cmd) {
  // user operations
  if (op == "deposit") return BalanceJson(pool_.Deposit(Str(cmd, "user"), Str(cmd, "asset"), Decimal(cmd, "amount")));
  if (op == "withdraw") return BalanceJson(pool_.Withdraw(Str(cmd, "user"), Str(cmd, "asset"), Decimal(cmd, "amount")));
  if (op == "borrow") {
    BorrowReceipt r = pool_.Borrow(Str(cmd, "user"), Str(cmd, "collateral_asset"), Str(cmd, "borrow_asset"),
                                   Decimal(cmd, "collateral_amount"), Decimal(cmd, "amount"));
    return json{{"loan", LoanJson(r.loan)}, {"notifications", Notifications(r)}};
  }
  if (op == "repay") {
    RepayReceipt r = pool_.Repay(Str(cmd, "user"), Uint(cmd, "loan_id"), Decimal(cmd, "amount"));
    return json{{"loan", LoanJson(r.loan)},
                {"amount_applied", FormatDecimal(r.amount_applied)},
                {"interest_paid", FormatDecimal(r.split.interest_paid)},
                {"principal_paid", FormatDecimal(r.split.principal_paid)},
                {"collateral_released", FormatDecimal(r.collateral_released)},
                {"notifications", Notifications(r)}};
  }
  if (op == "liquidate") return LiquidationJson(pool_.Liquidate(Str(cmd, "liquidator"), Uint(cmd, "loan_id"), Decimal(cmd, "amount")));
  if (op == "accrue") {
    AccrualResult r = pool_.AccrueInterest(Str(cmd, "asset"));
    return json{{"elapsed", r.elapsed}, {"interest", FormatDecimal(r.interest)}, {"reserves", FormatDecimal(r.reserves)}};
  }

  // environment
  if (op == "set_price") {
    if (!prices_) throw LendingError(LendingErrc::InvalidParameter, "prices are not settable with this feed");
    const std::string asset = Str(cmd, "asset");
    const std::uint32_t confidence = cmd.contains("confidence_bps") ? Bps(cmd, "confidence_bps") : 10000;
    if (cmd.contains("timestamp")) {
      PriceData d;
      d.price = Decimal(cmd, "price");
      d.timestamp = Uint(cmd, "timestamp");
      d.confidence_bps = confidence;
      prices_->Set(asset, d);
    } else {
      prices_->SetFixed(asset, Decimal(cmd, "price"), confidence);
    }
    return json{{"asset", asset}};
  }
  if (op == "advance") {
    if (!clock_) throw LendingError(LendingErrc::InvalidParameter, "\"advance\" needs the manual clock");
    clock_->Advance(Uint(cmd, "seconds"));
    return json{{"now", clock_->Now()}};
  }
  if (op == "keeper") {
    if (!keeper_) throw LendingError(LendingErrc::InvalidParameter, "no liquidation keeper configured");
    KeeperReport report = keeper_->RunOnce();
    json liquidated = json::array();
    for (const auto& r : report.liquidations) liquidated.push_back(LiquidationJson(r));
    json failed = json::array();
    for (const auto& f : report.failures) failed.push_back(json{{"loan_id", f.loan_id}, {"error", f.error}});
    return json{{"candidates", report.candidates}, {"liquidated", liquidated}, {"failed", failed}};
  }

  // views
  if (op == "pool") {
    PoolInfo info = pool_.GetPoolInfo(Str(cmd, "asset"));
    json j = PoolJson(info.pool);
    j["available_liquidity"] = FormatDecimal(info.available_liquidity);
    j["utilization_bps"] = info.utilization_bps;
    j["borrow_apy_bps"] = info.borrow_apy_bps;
    j["supply_apy_bps"] = info.supply_apy_bps;
    return j;
  }
  if (op == "loan") return LoanJson(pool_.GetLoanInfo(Uint(cmd, "loan_id")));
  if (op == "health") return HealthJson(pool_.GetLoanHealthFactor(Uint(cmd, "loan_id")));
  if (op == "user_loans") return json(pool_.GetUserLoans(Str(cmd, "user")));
  if (op == "balance") return json{{"balance", FormatDecimal(pool_.GetUserBalance(Str(cmd, "user"), Str(cmd, "asset")))}};
  if (op == "can_borrow") return json{{"can_borrow", pool_.CanBorrow(Str(cmd, "asset"), Decimal(cmd, "amount"))}};
  if (op == "liquidatable") return json(pool_.GetLiquidatableLoans());
  if (op == "status") {
    return json{{"paused", pool_.IsPaused()}, {"fee_recipient", pool_.FeeRecipient()},
                {"next_loan_id", pool_.NextLoanId()}, {"assets", pool_.ListedAssets()}};
  }

  // administration
  const std::string caller = cmd.value("caller", std::string());
  if (op == "grant_role" || op == "revoke_role") {
    if (!gate_.Authorize(caller, AdminAction::ManageRoles)) {
      throw LendingError(LendingErrc::Unauthorized, caller + " may not " + ToString(AdminAction::ManageRoles));
    }
    const std::string account = Str(cmd, "account");
    const Role role = ParseRole(Str(cmd, "role"));
    if (op == "grant_role") {
      gate_.Grant(account, role);
    } else {
      gate_.Revoke(account, role);
    }
    Logger::Info(caller + " " + (op == "grant_role" ? "granted " : "revoked ") + ToString(role) + " for " + account);
    return json::object();
  }
  if (op == "list_asset") {
    std::optional<std::uint32_t> threshold;
    if (cmd.contains("liquidation_threshold_bps")) threshold = Bps(cmd, "liquidation_threshold_bps");
    pool_.AddSupportedAsset(caller, Str(cmd, "asset"), Bps(cmd, "collateral_factor_bps"),
                            Bps(cmd, "liquidation_bonus_bps"), threshold);
    return json::object();
  }
  if (op == "delist_asset") { pool_.RemoveSupportedAsset(caller, Str(cmd, "asset")); return json::object(); }
  if (op == "set_risk") {
    PoolRiskParams risk;
    risk.collateral_factor_bps = Bps(cmd, "collateral_factor_bps");
    risk.liquidation_bonus_bps = Bps(cmd, "liquidation_bonus_bps");
    risk.liquidation_threshold_bps = Bps(cmd, "liquidation_threshold_bps");
    pool_.SetRiskParameters(caller, Str(cmd, "asset"), risk);
    return json::object();
  }
  if (op == "set_pool_flags") {
    pool_.SetPoolFlags(caller, Str(cmd, "asset"), cmd.value("deposits_enabled", true), cmd.value("borrowing_enabled", true));
    return json::object();
  }
  if (op == "set_curve") {
    pool_.SetInterestCurve(caller, Curve(cmd, InterestRateCurve{}));
    return json::object();
  }
  if (op == "set_pool_curve") {
    std::optional<InterestRateCurve> curve;
    if (!cmd.value("reset", false)) curve = Curve(cmd, pool_.GetPoolInfo(Str(cmd, "asset")).curve);
    pool_.SetPoolInterestCurve(caller, Str(cmd, "asset"), curve);
    return json::object();
  }
  if (op == "pause_pool") { pool_.PausePool(caller, Str(cmd, "asset")); return json::object(); }
  if (op == "unpause_pool") { pool_.UnpausePool(caller, Str(cmd, "asset")); return json::object(); }
  if (op == "pause") { pool_.Pause(caller); return json::object(); }
  if (op == "unpause") { pool_.Unpause(caller); return json::object(); }
  if (op == "set_fee_recipient") { pool_.SetFeeRecipient(caller, Str(cmd, "recipient")); return json::object(); }
  if (op == "withdraw_reserves") {
    ReserveReceipt r = pool_.WithdrawReserves(caller, Str(cmd, "asset"), Decimal(cmd, "amount"));
    return json{{"recipient", r.recipient}, {"amount", FormatDecimal(r.amount)},
                {"remaining_reserves", FormatDecimal(r.remaining_reserves)}, {"notifications", Notifications(r)}};
  }
  throw LendingError(LendingErrc::InvalidParameter, "unknown op '" + op + "'");
}

size_t CommandJournal::Replay(std::istream& in, std::ostream& out) {
  size_t failures = 0;
  size_t line_no = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++line_no;
    const size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') continue;
    json cmd = json::parse(line, nullptr, false);
    json result;
    if (cmd.is_discarded()) {
      result = json{{"ok", false}, {"line", line_no}, {"error", ErrorJson("bad_command", "line is not valid JSON")}};
    } else {
      result = Execute(cmd);
    }
    if (!result.value("ok", false)) ++failures;
    out << result.dump() << '\n';
  }
  out.flush();
  if (failures) Logger::Warning("Journal replay: " + std::to_string(failures) + " of " + std::to_string(line_no) + " line(s) failed");
  return failures;
}
