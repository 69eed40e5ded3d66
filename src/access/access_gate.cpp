#include "access/access_gate.hpp"
#include "common/lending_error.hpp"
#include <mutex>

const char* ToString(AdminAction action) {
  switch (action) {
    case AdminAction::ListAsset: return "list_asset";
    case AdminAction::DelistAsset: return "delist_asset";
    case AdminAction::SetRiskParameters: return "set_risk_parameters";
    case AdminAction::SetPoolFlags: return "set_pool_flags";
    case AdminAction::SetInterestCurve: return "set_interest_curve";
    case AdminAction::PausePool: return "pause_pool";
    case AdminAction::PauseProtocol: return "pause_protocol";
    case AdminAction::WithdrawReserves: return "withdraw_reserves";
    case AdminAction::SetFeeRecipient: return "set_fee_recipient";
    case AdminAction::ManageRoles: return "manage_roles";
  }
  return "unknown";
}

const char* ToString(Role role) {
  switch (role) {
    case Role::Admin: return "admin";
    case Role::RiskManager: return "risk_manager";
    case Role::Guardian: return "guardian";
    case Role::Treasurer: return "treasurer";
  }
  return "unknown";
}

Role ParseRole(const std::string& name) {
  if (name == "admin") return Role::Admin;
  if (name == "risk_manager") return Role::RiskManager;
  if (name == "guardian") return Role::Guardian;
  if (name == "treasurer") return Role::Treasurer;
  throw LendingError(LendingErrc::InvalidParameter, "unknown role: " + name);
}

bool RoleAccessGate::RoleAllows(Role role, AdminAction action) {
  switch (role) {
    case Role::Admin:
      return true;
    case Role::RiskManager:
      return action == AdminAction::ListAsset || action == AdminAction::DelistAsset ||
             action == AdminAction::SetRiskParameters || action == AdminAction::SetPoolFlags ||
             action == AdminAction::SetInterestCurve;
    case Role::Guardian:
      return action == AdminAction::PausePool || action == AdminAction::PauseProtocol;
    case Role::Treasurer:
      return action == AdminAction::WithdrawReserves || action == AdminAction::SetFeeRecipient;
  }
  return false;
}

bool RoleAccessGate::Authorize(const std::string& caller, AdminAction action) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = roles_.find(caller);
  if (it == roles_.end()) return false;
  for (int r : it->second) {
    if (RoleAllows(static_cast<Role>(r), action)) return true;
  }
  return false;
}

void RoleAccessGate::Grant(const std::string& account, Role role) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  roles_[account].insert(static_cast<int>(role));
}

void RoleAccessGate::Revoke(const std::string& account, Role role) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  auto it = roles_.find(account);
  if (it == roles_.end()) return;
  it->second.erase(static_cast<int>(role));
  if (it->second.empty()) roles_.erase(it);
}

bool RoleAccessGate::HasRole(const std::string& account, Role role) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = roles_.find(account);
  return it != roles_.end() && it->second.count(static_cast<int>(role)) > 0;
}
