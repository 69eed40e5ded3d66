#pragma once
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>

enum class AdminAction {
  ListAsset,
  DelistAsset,
  SetRiskParameters,
  SetPoolFlags,
  SetInterestCurve,
  PausePool,
  PauseProtocol,
  WithdrawReserves,
  SetFeeRecipient,
  ManageRoles,
};

const char* ToString(AdminAction action);

// Authorization capability handed to the engine; the engine asks it before
// every administrative mutation and never stores roles itself.
class AccessGate {
public:
  virtual ~AccessGate() = default;
  virtual bool Authorize(const std::string& caller, AdminAction action) const = 0;
};

enum class Role {
  Admin,          // every action
  RiskManager,    // listing, risk parameters, pool flags, interest curve
  Guardian,       // pool and protocol pause
  Treasurer,      // reserves and fee recipient
};

const char* ToString(Role role);
// "admin", "risk_manager", "guardian", "treasurer"; throws LendingError(InvalidParameter).
Role ParseRole(const std::string& name);

class RoleAccessGate : public AccessGate {
public:
  bool Authorize(const std::string& caller, AdminAction action) const override;
  void Grant(const std::string& account, Role role);
  void Revoke(const std::string& account, Role role);
  bool HasRole(const std::string& account, Role role) const;
private:
  static bool RoleAllows(Role role, AdminAction action);
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::unordered_set<int>> roles_;
};
