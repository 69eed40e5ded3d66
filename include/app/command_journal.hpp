#pragma once
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>

class LendingPool;
class RoleAccessGate;
class ManualClock;
class StaticPriceFeed;
class LiquidationKeeper;

// Replays JSON-lines commands against a LendingPool, one JSON line of output
// per command:
//   {"op":"deposit","user":"alice","asset":"USDC","amount":"1000","ts":1700000000}
//   -> {"op":"deposit","ok":true,"result":{...}}
//   -> {"op":"deposit","ok":false,"error":{"code":"pool_inactive","message":"..."}}
// Amounts are decimal strings (or whole-unit integers). "ts", "advance" and
// "set_price" need the manual clock and static feed; the others work with any
// collaborators. Blank lines and lines starting with '#' are skipped.
class CommandJournal {
public:
  CommandJournal(LendingPool& pool, RoleAccessGate& gate,
                 ManualClock* clock = nullptr, StaticPriceFeed* prices = nullptr,
                 LiquidationKeeper* keeper = nullptr)
    : pool_(pool), gate_(gate), clock_(clock), prices_(prices), keeper_(keeper) {}

  nlohmann::json Execute(const nlohmann::json& command);
  // Returns the number of commands that failed.
  size_t Replay(std::istream& in, std::ostream& out);

private:
  nlohmann::json Dispatch(const std::string& op, const nlohmann::json& cmd);
  LendingPool& pool_;
  RoleAccessGate& gate_;
  ManualClock* clock_;
  StaticPriceFeed* prices_;
  LiquidationKeeper* keeper_;
};
