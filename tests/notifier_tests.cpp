#include "test_support.hpp"
#include "telemetry/structured_logger.hpp"
#include "telemetry/csv_logger.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> ReadLines(const fs::path& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

fs::path FreshTempFile(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / name;
  fs::remove(p);
  return p;
}

ActivityEvent SampleLiquidation() {
  ActivityEvent e;
  e.kind = ActivityKind::Liquidate;
  e.timestamp = kStart;
  e.account = "liq";
  e.asset = "USDC";
  e.amount = Tok(765);
  e.loan_id = 7;
  e.borrower = "bob";
  e.collateral_asset = "ETH";
  e.collateral_amount = Tok(1000);
  e.bonus = Units("90.5");
  e.health_factor = Units("0.9");
  e.capped = true;
  e.closed = true;
  return e;
}

}

BOOST_AUTO_TEST_SUITE(notifiers)

BOOST_AUTO_TEST_CASE(event_json_carries_kind_specific_fields) {
  ActivityEvent deposit;
  deposit.kind = ActivityKind::Deposit;
  deposit.timestamp = kStart;
  deposit.account = "lp";
  deposit.asset = "USDC";
  deposit.amount = Units("12.5");
  const nlohmann::json d = ToJson(deposit);
  BOOST_CHECK_EQUAL(d["event"].get<std::string>(), "deposit");
  BOOST_CHECK_EQUAL(d["ts"].get<std::uint64_t>(), kStart);
  BOOST_CHECK_EQUAL(d["amount"].get<std::string>(), "12.5");
  BOOST_CHECK(!d.contains("loan_id"));

  const nlohmann::json l = ToJson(SampleLiquidation());
  BOOST_CHECK_EQUAL(l["event"].get<std::string>(), "liquidate");
  BOOST_CHECK_EQUAL(l["borrower"].get<std::string>(), "bob");
  BOOST_CHECK_EQUAL(l["collateral_seized"].get<std::string>(), "1000");
  BOOST_CHECK_EQUAL(l["health_factor"].get<std::string>(), "0.9");
  BOOST_CHECK(l["capped"].get<bool>());
  BOOST_CHECK_EQUAL(std::string(ToString(ActivityKind::ReservesWithdrawn)), "reserves_withdrawn");
}

BOOST_AUTO_TEST_CASE(structured_notifier_writes_json_lines) {
  const fs::path path = FreshTempFile("lending_structured_test.jsonl");
  StructuredActivityNotifier notifier;
  StructuredLogger::Instance().Shutdown();
  BOOST_CHECK(!notifier.Notify(SampleLiquidation()).delivered);

  StructuredLogger::Instance().Initialize(path.string());
  const NotifyResult r = notifier.Notify(SampleLiquidation());
  BOOST_CHECK(r.delivered);
  BOOST_CHECK_EQUAL(r.notifier, "structured");
  StructuredLogger::Instance().Shutdown();

  const auto lines = ReadLines(path);
  BOOST_REQUIRE_EQUAL(lines.size(), 1u);
  const auto j = nlohmann::json::parse(lines[0]);
  BOOST_CHECK_EQUAL(j["loan_id"].get<std::uint64_t>(), 7u);
  BOOST_CHECK_EQUAL(j["bonus"].get<std::string>(), "90.5");
  fs::remove(path);
}

BOOST_AUTO_TEST_CASE(csv_notifier_records_liquidations_only) {
  const fs::path path = FreshTempFile("lending_liquidations_test.csv");
  {
    CsvLogger csv(path.string());
    BOOST_REQUIRE(csv.IsOpen());
    LiquidationCsvNotifier notifier(csv);
    ActivityEvent deposit;
    BOOST_CHECK(notifier.Notify(deposit).delivered);
    ActivityEvent partial = SampleLiquidation();
    partial.closed = false;
    partial.borrower = "o\"brien";
    BOOST_CHECK(notifier.Notify(partial).delivered);
    BOOST_CHECK(notifier.Notify(SampleLiquidation()).delivered);
    csv.Flush();
  }
  {
    // reopening must not write a second header
    CsvLogger again(path.string());
  }
  const auto lines = ReadLines(path);
  BOOST_REQUIRE_EQUAL(lines.size(), 3u);
  BOOST_CHECK(lines[0].find("Loan_ID") != std::string::npos);
  BOOST_CHECK(lines[1].find("\"o\"\"brien\"") != std::string::npos);
  BOOST_CHECK(lines[1].find("\"PARTIAL\"") != std::string::npos);
  BOOST_CHECK(lines[2].find("\"LIQUIDATED\"") != std::string::npos);
  BOOST_CHECK(lines[2].find(",765,") != std::string::npos);
  fs::remove(path);
}

BOOST_AUTO_TEST_CASE(csv_notifier_reports_unwritable_file) {
  CsvLogger csv((fs::temp_directory_path() / "no_such_dir" / "x.csv").string());
  BOOST_CHECK(!csv.IsOpen());
  LiquidationCsvNotifier notifier(csv);
  const NotifyResult r = notifier.Notify(SampleLiquidation());
  BOOST_CHECK(!r.delivered);
  BOOST_CHECK_EQUAL(r.notifier, "liquidation_csv");
}

BOOST_FIXTURE_TEST_CASE(engine_liquidation_reaches_csv, MarketFixture) {
  const fs::path path = FreshTempFile("lending_engine_csv_test.csv");
  {
    CsvLogger csv(path.string());
    LiquidationCsvNotifier notifier(csv);
    pool.AddNotifier(notifier);
    const Loan loan = OpenUsdcLoan(Tok(10000), Tok(1000), Tok(765));
    prices.SetFixed("ETH", Units("0.81"));
    const LiquidationReceipt r = pool.Liquidate("liq", loan.id, Tok(81));
    BOOST_CHECK(r.AllDelivered());
    csv.Flush();
    const auto lines = ReadLines(path);
    BOOST_REQUIRE_EQUAL(lines.size(), 2u);
    BOOST_CHECK(lines[1].find("\"bob\",\"liq\",\"USDC\",\"ETH\",81,0,81,110,10,0,0.9") != std::string::npos);
  }
  fs::remove(path);
}

BOOST_AUTO_TEST_SUITE_END()
