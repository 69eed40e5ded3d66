#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/clock.hpp"
#include "access/access_gate.hpp"
#include "engine/lending_pool.hpp"
#include "engine/market_config.hpp"
#include "net/http_client.hpp"
#include "oracle/static_price_feed.hpp"
#include "oracle/http_price_feed.hpp"
#include "notify/activity_notifier.hpp"
#include "telemetry/structured_logger.hpp"
#include "telemetry/csv_logger.hpp"
#include "scheduler/thread_pool.hpp"
#include "liquidation/liquidation_keeper.hpp"
#include "app/command_journal.hpp"
#include <fstream>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
  try {
    ConfigManager::Initialize(".env");
    Logger::Initialize(ConfigManager::Get("LOG_FILE").value_or("lending.log"),
                       Logger::ParseLevel(ConfigManager::Get("LOG_LEVEL").value_or("INFO")),
                       ConfigManager::GetBoolOr("LOG_TO_STDERR", false));
    StructuredLogger::Instance().Initialize(ConfigManager::Get("METRICS_FILE").value_or("metrics.jsonl"));
    Logger::Info("Lending engine starting");

    MarketConfig markets;
    if (auto path = ConfigManager::Get("MARKETS_FILE")) {
      markets = MarketConfig::LoadFile(*path);
    } else {
      Logger::Warning("MARKETS_FILE not set; starting with no listed assets");
    }
    ApplyEnvOverrides(markets.protocol);

    // Journal timestamps drive this clock; it starts at wall time.
    ManualClock clock(SystemClock().Now());

    std::unique_ptr<HttpClient> http;
    std::unique_ptr<PriceFeed> feed;
    StaticPriceFeed* static_feed = nullptr;
    if (auto url = ConfigManager::Get("PRICE_FEED_URL")) {
      http.reset(CreateCurlHttpClient());
      feed.reset(new HttpPriceFeed(*http, *url, ConfigManager::GetIntOr("PRICE_FEED_TIMEOUT_MS", 1500)));
      Logger::Info("Using HTTP price feed at " + *url);
    } else {
      auto prices = std::make_unique<StaticPriceFeed>(clock);
      const size_t seeded = prices->LoadOverrides(ConfigManager::Get("PRICE_USD_OVERRIDES").value_or(""));
      Logger::Info("Using static price table with " + std::to_string(seeded) + " seeded price(s)");
      static_feed = prices.get();
      feed = std::move(prices);
    }

    RoleAccessGate gate;
    LendingPool pool(clock, *feed, gate, markets.protocol, markets.curve);
    ApplyMarketConfig(markets, pool, gate);

    StructuredActivityNotifier structured;
    CsvLogger csv(ConfigManager::Get("LIQUIDATION_CSV").value_or("liquidations.csv"));
    LiquidationCsvNotifier csv_notifier(csv);
    pool.AddNotifier(structured);
    pool.AddNotifier(csv_notifier);

    const KeeperSettings keeper_settings = KeeperSettingsFromEnv();
    ThreadPool workers(keeper_settings.threads);
    LiquidationKeeper keeper(pool, workers, keeper_settings.account, keeper_settings.close_factor_bps);

    CommandJournal journal(pool, gate, &clock, static_feed, &keeper);
    size_t failures = 0;
    if (argc > 1) {
      std::ifstream in(argv[1]);
      if (!in.is_open()) {
        std::cerr << "Cannot open journal: " << argv[1] << std::endl;
        Logger::Critical(std::string("Cannot open journal: ") + argv[1]);
        Logger::Shutdown();
        StructuredLogger::Instance().Shutdown();
        return 1;
      }
      failures = journal.Replay(in, std::cout);
    } else {
      failures = journal.Replay(std::cin, std::cout);
    }

    csv.Flush();
    Logger::Info("Lending engine stopped");
    Logger::Shutdown();
    StructuredLogger::Instance().Shutdown();
    return failures == 0 ? 0 : 2;
  } catch (const std::exception& e) {
    std::cerr << "CRITICAL ERROR: " << e.what() << std::endl;
    Logger::Critical(std::string("Startup failed: ") + e.what());
    Logger::Shutdown();
    StructuredLogger::Instance().Shutdown();
    return 1;
  }
}
