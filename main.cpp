// -----------------------------------------------------------------------------
// riskguard — single executable entry point.
//
//   riskguard [config.json]
//
//   1) Load SystemConfig (defaults when no path is given).
//   2) Seed the in-memory position store with the configured opening book.
//   3) Start the RebalancingSystem: rebalance + notification loops, IPC
//      server, alert feed from the external portfolio monitor.
//   4) Log every trade and alert from the notification bus.
//   5) Wait for Ctrl-C or an IPC STOP command, then shut down cleanly.
// -----------------------------------------------------------------------------

#include "riskguard/config/config_loader.hpp"
#include "riskguard/engine/rebalancing_system.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/store/in_memory_portfolio_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

namespace {

// Set by the SIGINT handler, polled by main(). Lock-free atomic store is
// async-signal-safe.
std::atomic<bool> g_shutdown{false};

void sigint_handler(int /*signum*/) { g_shutdown.store(true); }

constexpr auto kWaitInterval = std::chrono::milliseconds(100);

}  // namespace

int main(int argc, char** argv) {
  riskguard::SystemConfig config;
  try {
    if (argc > 1) {
      config = riskguard::ConfigLoader::loadFile(argv[1]);
    } else {
      riskguard::ConfigLoader::validate(config);
    }
  } catch (const riskguard::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  riskguard::InMemoryPortfolioStore store;
  store.upsertAccount({config.account_id, config.initial_cash});
  for (const auto& position : config.initial_positions) {
    store.upsertPosition(config.account_id, position);
  }
  std::cout << "[main] Account " << config.account_id << ": "
            << config.initial_positions.size() << " position(s), cash "
            << config.initial_cash << "\n";

  riskguard::RebalancingSystem system(config, store);

  system.onTrade([](const riskguard::domain::TradeExecution& t) {
    std::cout << "[Trade] " << riskguard::domain::toString(t.action) << " "
              << t.quantity << " " << t.symbol << " @ " << t.price
              << (t.success ? "" : " FAILED: " + t.error.value_or(""))
              << "\n";
  });
  system.onAlert([](const riskguard::domain::Alert& a) {
    std::cout << "[Alert] " << riskguard::domain::toString(a.urgency) << " "
              << riskguard::domain::toString(a.alert_type) << " "
              << a.symbol.value_or("-") << ": " << a.title << "\n";
  });

  try {
    system.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] Failed to start: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Running ("
            << (config.rebalance.dry_run ? "DRY RUN" : "LIVE TRADING")
            << "). Press Ctrl-C or send STOP to shut down.\n";

  while (!g_shutdown.load() && !system.stopRequested()) {
    std::this_thread::sleep_for(kWaitInterval);
  }

  std::cout << "[main] Shutting down...\n";
  system.stop();
  return 0;
}
