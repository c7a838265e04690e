// Copyright (c) 2024 liudegui. MIT License.
//
// service_demo.cpp -- single service actor walkthrough.
//
// Demonstrates:
//   1. Counter service with start/stop/receive
//   2. Idempotent start and stop
//   3. Fault codes returned to the caller
//   4. Timeout override around a slow call

#include "recycle/log.hpp"
#include "recycle/service.hpp"

#include <chrono>
#include <cstdio>
#include <map>
#include <memory>
#include <string>
#include <thread>

// ============================================================================
// Counter Service
// ============================================================================

struct Counter {
  std::string name;
  std::map<std::string, int> totals;
};

static recycle::ServiceSpec MakeCounterSpec() {
  recycle::ServiceSpec spec;
  spec.key = "counter";
  spec.timeout_ms = 1000;
  spec.start = [](const recycle::Value& config) {
    auto counter = std::make_shared<Counter>();
    counter->name = std::any_cast<std::string>(config);
    std::printf("  [counter] start (%s)\n", counter->name.c_str());
    return recycle::Value(counter);
  };
  spec.stop = [](const recycle::Value& instance) {
    auto counter = std::any_cast<std::shared_ptr<Counter>>(instance);
    std::printf("  [counter] stop (%zu keys)\n", counter->totals.size());
    return recycle::Value();
  };
  spec.receive = [](const recycle::Value& instance, const recycle::Args& args) {
    auto counter = std::any_cast<std::shared_ptr<Counter>>(instance);
    const auto& cmd = std::any_cast<const std::string&>(args.at(0));
    if (cmd == "slow") {
      std::this_thread::sleep_for(std::chrono::milliseconds(300));
      return recycle::Value(0);
    }
    int& total = counter->totals[cmd];
    total += (args.size() > 1) ? std::any_cast<int>(args[1]) : 1;
    return recycle::Value(total);
  };
  return spec;
}

static void PrintResult(const char* what,
                        const recycle::expected<int, recycle::ServiceFault>& r) {
  if (r.has_value()) {
    std::printf("  %-22s -> %d\n", what, r.value());
  } else {
    std::printf("  %-22s -> %s\n", what, r.get_error().ToString().c_str());
  }
}

// ============================================================================
// Main
// ============================================================================

int main() {
  recycle::log::SetLevel(recycle::log::Level::kInfo);
  recycle::log::Init();

  auto counter = recycle::CreateService(MakeCounterSpec());
  std::printf("=== service '%s' ===\n", counter.Key().c_str());

  PrintResult("ask before start", counter.AskAs<int>(std::string("hits")));

  auto started = counter.Start(std::string("demo"));
  if (!started.has_value()) {
    RECYCLE_LOG_ERROR("Demo", "start failed: %s",
                      started.get_error().ToString().c_str());
    return 1;
  }
  // already started: replies at once, start() is not run again
  auto again = counter.Start(std::string("ignored"));
  std::printf("  second start: %s\n", again.has_value() ? "ok" : "failed");
  PrintResult("hits", counter.AskAs<int>(std::string("hits")));
  PrintResult("hits +5", counter.AskAs<int>(std::string("hits"), 5));
  PrintResult("misses", counter.AskAs<int>(std::string("misses")));

  {
    recycle::ScopedTimeoutOverride guard(100);
    PrintResult("slow (100 ms bound)", counter.AskAs<int>(std::string("slow")));
  }
  PrintResult("slow (default bound)", counter.AskAs<int>(std::string("slow")));

  auto stopped = counter.Stop();
  std::printf("  stop: %s\n", stopped.has_value() ? "ok" : "failed");
  auto stopped_again = counter.Stop();
  std::printf("  second stop: %s\n", stopped_again.has_value() ? "ok" : "failed");
  PrintResult("ask after stop", counter.AskAs<int>(std::string("hits")));

  counter.Shutdown();
  recycle::log::Shutdown();
  return 0;
}
