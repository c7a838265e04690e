/**
 * @file test_service.cpp
 * @brief Tests for service.hpp - service actor lifecycle and call protocol.
 */

#include "recycle/service.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// ============================================================================
// Helpers
// ============================================================================

static recycle::Value ReturnInstance(const recycle::Value& instance,
                                     const recycle::Args&) {
  return instance;
}

static recycle::Value Increment(const recycle::Value&,
                                const recycle::Args& args) {
  return recycle::Value(std::any_cast<int>(args.at(0)) + 1);
}

static bool WaitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds limit) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}

// ============================================================================
// Key
// ============================================================================

TEST_CASE("Service gets a generated key", "[service][key]") {
  auto a = recycle::CreateService();
  auto b = recycle::CreateService();
  REQUIRE(a.Key().rfind("service-", 0) == 0);
  REQUIRE(b.Key().rfind("service-", 0) == 0);
  REQUIRE(a.Key() != b.Key());
}

TEST_CASE("Service keeps an explicit key", "[service][key]") {
  recycle::ServiceSpec spec;
  spec.key = "my-service";
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Key() == "my-service");
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("Service can be started and stopped", "[service][lifecycle]") {
  auto s = recycle::CreateService();
  REQUIRE(s.IsStopped());
  REQUIRE(s.Start(std::string("config")).has_value());
  REQUIRE(s.IsStarted());
  REQUIRE(!s.IsStopped());
  REQUIRE(s.Stop().has_value());
  REQUIRE(s.IsStopped());
}

TEST_CASE("Default service has no receive handler", "[service][lifecycle]") {
  auto s = recycle::CreateService();
  REQUIRE(s.Start().has_value());
  auto r = s.Ask(std::string("x"));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == recycle::ServiceError::kNoReceiveHandler);
}

TEST_CASE("Start and stop are idempotent", "[service][lifecycle]") {
  auto spy = std::make_shared<std::atomic<int>>(0);
  recycle::ServiceSpec spec;
  spec.start = [spy](const recycle::Value&) {
    ++*spy;
    return recycle::Value();
  };
  spec.stop = [spy](const recycle::Value&) {
    ++*spy;
    return recycle::Value();
  };
  auto s = recycle::CreateService(spec);

  for (int i = 0; i < 3; ++i) REQUIRE(s.Start(std::string("config")).has_value());
  REQUIRE(spy->load() == 1);

  for (int i = 0; i < 3; ++i) REQUIRE(s.Stop().has_value());
  REQUIRE(spy->load() == 2);
}

TEST_CASE("Stop on a never-started service runs nothing", "[service][lifecycle]") {
  auto calls = std::make_shared<std::atomic<int>>(0);
  recycle::ServiceSpec spec;
  spec.stop = [calls](const recycle::Value&) {
    ++*calls;
    return recycle::Value();
  };
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Stop().has_value());
  REQUIRE(calls->load() == 0);
  REQUIRE(s.IsStopped());
}

TEST_CASE("Start receives the config", "[service][lifecycle]") {
  recycle::ServiceSpec spec;
  spec.start = [](const recycle::Value& cfg) { return cfg; };
  spec.receive = ReturnInstance;
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start(std::string("config")).has_value());

  auto inst = s.AskAs<std::string>();
  REQUIRE(inst.has_value());
  REQUIRE(inst.value() == "config");
}

TEST_CASE("map_config output is what start receives", "[service][lifecycle]") {
  auto mapped = std::make_shared<std::atomic<int>>(0);
  recycle::ServiceSpec spec;
  spec.map_config = [mapped](const recycle::Value&) {
    ++*mapped;
    return recycle::Value(std::string("other"));
  };
  spec.start = [](const recycle::Value& cfg) { return cfg; };
  spec.receive = ReturnInstance;
  auto s = recycle::CreateService(spec);

  REQUIRE(s.Start(std::string("config")).has_value());
  REQUIRE(s.Start(std::string("config")).has_value());
  REQUIRE(mapped->load() == 1);
  REQUIRE(s.AskAs<std::string>().value() == "other");
}

TEST_CASE("Stopped instance is the stop result", "[service][lifecycle]") {
  recycle::ServiceSpec spec;
  spec.start = [](const recycle::Value&) { return recycle::Value(1); };
  spec.stop = [](const recycle::Value& inst) {
    return recycle::Value(std::any_cast<int>(inst) + 100);
  };
  spec.receive = ReturnInstance;
  auto s = recycle::CreateService(spec);

  REQUIRE(s.Start().has_value());
  REQUIRE(s.AskAs<int>().value() == 1);
  REQUIRE(s.Stop().has_value());
  // Restart sees a fresh instance from start, not the stopped one
  REQUIRE(s.Start().has_value());
  REQUIRE(s.AskAs<int>().value() == 1);
}

// ============================================================================
// Receive
// ============================================================================

TEST_CASE("Ask is refused until the service is started", "[service][receive]") {
  recycle::ServiceSpec spec;
  spec.receive = Increment;
  auto s = recycle::CreateService(spec);

  auto before = s.Ask(0);
  REQUIRE(!before.has_value());
  REQUIRE(before.get_error().code == recycle::ServiceError::kNotRunning);
  REQUIRE(before.get_error().detail.find("isn't running") != std::string::npos);

  REQUIRE(s.Start(std::string("config")).has_value());
  auto r = s(0);
  REQUIRE(r.has_value());
  REQUIRE(std::any_cast<int>(r.value()) == 1);

  REQUIRE(s.Stop().has_value());
  auto after = s.Ask(0);
  REQUIRE(!after.has_value());
  REQUIRE(after.get_error().code == recycle::ServiceError::kNotRunning);
}

TEST_CASE("Receive sees every argument in order", "[service][receive]") {
  recycle::ServiceSpec spec;
  spec.receive = [](const recycle::Value&, const recycle::Args& args) {
    std::string joined;
    for (const auto& a : args) joined += std::any_cast<std::string>(a);
    return recycle::Value(joined);
  };
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start().has_value());

  auto r = s.AskAs<std::string>(std::string("a"), std::string("b"),
                                std::string("c"));
  REQUIRE(r.value() == "abc");
  auto empty = s.AskWith(recycle::Args{});
  REQUIRE(std::any_cast<std::string>(empty.value()).empty());
}

TEST_CASE("AskAs reports a result of the wrong type", "[service][receive]") {
  recycle::ServiceSpec spec;
  spec.receive = Increment;
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start().has_value());

  auto r = s.AskAs<std::string>(1);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == recycle::ServiceError::kBadResultType);
}

TEST_CASE("Calls from many threads are serialized", "[service][receive]") {
  recycle::ServiceSpec spec;
  spec.start = [](const recycle::Value&) {
    return recycle::Value(std::make_shared<int>(0));
  };
  spec.receive = [](const recycle::Value& inst, const recycle::Args&) {
    auto counter = std::any_cast<std::shared_ptr<int>>(inst);
    int seen = *counter;
    std::this_thread::yield();
    *counter = seen + 1;
    return recycle::Value(*counter);
  };
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start().has_value());

  constexpr int kThreads = 4;
  constexpr int kCalls = 50;
  std::atomic<int> ok{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&s, &ok]() {
      for (int i = 0; i < kCalls; ++i) {
        if (s.Ask().has_value()) ++ok;
      }
    });
  }
  for (auto& t : threads) t.join();
  REQUIRE(ok.load() == kThreads * kCalls);
  REQUIRE(s.AskAs<int>().value() == kThreads * kCalls + 1);
}

TEST_CASE("Concurrent starts run start exactly once", "[service][lifecycle]") {
  auto starts = std::make_shared<std::atomic<int>>(0);
  auto stops = std::make_shared<std::atomic<int>>(0);
  recycle::ServiceSpec spec;
  spec.start = [starts](const recycle::Value&) {
    ++*starts;
    std::this_thread::sleep_for(10ms);
    return recycle::Value();
  };
  spec.stop = [stops](const recycle::Value&) {
    ++*stops;
    return recycle::Value();
  };
  auto s = recycle::CreateService(spec);

  constexpr int kThreads = 8;
  std::atomic<int> ok{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&s, &ok]() {
      if (s.Start().has_value()) ++ok;
    });
  }
  for (auto& t : threads) t.join();
  REQUIRE(ok.load() == kThreads);
  REQUIRE(starts->load() == 1);
  REQUIRE(s.IsStarted());

  ok = 0;
  threads.clear();
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&s, &ok]() {
      if (s.Stop().has_value()) ++ok;
    });
  }
  for (auto& t : threads) t.join();
  REQUIRE(ok.load() == kThreads);
  REQUIRE(stops->load() == 1);
  REQUIRE(s.IsStopped());
}

TEST_CASE("Interleaved start and stop keep a consistent state", "[service][lifecycle]") {
  auto starts = std::make_shared<std::atomic<int>>(0);
  auto stops = std::make_shared<std::atomic<int>>(0);
  recycle::ServiceSpec spec;
  spec.start = [starts](const recycle::Value&) {
    ++*starts;
    return recycle::Value();
  };
  spec.stop = [stops](const recycle::Value&) {
    ++*stops;
    return recycle::Value();
  };
  auto s = recycle::CreateService(spec);

  constexpr int kThreads = 6;
  constexpr int kRounds = 40;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&s, &failures, t]() {
      for (int i = 0; i < kRounds; ++i) {
        auto r = ((i + t) % 2 == 0) ? s.Start() : s.Stop();
        if (!r.has_value()) ++failures;
      }
    });
  }
  for (auto& t : threads) t.join();
  REQUIRE(failures.load() == 0);

  // Transitions alternate, so the counts differ by the current phase.
  REQUIRE(s.IsStarted() != s.IsStopped());
  REQUIRE(starts->load() - stops->load() == (s.IsStarted() ? 1 : 0));

  // The state after a reply is the one that reply reports.
  REQUIRE(s.Start().has_value());
  REQUIRE(s.IsStarted());
  REQUIRE(s.Stop().has_value());
  REQUIRE(s.IsStopped());
  REQUIRE(starts->load() == stops->load());
}

// ============================================================================
// User function failures
// ============================================================================

TEST_CASE("Failing start leaves the service stopped", "[service][failure]") {
  recycle::ServiceSpec spec;
  spec.start = [](const recycle::Value&) -> recycle::Value {
    throw std::runtime_error("cannot open db");
  };
  auto s = recycle::CreateService(spec);

  auto r = s.Start();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == recycle::ServiceError::kUserFunctionFailed);
  REQUIRE(r.get_error().detail.find("cannot open db") != std::string::npos);
  REQUIRE(s.IsStopped());
}

TEST_CASE("Failing stop leaves the service started", "[service][failure]") {
  recycle::ServiceSpec spec;
  spec.stop = [](const recycle::Value&) -> recycle::Value {
    throw std::runtime_error("flush failed");
  };
  spec.receive = Increment;
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start().has_value());

  auto r = s.Stop();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == recycle::ServiceError::kUserFunctionFailed);
  REQUIRE(s.IsStarted());
  REQUIRE(s.AskAs<int>(1).value() == 2);
}

TEST_CASE("ServiceException code passes through unchanged", "[service][failure]") {
  recycle::ServiceSpec spec;
  spec.receive = [](const recycle::Value&, const recycle::Args&) -> recycle::Value {
    throw recycle::ServiceException(recycle::ServiceError::kServiceNotFound,
                                    "nobody home");
  };
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start().has_value());

  auto r = s.Ask();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == recycle::ServiceError::kServiceNotFound);
  REQUIRE(r.get_error().detail == "nobody home");
}

TEST_CASE("Receive failure keeps the actor running", "[service][failure]") {
  recycle::ServiceSpec spec;
  spec.receive = [](const recycle::Value&, const recycle::Args& args) {
    if (args.empty()) throw std::invalid_argument("no args");
    return args.front();
  };
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start().has_value());

  REQUIRE(!s.Ask().has_value());
  REQUIRE(s.AskAs<int>(7).value() == 7);
}

// ============================================================================
// Timeouts
// ============================================================================

TEST_CASE("Slow start times out with the configured timeout", "[service][timeout]") {
  recycle::ServiceSpec spec;
  spec.timeout_ms = 100;
  spec.start = [](const recycle::Value&) {
    std::this_thread::sleep_for(1000ms);
    return recycle::Value();
  };
  auto s = recycle::CreateService(spec);

  auto begin = std::chrono::steady_clock::now();
  auto r = s.Start();
  auto elapsed = std::chrono::steady_clock::now() - begin;
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == recycle::ServiceError::kTakeTimeout);
  REQUIRE(r.get_error().detail.find("timed out") != std::string::npos);
  REQUIRE(elapsed >= 90ms);
  REQUIRE(elapsed < 900ms);
}

TEST_CASE("Timeout override wins over the configured timeout", "[service][timeout]") {
  recycle::ServiceSpec spec;
  spec.timeout_ms = 5000;
  spec.start = [](const recycle::Value&) {
    std::this_thread::sleep_for(1000ms);
    return recycle::Value();
  };
  auto s = recycle::CreateService(spec);

  REQUIRE(!recycle::CurrentTimeoutOverride().has_value());
  auto begin = std::chrono::steady_clock::now();
  {
    recycle::ScopedTimeoutOverride guard(100);
    REQUIRE(recycle::CurrentTimeoutOverride().value() == 100U);
    auto r = s.Start();
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error().code == recycle::ServiceError::kTakeTimeout);
  }
  auto elapsed = std::chrono::steady_clock::now() - begin;
  REQUIRE(elapsed < 900ms);
  REQUIRE(!recycle::CurrentTimeoutOverride().has_value());
}

TEST_CASE("Timeout overrides nest and restore", "[service][timeout]") {
  REQUIRE(recycle::EffectiveTimeoutMs(250) == 250U);
  REQUIRE(recycle::EffectiveTimeoutMs(0) == recycle::kDefaultTimeoutMs);
  {
    recycle::ScopedTimeoutOverride outer(500);
    REQUIRE(recycle::EffectiveTimeoutMs(250) == 500U);
    {
      recycle::ScopedTimeoutOverride inner(20);
      REQUIRE(recycle::EffectiveTimeoutMs(250) == 20U);
    }
    REQUIRE(recycle::EffectiveTimeoutMs(250) == 500U);
  }
  REQUIRE(recycle::EffectiveTimeoutMs(250) == 250U);
}

TEST_CASE("Timed-out start still completes on the actor", "[service][timeout]") {
  recycle::ServiceSpec spec;
  spec.timeout_ms = 50;
  spec.start = [](const recycle::Value&) {
    std::this_thread::sleep_for(200ms);
    return recycle::Value();
  };
  auto s = recycle::CreateService(spec);

  auto r = s.Start();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == recycle::ServiceError::kTakeTimeout);
  REQUIRE(WaitUntil([&s]() { return s.IsStarted(); }, 3000ms));
}

TEST_CASE("Full inbox makes the call fail with PutTimeout", "[service][timeout]") {
  auto entered = std::make_shared<std::promise<void>>();
  auto gate = std::make_shared<std::promise<void>>();
  std::shared_future<void> gate_future = gate->get_future().share();

  recycle::ServiceSpec spec;
  spec.timeout_ms = 5000;
  spec.inbox_capacity = 1;
  spec.receive = [entered, gate_future](const recycle::Value&,
                                        const recycle::Args& args) {
    if (!args.empty() && std::any_cast<int>(args.front()) == 0) {
      entered->set_value();
      gate_future.wait();
    }
    return recycle::Value(1);
  };
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start().has_value());

  std::thread busy([&s]() { (void)s.Ask(0); });
  entered->get_future().wait();
  std::thread queued([&s]() { (void)s.Ask(1); });
  REQUIRE(WaitUntil([&s]() { return s.PendingMessages() == 1U; }, 3000ms));

  {
    recycle::ScopedTimeoutOverride guard(50);
    auto r = s.Ask(2);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error().code == recycle::ServiceError::kPutTimeout);
  }

  gate->set_value();
  busy.join();
  queued.join();
  REQUIRE(s.AskAs<int>(3).value() == 1);
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE("Calls after Shutdown fail with InboxClosed", "[service][shutdown]") {
  recycle::ServiceSpec spec;
  spec.receive = Increment;
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start().has_value());

  s.Shutdown();
  s.Shutdown();  // idempotent
  REQUIRE(s.IsShutdown());
  auto r = s.Ask(1);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == recycle::ServiceError::kInboxClosed);
  REQUIRE(s.Stop().get_error().code == recycle::ServiceError::kInboxClosed);
}

TEST_CASE("Shutdown answers queued messages", "[service][shutdown]") {
  auto entered = std::make_shared<std::promise<void>>();
  auto gate = std::make_shared<std::promise<void>>();
  std::shared_future<void> gate_future = gate->get_future().share();

  recycle::ServiceSpec spec;
  spec.receive = [entered, gate_future](const recycle::Value&,
                                        const recycle::Args& args) {
    if (std::any_cast<int>(args.front()) == 0) {
      entered->set_value();
      gate_future.wait();
    }
    return recycle::Value(std::string("done"));
  };
  auto s = recycle::CreateService(spec);
  REQUIRE(s.Start().has_value());

  recycle::Result first = recycle::MakeFault(recycle::ServiceError::kInternalError, "");
  recycle::Result second = recycle::MakeFault(recycle::ServiceError::kInternalError, "");
  std::thread busy([&]() { first = s.Ask(0); });
  entered->get_future().wait();
  std::thread queued([&]() { second = s.Ask(1); });
  REQUIRE(WaitUntil([&s]() { return s.PendingMessages() == 1U; }, 3000ms));

  std::thread closer([&s]() { s.Shutdown(); });
  REQUIRE(WaitUntil([&s]() { return s.IsShutdown(); }, 3000ms));
  gate->set_value();
  closer.join();
  busy.join();
  queued.join();

  REQUIRE(first.has_value());
  REQUIRE(std::any_cast<std::string>(first.value()) == "done");
  REQUIRE(!second.has_value());
  REQUIRE(second.get_error().code == recycle::ServiceError::kInboxClosed);
}

TEST_CASE("Shutdown still processes a queued stop", "[service][shutdown]") {
  auto running = std::make_shared<std::atomic<int>>(0);
  recycle::ServiceSpec spec;
  spec.timeout_ms = 50;
  spec.start = [running](const recycle::Value&) {
    std::this_thread::sleep_for(200ms);
    ++*running;
    return recycle::Value();
  };
  spec.stop = [running](const recycle::Value&) {
    --*running;
    return recycle::Value();
  };
  auto s = recycle::CreateService(spec);

  REQUIRE(s.Start().get_error().code == recycle::ServiceError::kTakeTimeout);
  REQUIRE(s.Stop().get_error().code == recycle::ServiceError::kTakeTimeout);
  s.Shutdown();
  REQUIRE(s.IsStopped());
  REQUIRE(running->load() == 0);
}

TEST_CASE("Shutdown from a user function while another thread joins", "[service][shutdown]") {
  auto entered = std::make_shared<std::promise<void>>();
  auto handle = std::make_shared<std::shared_ptr<recycle::ServiceHandle>>();
  recycle::ServiceSpec spec;
  spec.receive = [entered, handle](const recycle::Value&, const recycle::Args&) {
    entered->set_value();
    std::this_thread::sleep_for(100ms);
    (*handle)->Shutdown();
    return recycle::Value(std::string("closed"));
  };
  auto s = std::make_shared<recycle::ServiceHandle>(recycle::CreateService(spec));
  *handle = s;
  REQUIRE(s->Start().has_value());

  recycle::Result r = recycle::MakeFault(recycle::ServiceError::kInternalError, "");
  std::thread caller([&]() { r = s->Ask(); });
  entered->get_future().wait();
  auto closer = std::async(std::launch::async, [s]() { s->Shutdown(); });
  REQUIRE(closer.wait_for(3s) == std::future_status::ready);
  caller.join();

  REQUIRE(r.has_value());
  REQUIRE(s->IsShutdown());
  handle->reset();
}

TEST_CASE("Shutdown does not run the stop function", "[service][shutdown]") {
  auto stopped = std::make_shared<std::atomic<bool>>(false);
  recycle::ServiceSpec spec;
  spec.stop = [stopped](const recycle::Value&) {
    *stopped = true;
    return recycle::Value();
  };
  {
    auto s = recycle::CreateService(spec);
    REQUIRE(s.Start().has_value());
    s.Shutdown();
    REQUIRE(s.IsStarted());
  }
  REQUIRE(!stopped->load());
}
