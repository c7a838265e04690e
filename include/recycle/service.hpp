/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file service.hpp
 * @brief Service actor: lifecycle state owned by one thread, reached only
 *        through timeout-bounded messages.
 *
 * A service is described by a ServiceSpec (start/stop/receive/map_config
 * functions plus timeout and inbox capacity). CreateService() turns the spec
 * into a ServiceActor running its own processing thread and returns a
 * ServiceHandle, the only object callers touch.
 *
 * Lifecycle (mutated only on the actor thread):
 *
 *   Stopped(instance | empty) --start--> Started(instance)
 *   Started(instance)         --stop---> Stopped(stop result)
 *
 * Start and Stop are idempotent: repeating them replies with the current
 * instance and runs no user code. Receive on a stopped service fails with
 * kNotRunning.
 *
 * Every call creates a ReplySlot, enqueues the message (bounded wait) and
 * waits for the reply (bounded wait). A timeout only releases the caller;
 * the actor still finishes the work and its reply is dropped.
 *
 * Usage:
 * @code
 *   recycle::ServiceSpec spec;
 *   spec.start = [](const recycle::Value& cfg) { return cfg; };
 *   spec.receive = [](const recycle::Value& inst, const recycle::Args& args) {
 *     return recycle::Value(std::any_cast<int>(args[0]) + 1);
 *   };
 *   auto svc = recycle::CreateService(spec);
 *   svc.Start(std::string("config"));
 *   auto r = svc.AskAs<int>(41);   // r.value() == 42
 *   svc.Stop();
 * @endcode
 */

#ifndef RECYCLE_SERVICE_HPP_
#define RECYCLE_SERVICE_HPP_

#include "recycle/inbox.hpp"
#include "recycle/log.hpp"
#include "recycle/message.hpp"
#include "recycle/platform.hpp"
#include "recycle/vocabulary.hpp"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <variant>

namespace recycle {

// ============================================================================
// Service Spec
// ============================================================================

inline constexpr uint32_t kDefaultTimeoutMs = 60000U;
inline constexpr uint32_t kDefaultInboxCapacity = 1024U;

using StartFn = std::function<Value(const Value& config)>;
using StopFn = std::function<Value(const Value& instance)>;
using ReceiveFn = std::function<Value(const Value& instance, const Args& args)>;
using MapConfigFn = std::function<Value(const Value& config)>;

/**
 * @brief Blueprint of a service. Every field is optional.
 *
 * - key:            identifier; "service-<N>" is generated when empty.
 * - start:          builds the instance from the (mapped) config.
 * - stop:           tears the instance down; its result becomes the
 *                   stopped instance.
 * - receive:        answers Ask() calls; fails with kNoReceiveHandler when
 *                   not set.
 * - map_config:     transforms the config before start sees it.
 * - timeout_ms:     bound on each put and each reply wait.
 * - inbox_capacity: maximum number of queued messages.
 */
struct ServiceSpec {
  std::string key;
  StartFn start;
  StopFn stop;
  ReceiveFn receive;
  MapConfigFn map_config;
  uint32_t timeout_ms{kDefaultTimeoutMs};
  uint32_t inbox_capacity{kDefaultInboxCapacity};
};

enum class LifecyclePhase : uint8_t { kStopped, kStarted };

// ============================================================================
// Timeout Override
// ============================================================================

namespace detail {

inline std::atomic<uint32_t>& TimeoutOverrideRef() noexcept {
  static std::atomic<uint32_t> value{0U};
  return value;
}

inline std::string GenerateKey(const char* prefix) {
  static std::atomic<uint64_t> counter{0U};
  return std::string(prefix) +
         std::to_string(counter.fetch_add(1U, std::memory_order_relaxed) + 1U);
}

}  // namespace detail

/** @brief The active process-wide timeout override, if any. */
inline optional<uint32_t> CurrentTimeoutOverride() noexcept {
  const uint32_t value =
      detail::TimeoutOverrideRef().load(std::memory_order_acquire);
  return (value > 0U) ? optional<uint32_t>(value) : optional<uint32_t>();
}

/**
 * @brief Wait bound used for a call made right now.
 *
 * Precedence: active override, then the service's configured value, then
 * kDefaultTimeoutMs.
 */
inline uint32_t EffectiveTimeoutMs(uint32_t configured_ms) noexcept {
  const uint32_t override_ms =
      detail::TimeoutOverrideRef().load(std::memory_order_acquire);
  if (override_ms > 0U) return override_ms;
  return (configured_ms > 0U) ? configured_ms : kDefaultTimeoutMs;
}

/**
 * @brief Overrides every service's timeout while in scope.
 *
 * Applies to calls made on any thread during the guard's lifetime and
 * restores the previous override on destruction, so guards nest. Meant for
 * tests and tooling; production code should configure timeout_ms instead.
 */
class ScopedTimeoutOverride final {
 public:
  explicit ScopedTimeoutOverride(uint32_t timeout_ms) noexcept
      : previous_(detail::TimeoutOverrideRef().exchange(
            (timeout_ms > 0U) ? timeout_ms : 1U, std::memory_order_acq_rel)) {}

  ~ScopedTimeoutOverride() {
    detail::TimeoutOverrideRef().store(previous_, std::memory_order_release);
  }

  ScopedTimeoutOverride(const ScopedTimeoutOverride&) = delete;
  ScopedTimeoutOverride& operator=(const ScopedTimeoutOverride&) = delete;

 private:
  uint32_t previous_;
};

// ============================================================================
// ActorCore - state shared by the actor object and its thread
// ============================================================================

namespace detail {

class ActorCore final {
 public:
  explicit ActorCore(ServiceSpec spec)
      : key_(spec.key.empty() ? GenerateKey("service-") : std::move(spec.key)),
        start_fn_(std::move(spec.start)),
        stop_fn_(std::move(spec.stop)),
        receive_fn_(std::move(spec.receive)),
        map_config_fn_(std::move(spec.map_config)),
        inbox_(spec.inbox_capacity) {
    if (!start_fn_) {
      start_fn_ = [](const Value&) { return Value(); };
    }
    if (!stop_fn_) {
      stop_fn_ = [](const Value&) { return Value(); };
    }
    if (!map_config_fn_) {
      map_config_fn_ = [](const Value& config) { return config; };
    }
    if (!receive_fn_) {
      const std::string key = key_;
      receive_fn_ = [key](const Value&, const Args&) -> Value {
        throw ServiceException(ServiceError::kNoReceiveHandler,
                               "service '" + key + "' does not implement receive");
      };
    }
  }

  ActorCore(const ActorCore&) = delete;
  ActorCore& operator=(const ActorCore&) = delete;

  const std::string& Key() const noexcept { return key_; }
  BoundedInbox<Message>& Inbox() noexcept { return inbox_; }
  const BoundedInbox<Message>& Inbox() const noexcept { return inbox_; }

  LifecyclePhase Phase() const noexcept {
    return phase_.load(std::memory_order_acquire);
  }

  /**
   * @brief Processing loop. Runs on the actor thread until the inbox is
   *        closed, then drains leftovers.
   *
   * A stop request queued before the close is still processed so that a
   * started instance gets released; every other leftover is answered with
   * kInboxClosed.
   */
  void Run() {
    RECYCLE_LOG_DEBUG("Service", "%s: loop started", key_.c_str());
    Message msg;
    while (inbox_.Take(msg)) {
      Dispatch(msg);
    }

    uint32_t drained = 0U;
    while (inbox_.TryTake(msg)) {
      if (std::holds_alternative<StopMessage>(msg)) {
        Dispatch(msg);
        continue;
      }
      const ReplySlotPtr& reply = ReplyOf(msg);
      if (reply) {
        (void)reply->Deliver(MakeFault(ServiceError::kInboxClosed,
                                       "service '" + key_ + "' is shut down"));
      }
      ++drained;
    }
    RECYCLE_LOG_DEBUG("Service", "%s: loop exited (%u queued message(s) refused)",
                      key_.c_str(), drained);
  }

 private:
  void Dispatch(Message& msg) {
    const ReplySlotPtr reply = ReplyOf(msg);
    if (RECYCLE_UNLIKELY(!reply)) {
      RECYCLE_LOG_ERROR("Service", "%s: %s message without reply slot dropped",
                        key_.c_str(), MessageName(msg));
      return;
    }
    try {
      Result result =
          std::visit([this](auto& m) { return Handle(m); }, msg);
      if (!reply->Deliver(std::move(result))) {
        RECYCLE_LOG_DEBUG("Service", "%s: %s reply discarded, caller gave up",
                          key_.c_str(), MessageName(msg));
      }
    } catch (const std::exception& e) {
      RECYCLE_LOG_ERROR("Service", "%s: failed to process %s message: %s",
                        key_.c_str(), MessageName(msg), e.what());
      (void)reply->Deliver(MakeFault(ServiceError::kInternalError, e.what()));
    } catch (...) {
      RECYCLE_LOG_ERROR("Service", "%s: failed to process %s message",
                        key_.c_str(), MessageName(msg));
      (void)reply->Deliver(
          MakeFault(ServiceError::kInternalError, "unknown exception"));
    }
  }

  Result Handle(StartMessage& msg) {
    if (Phase() == LifecyclePhase::kStarted) {
      return Result::success(instance_);
    }
    Result started = Invoke("start", [this, &msg]() {
      return start_fn_(map_config_fn_(msg.config));
    });
    if (started.has_value()) {
      instance_ = started.value();
      phase_.store(LifecyclePhase::kStarted, std::memory_order_release);
      RECYCLE_LOG_DEBUG("Service", "%s: started", key_.c_str());
    } else {
      RECYCLE_LOG_DEBUG("Service", "%s: start failed: %s", key_.c_str(),
                        started.get_error().detail.c_str());
    }
    return started;
  }

  Result Handle(StopMessage& /*msg*/) {
    if (Phase() == LifecyclePhase::kStopped) {
      return Result::success(instance_);
    }
    Result stopped = Invoke("stop", [this]() { return stop_fn_(instance_); });
    if (stopped.has_value()) {
      instance_ = stopped.value();
      phase_.store(LifecyclePhase::kStopped, std::memory_order_release);
      RECYCLE_LOG_DEBUG("Service", "%s: stopped", key_.c_str());
    } else {
      RECYCLE_LOG_DEBUG("Service", "%s: stop failed: %s", key_.c_str(),
                        stopped.get_error().detail.c_str());
    }
    return stopped;
  }

  Result Handle(ReceiveMessage& msg) {
    if (Phase() == LifecyclePhase::kStopped) {
      return MakeFault(ServiceError::kNotRunning,
                       "called service '" + key_ + "' that isn't running");
    }
    return Invoke("receive",
                  [this, &msg]() { return receive_fn_(instance_, msg.args); });
  }

  // Runs a user function; its exceptions become the reply.
  template <typename Fn>
  Result Invoke(const char* what, Fn&& fn) {
    try {
      return Result::success(fn());
    } catch (const ServiceException& e) {
      return Result::error(e.fault());
    } catch (const std::exception& e) {
      return MakeFault(ServiceError::kUserFunctionFailed,
                       std::string(what) + " function of service '" + key_ +
                           "' threw: " + e.what());
    } catch (...) {
      return MakeFault(ServiceError::kUserFunctionFailed,
                       std::string(what) + " function of service '" + key_ +
                           "' threw a non-standard exception");
    }
  }

  const std::string key_;
  StartFn start_fn_;
  StopFn stop_fn_;
  ReceiveFn receive_fn_;
  MapConfigFn map_config_fn_;
  BoundedInbox<Message> inbox_;

  std::atomic<LifecyclePhase> phase_{LifecyclePhase::kStopped};
  Value instance_;  // actor thread only
};

}  // namespace detail

// ============================================================================
// ServiceActor
// ============================================================================

/**
 * @brief Owns one service's processing thread and implements the
 *        put/take protocol on the caller side.
 *
 * The thread starts in the constructor and stops in Shutdown() or the
 * destructor. Shutdown does not run the user stop function.
 */
class ServiceActor final {
 public:
  explicit ServiceActor(ServiceSpec spec)
      : timeout_ms_(spec.timeout_ms),
        core_(std::make_shared<detail::ActorCore>(std::move(spec))) {
    std::shared_ptr<detail::ActorCore> core = core_;
    worker_ = std::thread([core]() { core->Run(); });
  }

  ~ServiceActor() { Shutdown(); }

  ServiceActor(const ServiceActor&) = delete;
  ServiceActor& operator=(const ServiceActor&) = delete;
  ServiceActor(ServiceActor&&) = delete;
  ServiceActor& operator=(ServiceActor&&) = delete;

  const std::string& Key() const noexcept { return core_->Key(); }
  uint32_t TimeoutMs() const noexcept { return timeout_ms_; }
  uint32_t InboxCapacity() const noexcept { return core_->Inbox().Capacity(); }
  uint32_t PendingMessages() const noexcept { return core_->Inbox().Size(); }

  bool IsStarted() const noexcept {
    return core_->Phase() == LifecyclePhase::kStarted;
  }
  bool IsStopped() const noexcept {
    return core_->Phase() == LifecyclePhase::kStopped;
  }
  bool IsShutdown() const noexcept { return core_->Inbox().IsClosed(); }

  /** @brief Start with @p config. Replies with the instance. */
  Result Start(Value config) {
    return Call<StartMessage>(std::move(config));
  }

  /** @brief Stop. Replies with the stopped instance. */
  Result Stop() { return Call<StopMessage>(); }

  /** @brief Forward @p args to the receive function. */
  Result Receive(Args args) { return Call<ReceiveMessage>(std::move(args)); }

  /**
   * @brief Close the inbox and join the processing thread.
   *
   * Queued stop requests are still processed; other queued messages are
   * answered with kInboxClosed. Safe to call more than once and from the
   * actor's own thread (the thread is then detached and exits after the
   * current message).
   */
  void Shutdown() noexcept {
    std::thread worker;
    {
      std::lock_guard<std::mutex> lock(shutdown_mtx_);
      core_->Inbox().Close();
      worker = std::move(worker_);
    }
    if (!worker.joinable()) {
      return;
    }
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }

 private:
  template <typename MessageT, typename... Fields>
  Result Call(Fields&&... fields) {
    auto reply = std::make_shared<ReplySlot>();
    ReplySlotGuard guard(reply);
    Message msg(MessageT{std::forward<Fields>(fields)..., reply});
    const char* name = MessageName(msg);

    const uint32_t timeout_ms = EffectiveTimeoutMs(timeout_ms_);
    const std::chrono::milliseconds timeout(timeout_ms);

    auto put = core_->Inbox().Put(msg, timeout);
    if (!put.has_value()) {
      if (put.get_error() == InboxError::kClosed) {
        return MakeFault(ServiceError::kInboxClosed,
                         "service '" + Key() + "' is shut down");
      }
      RECYCLE_LOG_WARN("Service", "%s: put %s message timed out after %u ms",
                       Key().c_str(), name, timeout_ms);
      return MakeFault(ServiceError::kPutTimeout,
                       "put " + std::string(name) + " message to service '" +
                           Key() + "' timed out");
    }

    optional<Result> taken = reply->WaitFor(timeout);
    if (!taken.has_value()) {
      RECYCLE_LOG_WARN("Service", "%s: take %s result timed out after %u ms",
                       Key().c_str(), name, timeout_ms);
      return MakeFault(ServiceError::kTakeTimeout,
                       "take " + std::string(name) + " result from service '" +
                           Key() + "' timed out");
    }
    return std::move(taken).value();
  }

  const uint32_t timeout_ms_;
  std::shared_ptr<detail::ActorCore> core_;
  std::thread worker_;
  std::mutex shutdown_mtx_;
};

// ============================================================================
// ServiceHandle
// ============================================================================

template <typename... A>
Args MakeArgs(A&&... args) {
  Args out;
  out.reserve(sizeof...(A));
  (out.emplace_back(std::forward<A>(args)), ...);
  return out;
}

/**
 * @brief Caller-facing façade of a service: key, start, stop, ask.
 *
 * Cheap to copy; all copies refer to the same actor, which lives until the
 * last copy is gone. Every method may be called from any thread.
 */
class ServiceHandle final {
 public:
  explicit ServiceHandle(std::shared_ptr<ServiceActor> actor) noexcept
      : actor_(std::move(actor)) {
    RECYCLE_ASSERT(actor_ != nullptr);
  }

  const std::string& Key() const noexcept { return actor_->Key(); }

  expected<void, ServiceFault> Start(Value config = Value()) const {
    return ToVoid(actor_->Start(std::move(config)));
  }

  expected<void, ServiceFault> Stop() const { return ToVoid(actor_->Stop()); }

  bool IsStarted() const noexcept { return actor_->IsStarted(); }
  bool IsStopped() const noexcept { return actor_->IsStopped(); }

  /** @brief Send @p args to the receive function and return its result. */
  template <typename... A>
  Result Ask(A&&... args) const {
    return AskWith(MakeArgs(std::forward<A>(args)...));
  }

  /** @brief Alias for Ask(). */
  template <typename... A>
  Result operator()(A&&... args) const {
    return AskWith(MakeArgs(std::forward<A>(args)...));
  }

  Result AskWith(Args args) const { return actor_->Receive(std::move(args)); }

  /**
   * @brief Ask() and extract a T from the result.
   *
   * Fails with kBadResultType when the result holds another type.
   */
  template <typename T, typename... A>
  expected<T, ServiceFault> AskAs(A&&... args) const {
    Result r = Ask(std::forward<A>(args)...);
    if (!r.has_value()) {
      return expected<T, ServiceFault>::error(std::move(r).get_error());
    }
    const T* typed = std::any_cast<T>(&r.value());
    if (typed == nullptr) {
      return expected<T, ServiceFault>::error(
          ServiceError::kBadResultType,
          "result of service '" + Key() + "' does not hold the requested type");
    }
    return expected<T, ServiceFault>::success(*typed);
  }

  /** @brief Terminate the actor thread (see ServiceActor::Shutdown). */
  void Shutdown() const noexcept { actor_->Shutdown(); }
  bool IsShutdown() const noexcept { return actor_->IsShutdown(); }

  uint32_t PendingMessages() const noexcept {
    return actor_->PendingMessages();
  }
  uint32_t TimeoutMs() const noexcept { return actor_->TimeoutMs(); }

 private:
  static expected<void, ServiceFault> ToVoid(Result r) {
    if (r.has_value()) {
      return expected<void, ServiceFault>::success();
    }
    return expected<void, ServiceFault>::error(std::move(r).get_error());
  }

  std::shared_ptr<ServiceActor> actor_;
};

/** @brief Build a service from @p spec and start its processing thread. */
inline ServiceHandle CreateService(ServiceSpec spec = ServiceSpec()) {
  return ServiceHandle(std::make_shared<ServiceActor>(std::move(spec)));
}

}  // namespace recycle

#endif  // RECYCLE_SERVICE_HPP_
