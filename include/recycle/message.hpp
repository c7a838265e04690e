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
 * @file message.hpp
 * @brief Message and result vocabulary exchanged with a service actor.
 *
 * A caller talks to an actor with exactly three messages:
 *
 *   StartMessage   { config, reply }
 *   StopMessage    { reply }
 *   ReceiveMessage { args,   reply }
 *
 * Each message carries its own ReplySlot, a one-shot channel created per
 * call. The actor fills it with one Result (expected<Value, ServiceFault>);
 * the caller waits on it with a deadline and closes it on every exit path.
 * A reply delivered after the caller gave up is dropped by the slot.
 */

#ifndef RECYCLE_MESSAGE_HPP_
#define RECYCLE_MESSAGE_HPP_

#include "recycle/platform.hpp"
#include "recycle/vocabulary.hpp"

#include <any>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace recycle {

/// Dynamically typed config, instance, argument or result.
using Value = std::any;

/// Arguments of a receive call, in call order.
using Args = std::vector<Value>;

// ============================================================================
// Service Error
// ============================================================================

enum class ServiceError : uint8_t {
  kNotRunning,          // Receive sent to a stopped service
  kNoReceiveHandler,    // Service has no receive function
  kPutTimeout,          // Inbox stayed full for the whole timeout
  kTakeTimeout,         // No reply within the timeout
  kServiceNotFound,     // Service map routed to an unknown child
  kUserFunctionFailed,  // User start/stop/receive function threw
  kInboxClosed,         // Service was shut down
  kBadResultType,       // AskAs<T>() result does not hold a T
  kInternalError        // Failure inside the actor loop itself
};

inline const char* ServiceErrorToString(ServiceError err) noexcept {
  switch (err) {
    case ServiceError::kNotRunning:         return "NotRunning";
    case ServiceError::kNoReceiveHandler:   return "NoReceiveHandler";
    case ServiceError::kPutTimeout:         return "PutTimeout";
    case ServiceError::kTakeTimeout:        return "TakeTimeout";
    case ServiceError::kServiceNotFound:    return "ServiceNotFound";
    case ServiceError::kUserFunctionFailed: return "UserFunctionFailed";
    case ServiceError::kInboxClosed:        return "InboxClosed";
    case ServiceError::kBadResultType:      return "BadResultType";
    case ServiceError::kInternalError:      return "InternalError";
  }
  return "Unknown";
}

/**
 * @brief Error code plus human-readable detail carried back to the caller.
 */
struct ServiceFault {
  ServiceError code;
  std::string detail;

  ServiceFault() noexcept : code(ServiceError::kInternalError) {}
  ServiceFault(ServiceError c, std::string d)
      : code(c), detail(std::move(d)) {}

  std::string ToString() const {
    std::string out(ServiceErrorToString(code));
    if (!detail.empty()) {
      out += ": ";
      out += detail;
    }
    return out;
  }
};

/**
 * @brief Exception a user function may throw to fail with a specific code.
 *
 * The actor replies with the carried fault unchanged. Any other exception
 * thrown by a user function is reported as kUserFunctionFailed.
 */
class ServiceException : public std::runtime_error {
 public:
  explicit ServiceException(ServiceFault fault)
      : std::runtime_error(fault.ToString()), fault_(std::move(fault)) {}

  ServiceException(ServiceError code, std::string detail)
      : ServiceException(ServiceFault(code, std::move(detail))) {}

  const ServiceFault& fault() const noexcept { return fault_; }

 private:
  ServiceFault fault_;
};

using Result = expected<Value, ServiceFault>;

inline Result MakeFault(ServiceError code, std::string detail) {
  return Result::error(code, std::move(detail));
}

// ============================================================================
// ReplySlot
// ============================================================================

/**
 * @brief Single-use, single-value channel from the actor back to a caller.
 *
 * Shared between the caller and the queued message so a late reply never
 * touches freed memory. Deliver() succeeds at most once and never after
 * Close().
 */
class ReplySlot final {
 public:
  ReplySlot() noexcept = default;

  ReplySlot(const ReplySlot&) = delete;
  ReplySlot& operator=(const ReplySlot&) = delete;

  /**
   * @brief Store the result and wake the waiting caller.
   * @return false if the slot was already filled or closed; the result is
   *         dropped in that case.
   */
  bool Deliver(Result result) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_ || result_.has_value()) {
        return false;
      }
      result_ = optional<Result>(std::move(result));
    }
    cv_.notify_one();
    return true;
  }

  /**
   * @brief Block until a result arrives, the slot is closed, or the
   *        timeout elapses.
   * @return The delivered result, or an empty optional.
   */
  optional<Result> WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_for(lock, timeout,
                 [this]() { return closed_ || result_.has_value(); });
    if (!result_.has_value()) {
      return {};
    }
    optional<Result> out(std::move(result_));
    result_.reset();
    return out;
  }

  /** @brief Refuse further deliveries and wake any waiter. */
  void Close() noexcept {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool IsClosed() const noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  bool HasResult() const noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    return result_.has_value();
  }

 private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  optional<Result> result_;
  bool closed_ = false;
};

using ReplySlotPtr = std::shared_ptr<ReplySlot>;

/** @brief Closes a reply slot when the calling scope exits. */
class ReplySlotGuard final {
 public:
  explicit ReplySlotGuard(ReplySlotPtr slot) noexcept
      : slot_(std::move(slot)) {}
  ~ReplySlotGuard() {
    if (slot_) slot_->Close();
  }

  ReplySlotGuard(const ReplySlotGuard&) = delete;
  ReplySlotGuard& operator=(const ReplySlotGuard&) = delete;

 private:
  ReplySlotPtr slot_;
};

// ============================================================================
// Messages
// ============================================================================

struct StartMessage {
  Value config;
  ReplySlotPtr reply;
};

struct StopMessage {
  ReplySlotPtr reply;
};

struct ReceiveMessage {
  Args args;
  ReplySlotPtr reply;
};

using Message = std::variant<StartMessage, StopMessage, ReceiveMessage>;

inline const ReplySlotPtr& ReplyOf(const Message& msg) noexcept {
  return std::visit(
      [](const auto& m) -> const ReplySlotPtr& { return m.reply; }, msg);
}

inline const char* MessageName(const Message& msg) noexcept {
  switch (msg.index()) {
    case 0: return "start";
    case 1: return "stop";
    case 2: return "receive";
    default: return "invalid";
  }
}

}  // namespace recycle

#endif  // RECYCLE_MESSAGE_HPP_
