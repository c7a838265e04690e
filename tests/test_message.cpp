/**
 * @file test_message.cpp
 * @brief Tests for message.hpp: faults, ReplySlot, message variant.
 */

#include "recycle/message.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;

// ============================================================================
// ServiceFault / ServiceException
// ============================================================================

TEST_CASE("ServiceErrorToString names every code", "[message][fault]") {
  REQUIRE(std::strcmp(recycle::ServiceErrorToString(
                          recycle::ServiceError::kNotRunning),
                      "NotRunning") == 0);
  REQUIRE(std::strcmp(recycle::ServiceErrorToString(
                          recycle::ServiceError::kTakeTimeout),
                      "TakeTimeout") == 0);
  REQUIRE(std::strcmp(recycle::ServiceErrorToString(
                          recycle::ServiceError::kServiceNotFound),
                      "ServiceNotFound") == 0);
}

TEST_CASE("ServiceFault ToString", "[message][fault]") {
  recycle::ServiceFault f(recycle::ServiceError::kPutTimeout, "inbox full");
  REQUIRE(f.ToString() == "PutTimeout: inbox full");

  recycle::ServiceFault bare(recycle::ServiceError::kInboxClosed, "");
  REQUIRE(bare.ToString() == "InboxClosed");
}

TEST_CASE("ServiceException carries its fault", "[message][fault]") {
  try {
    throw recycle::ServiceException(recycle::ServiceError::kServiceNotFound,
                                    "no such child");
  } catch (const std::exception& e) {
    REQUIRE(std::string(e.what()) == "ServiceNotFound: no such child");
    const auto* se = dynamic_cast<const recycle::ServiceException*>(&e);
    REQUIRE(se != nullptr);
    REQUIRE(se->fault().code == recycle::ServiceError::kServiceNotFound);
  }
}

TEST_CASE("MakeFault builds an error result", "[message][fault]") {
  recycle::Result r =
      recycle::MakeFault(recycle::ServiceError::kNotRunning, "stopped");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == recycle::ServiceError::kNotRunning);
  REQUIRE(r.get_error().detail == "stopped");
}

// ============================================================================
// ReplySlot
// ============================================================================

TEST_CASE("ReplySlot delivers once", "[message][reply]") {
  recycle::ReplySlot slot;
  REQUIRE(slot.Deliver(recycle::Result::success(std::any(1))));
  REQUIRE(slot.HasResult());
  REQUIRE(!slot.Deliver(recycle::Result::success(std::any(2))));

  auto r = slot.WaitFor(10ms);
  REQUIRE(r.has_value());
  REQUIRE(std::any_cast<int>(r.value().value()) == 1);
}

TEST_CASE("ReplySlot wait times out when empty", "[message][reply]") {
  recycle::ReplySlot slot;
  auto start = std::chrono::steady_clock::now();
  auto r = slot.WaitFor(50ms);
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(!r.has_value());
  REQUIRE(elapsed >= 40ms);
}

TEST_CASE("ReplySlot wakes a waiting thread", "[message][reply]") {
  auto slot = std::make_shared<recycle::ReplySlot>();
  std::thread producer([slot]() {
    std::this_thread::sleep_for(20ms);
    slot->Deliver(recycle::Result::success(std::any(std::string("done"))));
  });
  auto r = slot->WaitFor(2000ms);
  producer.join();
  REQUIRE(r.has_value());
  REQUIRE(std::any_cast<std::string>(r.value().value()) == "done");
}

TEST_CASE("ReplySlot refuses delivery after close", "[message][reply]") {
  auto slot = std::make_shared<recycle::ReplySlot>();
  {
    recycle::ReplySlotGuard guard(slot);
    REQUIRE(!slot->IsClosed());
  }
  REQUIRE(slot->IsClosed());
  REQUIRE(!slot->Deliver(recycle::Result::success(std::any(1))));
  REQUIRE(!slot->HasResult());
}

// ============================================================================
// Message variant
// ============================================================================

TEST_CASE("ReplyOf and MessageName cover every message", "[message][variant]") {
  auto slot = std::make_shared<recycle::ReplySlot>();

  recycle::Message start(recycle::StartMessage{std::any(1), slot});
  recycle::Message stop(recycle::StopMessage{slot});
  recycle::Message receive(recycle::ReceiveMessage{recycle::Args{}, slot});

  REQUIRE(std::strcmp(recycle::MessageName(start), "start") == 0);
  REQUIRE(std::strcmp(recycle::MessageName(stop), "stop") == 0);
  REQUIRE(std::strcmp(recycle::MessageName(receive), "receive") == 0);

  REQUIRE(recycle::ReplyOf(start) == slot);
  REQUIRE(recycle::ReplyOf(stop) == slot);
  REQUIRE(recycle::ReplyOf(receive) == slot);
}
