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
 * @file service_map.hpp
 * @brief Aggregate service: a named set of child services started, stopped
 *        and addressed as one.
 *
 * A service map is itself a service (CreateServiceMap returns a
 * ServiceHandle):
 *   - start: builds one child actor per ServiceSpec and starts them all
 *            concurrently with the same (mapped) config. If any child
 *            fails, every child is stopped again before it is released and
 *            the map stays stopped.
 *   - stop:  stops every child concurrently and releases them; child
 *            failures are logged and ignored.
 *   - ask:   the first argument names the child, the rest are forwarded to
 *            it and its result is returned unchanged.
 *
 * @code
 *   recycle::ServiceMapSpec spec;
 *   spec.services = {{"db", db_spec}, {"cache", cache_spec}};
 *   auto app = recycle::CreateServiceMap(spec);
 *   app.Start(config);
 *   auto row = app.Ask(std::string("db"), query);
 * @endcode
 */

#ifndef RECYCLE_SERVICE_MAP_HPP_
#define RECYCLE_SERVICE_MAP_HPP_

#include "recycle/log.hpp"
#include "recycle/message.hpp"
#include "recycle/service.hpp"
#include "recycle/vocabulary.hpp"

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace recycle {

/// Child blueprints of a service map, ordered by name.
using ServiceSpecMap = std::map<std::string, ServiceSpec>;

/// Running children of a started service map, ordered by name.
using ServiceMap = std::map<std::string, ServiceHandle>;

namespace detail {

/**
 * @brief Run fn(0) .. fn(n-1) on one thread each and wait for all.
 *
 * If a thread cannot be spawned, the threads already running are joined
 * before the error propagates.
 */
inline void RunConcurrently(size_t n, const std::function<void(size_t)>& fn) {
  std::vector<std::thread> threads;
  threads.reserve(n);
  try {
    for (size_t i = 0; i < n; ++i) {
      threads.emplace_back(fn, i);
    }
  } catch (...) {
    for (std::thread& t : threads) {
      t.join();
    }
    throw;
  }
  for (std::thread& t : threads) {
    t.join();
  }
}

inline const std::string* ChildKeyOf(const Value& arg, std::string& storage) {
  if (const std::string* s = std::any_cast<std::string>(&arg)) {
    return s;
  }
  if (const char* const* c = std::any_cast<const char*>(&arg)) {
    if (*c == nullptr) return nullptr;
    storage = *c;
    return &storage;
  }
  if (const char* const* c = std::any_cast<char*>(&arg)) {
    if (*c == nullptr) return nullptr;
    storage = *c;
    return &storage;
  }
  return nullptr;
}

/**
 * @brief start/stop/receive of a service map.
 *
 * Every start builds fresh child actors from the blueprints; the running
 * children are the map's instance and are released by stop.
 */
class ServiceMapFunctions final {
 public:
  ServiceMapFunctions(std::string key, ServiceSpecMap specs)
      : key_(std::move(key)), specs_(std::move(specs)) {}

  Value Start(const Value& config) const {
    std::vector<std::pair<std::string, ServiceHandle>> children;
    children.reserve(specs_.size());
    for (const auto& kv : specs_) {
      ServiceSpec spec = kv.second;
      if (spec.key.empty()) spec.key = kv.first;
      children.emplace_back(kv.first, CreateService(std::move(spec)));
    }

    const size_t n = children.size();
    std::vector<expected<void, ServiceFault>> results(
        n, expected<void, ServiceFault>::success());
    RunConcurrently(n, [&children, &config, &results](size_t i) {
      results[i] = children[i].second.Start(config);
    });

    size_t first_failure = n;
    for (size_t i = 0; i < n; ++i) {
      if (!results[i].has_value()) {
        first_failure = i;
        break;
      }
    }
    if (first_failure == n) {
      RECYCLE_LOG_DEBUG("ServiceMap", "%s: %u child service(s) started",
                        key_.c_str(), static_cast<uint32_t>(n));
      return Value(ServiceMap(children.begin(), children.end()));
    }

    const std::string& child = children[first_failure].first;
    const ServiceFault& fault = results[first_failure].get_error();
    RECYCLE_LOG_WARN("ServiceMap", "%s: child '%s' failed to start (%s), "
                     "rolling back", key_.c_str(), child.c_str(),
                     fault.ToString().c_str());
    // Every child gets a stop request: a child whose start timed out may
    // still come up, and its queued stop then runs before release.
    RunConcurrently(n, [this, &children](size_t i) {
      StopChild(children[i].first, children[i].second);
    });
    throw ServiceException(fault.code, child + ": " + fault.detail);
  }

  Value Stop(const Value& instance) const {
    const ServiceMap* running = std::any_cast<ServiceMap>(&instance);
    if (running != nullptr) {
      std::vector<const ServiceMap::value_type*> children;
      children.reserve(running->size());
      for (const auto& kv : *running) {
        children.push_back(&kv);
      }
      RunConcurrently(children.size(), [this, &children](size_t i) {
        StopChild(children[i]->first, children[i]->second);
      });
    }
    RECYCLE_LOG_DEBUG("ServiceMap", "%s: child services stopped",
                      key_.c_str());
    return Value();
  }

  Value Receive(const Value& instance, const Args& args) const {
    if (args.empty()) {
      throw ServiceException(ServiceError::kServiceNotFound,
                             "service map '" + key_ +
                                 "' needs a child service name");
    }
    std::string storage;
    const std::string* name = ChildKeyOf(args.front(), storage);
    if (name == nullptr) {
      throw ServiceException(ServiceError::kServiceNotFound,
                             "message sent to service map '" + key_ +
                                 "' without a string child service name");
    }
    const ServiceHandle* child = nullptr;
    if (const ServiceMap* running = std::any_cast<ServiceMap>(&instance)) {
      auto it = running->find(*name);
      if (it != running->end()) child = &it->second;
    }
    if (child == nullptr) {
      throw ServiceException(ServiceError::kServiceNotFound,
                             "message sent to service '" + *name +
                                 "' not found in map '" + key_ + "'");
    }
    Result r = child->AskWith(Args(args.begin() + 1, args.end()));
    if (!r.has_value()) {
      throw ServiceException(std::move(r).get_error());
    }
    return std::move(r).value();
  }

 private:
  void StopChild(const std::string& name, const ServiceHandle& child) const {
    auto stopped = child.Stop();
    if (!stopped.has_value()) {
      RECYCLE_LOG_WARN("ServiceMap", "%s: ignoring stop failure of '%s': %s",
                       key_.c_str(), name.c_str(),
                       stopped.get_error().ToString().c_str());
    }
  }

  const std::string key_;
  const ServiceSpecMap specs_;
};

}  // namespace detail

/**
 * @brief Blueprint of a service map.
 *
 * key defaults to "service-map-<N>"; map_config, timeout_ms and
 * inbox_capacity apply to the map's own actor.
 */
struct ServiceMapSpec {
  std::string key;
  MapConfigFn map_config;
  ServiceSpecMap services;
  uint32_t timeout_ms{kDefaultTimeoutMs};
  uint32_t inbox_capacity{kDefaultInboxCapacity};

  /** @brief The plain ServiceSpec implementing this map. */
  ServiceSpec AsServiceSpec() const {
    ServiceSpec spec;
    spec.key = key.empty() ? detail::GenerateKey("service-map-") : key;
    spec.map_config = map_config;
    spec.timeout_ms = timeout_ms;
    spec.inbox_capacity = inbox_capacity;

    auto fns =
        std::make_shared<const detail::ServiceMapFunctions>(spec.key, services);
    spec.start = [fns](const Value& config) { return fns->Start(config); };
    spec.stop = [fns](const Value& instance) { return fns->Stop(instance); };
    spec.receive = [fns](const Value& instance, const Args& args) {
      return fns->Receive(instance, args);
    };
    return spec;
  }
};

/** @brief Build and launch an aggregate service over @p spec.services. */
inline ServiceHandle CreateServiceMap(const ServiceMapSpec& spec) {
  return CreateService(spec.AsServiceSpec());
}

}  // namespace recycle

#endif  // RECYCLE_SERVICE_MAP_HPP_
