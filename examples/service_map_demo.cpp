// Copyright (c) 2024 liudegui. MIT License.
//
// service_map_demo.cpp -- nested service maps configured from a file.
//
// Usage: service_map_demo [config.ini|config.json|config.yaml]
//
// Builds this tree:
//
//   app
//   +-- storage (service map)
//   |   +-- db
//   |   +-- cache
//   +-- greeter
//
// Each node reads key/timeout_ms/inbox_capacity from the config section of
// the same name; "[log] level" sets the log level. Without a config file (or
// without a config backend compiled in) the defaults are used.

#include "recycle/config.hpp"
#include "recycle/log.hpp"
#include "recycle/service.hpp"
#include "recycle/service_map.hpp"

#include <cstdio>
#include <map>
#include <memory>
#include <string>

// ============================================================================
// Config
// ============================================================================

#if defined(RECYCLE_CONFIG_INI_ENABLED)
using DemoConfig = recycle::Config<recycle::IniBackend>;
#elif defined(RECYCLE_CONFIG_JSON_ENABLED)
using DemoConfig = recycle::Config<recycle::JsonBackend>;
#elif defined(RECYCLE_CONFIG_YAML_ENABLED)
using DemoConfig = recycle::Config<recycle::YamlBackend>;
#else
using DemoConfig = recycle::ConfigStore;
#endif

static void LoadConfig(DemoConfig& cfg, int argc, char** argv) {
#if defined(RECYCLE_CONFIG_INI_ENABLED) || defined(RECYCLE_CONFIG_JSON_ENABLED) || \
    defined(RECYCLE_CONFIG_YAML_ENABLED)
  if (argc > 1) {
    auto r = cfg.LoadFile(argv[1]);
    if (!r.has_value()) {
      RECYCLE_LOG_WARN("Demo", "cannot load %s: %s, using defaults", argv[1],
                       recycle::ConfigErrorToString(r.get_error()));
    }
  }
#else
  (void)cfg;
  if (argc > 1) {
    RECYCLE_LOG_WARN("Demo", "no config backend compiled in, ignoring %s",
                     argv[1]);
  }
#endif
}

template <typename SpecT>
static void Configure(const recycle::ConfigStore& cfg, const char* section,
                      SpecT& spec) {
  auto settings = recycle::LoadServiceSettings(cfg, section);
  if (!settings.has_value()) {
    RECYCLE_LOG_WARN("Demo", "[%s]: %s, using defaults", section,
                     recycle::ConfigErrorToString(settings.get_error()));
    return;
  }
  recycle::ApplyServiceSettings(settings.value(), spec);
}

// ============================================================================
// Services
// ============================================================================

static recycle::ServiceSpec MakeDb(const recycle::ConfigStore& cfg) {
  recycle::ServiceSpec spec;
  spec.key = "db";
  Configure(cfg, "db", spec);
  spec.start = [](const recycle::Value&) {
    return recycle::Value(std::make_shared<std::map<std::string, std::string>>());
  };
  spec.receive = [](const recycle::Value& instance, const recycle::Args& args) {
    auto table =
        std::any_cast<std::shared_ptr<std::map<std::string, std::string>>>(instance);
    const auto& op = std::any_cast<const std::string&>(args.at(0));
    const auto& k = std::any_cast<const std::string&>(args.at(1));
    if (op == "put") {
      (*table)[k] = std::any_cast<const std::string&>(args.at(2));
      return recycle::Value(std::string("OK"));
    }
    auto it = table->find(k);
    if (it == table->end()) {
      throw recycle::ServiceException(recycle::ServiceError::kServiceNotFound,
                                      "no row '" + k + "'");
    }
    return recycle::Value(it->second);
  };
  return spec;
}

static recycle::ServiceSpec MakeCache(const recycle::ConfigStore& cfg) {
  recycle::ServiceSpec spec;
  spec.key = "cache";
  Configure(cfg, "cache", spec);
  spec.receive = [](const recycle::Value&, const recycle::Args&) {
    return recycle::Value(std::string("cache miss"));
  };
  return spec;
}

static recycle::ServiceSpec MakeGreeter(const recycle::ConfigStore& cfg) {
  recycle::ServiceSpec spec;
  spec.key = "greeter";
  Configure(cfg, "greeter", spec);
  spec.map_config = [](const recycle::Value& config) {
    return recycle::Value("Hello, " + std::any_cast<std::string>(config));
  };
  spec.start = [](const recycle::Value& greeting) { return greeting; };
  spec.receive = [](const recycle::Value& instance, const recycle::Args& args) {
    return recycle::Value(std::any_cast<std::string>(instance) + " and " +
                          std::any_cast<std::string>(args.at(0)));
  };
  return spec;
}

static void Show(const char* what, const recycle::Result& r) {
  if (r.has_value()) {
    const auto* s = std::any_cast<std::string>(&r.value());
    std::printf("  %-28s -> %s\n", what, (s != nullptr) ? s->c_str() : "<value>");
  } else {
    std::printf("  %-28s -> %s\n", what, r.get_error().ToString().c_str());
  }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
  recycle::log::Init();

  DemoConfig cfg;
  LoadConfig(cfg, argc, argv);
  if (!recycle::ApplyLogSettings(cfg).has_value()) {
    RECYCLE_LOG_WARN("Demo", "ignoring invalid [log] level");
  }

  recycle::ServiceMapSpec storage;
  storage.key = "storage";
  Configure(cfg, "storage", storage);
  storage.services.emplace("db", MakeDb(cfg));
  storage.services.emplace("cache", MakeCache(cfg));

  recycle::ServiceMapSpec app;
  app.key = "app";
  Configure(cfg, "app", app);
  app.services.emplace("storage", storage.AsServiceSpec());
  app.services.emplace("greeter", MakeGreeter(cfg));

  auto root = recycle::CreateServiceMap(app);
  std::printf("=== service map '%s' ===\n", root.Key().c_str());

  auto started = root.Start(std::string("world"));
  if (!started.has_value()) {
    RECYCLE_LOG_ERROR("Demo", "start failed: %s",
                      started.get_error().ToString().c_str());
    return 1;
  }

  Show("greeter", root.Ask("greeter", std::string("friends")));
  Show("storage/db put", root.Ask("storage", "db", std::string("put"),
                                  std::string("k1"), std::string("v1")));
  Show("storage/db get k1", root.Ask("storage", "db", std::string("get"),
                                     std::string("k1")));
  Show("storage/db get k2", root.Ask("storage", "db", std::string("get"),
                                     std::string("k2")));
  Show("storage/cache", root.Ask("storage", "cache"));
  Show("unknown child", root.Ask("nope"));

  auto stopped = root.Stop();
  if (!stopped.has_value()) {
    RECYCLE_LOG_ERROR("Demo", "stop failed: %s",
                      stopped.get_error().ToString().c_str());
  }
  Show("after stop", root.Ask("greeter", std::string("anyone")));

  recycle::log::Shutdown();
  return 0;
}
