#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "audit/audit_sink.hpp"
#include "config.hpp"
#include "core/errors.hpp"
#include "engine/rule_engine.hpp"
#include "hub/sim_hub.hpp"
#include "rules/rule_coordinator.hpp"
#include "rules/yaml_script_engine.hpp"
#include "scenes/scene_manager.hpp"
#include "timing/thread_timer_service.hpp"
#include "transport/framed_stdio.hpp"
#include "transport/proto_codec.hpp"

static void set_binary_mode_stdio() {
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif
}

static void log_err(const std::string &msg) {
  std::cerr << "hub-rules: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: hub-rules --config <path/to/config.yaml>");
}

static std::unique_ptr<rules_audit::AuditSink>
create_audit_sink(hub_rules::AuditSinkKind kind) {
  switch (kind) {
  case hub_rules::AuditSinkKind::Stderr:
    log_err("audit sink: stderr");
    return std::make_unique<rules_audit::StreamAuditSink>();
  case hub_rules::AuditSinkKind::None:
    break;
  }
  return std::make_unique<rules_audit::NullAuditSink>();
}

int main(int argc, char **argv) {
  std::optional<std::string> config_path;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      log_err("unknown argument: " + arg);
      print_usage();
      return 1;
    }
  }

  if (!config_path) {
    log_err("FATAL: --config argument is required");
    print_usage();
    return 1;
  }

  hub_rules::HubConfig config;
  try {
    log_err("loading configuration from: " + *config_path);
    config = hub_rules::load_config(*config_path);
  } catch (const hub_rules::ConfigError &e) {
    log_err(std::string("FATAL: ") + e.what());
    return 1;
  }

  // Declaration order is teardown order in reverse: timers outlive the
  // engine, the engine outlives the coordinator.
  rules_timing::ThreadTimerService timers;
  rules_hub::SimHub hub;
  rules_scenes::SceneManager scenes(hub);
  rules_engine::RuleEngine engine(timers);
  std::unique_ptr<rules_audit::AuditSink> audit =
      create_audit_sink(config.audit_sink);
  transport::FrameWriter writer(std::cout);
  rules_exec::YamlScriptEngine scripts;

  try {
    for (const auto &device : config.devices) {
      hub.add_device(device);
    }
    for (const auto &scene : config.scenes) {
      scenes.create_scene(scene);
    }
  } catch (const hub_rules::Error &e) {
    log_err(std::string("FATAL: ") + e.what());
    return 1;
  }
  log_err("initialized " + std::to_string(config.devices.size()) +
          " devices and " + std::to_string(config.scenes.size()) + " scenes");

  hub.set_event_listener([&engine](const hub_rules::DeviceEvent &event) {
    engine.on_device_event(event);
  });
  hub.set_command_listener([&writer](const hub_rules::ExecutionContext &ctx,
                                     const hub_rules::DeviceId &device_id,
                                     const std::string &command,
                                     const hub_rules::ValueList &args) {
    std::string err;
    if (!writer.write(transport::encode_command(ctx, device_id, command, args,
                                                hub_rules::Clock::now()),
                      err)) {
      log_err("write_frame error: " + err);
    }
  });

  timers.start();
  audit->start();

  rules_exec::RuleCoordinator coordinator(
      rules_exec::RuleServices{engine, hub, scenes, timers, *audit}, scripts);

  auto shutdown = [&]() {
    coordinator.shutdown();
    engine.clear();
    timers.stop();
    audit->stop();
  };

  try {
    for (const auto &rule : config.rules) {
      coordinator.install_rule(rule);
    }
  } catch (const hub_rules::Error &e) {
    log_err(std::string("FATAL: ") + e.what());
    shutdown();
    return 1;
  }
  log_err("installed " + std::to_string(config.rules.size()) + " rules");

  set_binary_mode_stdio();
  log_err("starting (transport=stdio+uint32_le)");

  std::vector<uint8_t> frame;
  std::string io_err;

  while (true) {
    const transport::ReadStatus status =
        transport::read_frame(std::cin, frame, io_err);
    if (status == transport::ReadStatus::Eof) {
      log_err("EOF on stdin; exiting cleanly");
      shutdown();
      return 0;
    }
    if (status == transport::ReadStatus::Error) {
      log_err("read_frame error: " + io_err);
      shutdown();
      return 2;
    }

    transport::pb::HubFrame msg;
    if (!transport::parse_hub_frame(frame, msg)) {
      log_err("failed to parse HubFrame protobuf");
      shutdown();
      return 3;
    }
    if (!msg.has_event()) {
      log_err("HubFrame without payload");
      shutdown();
      return 3;
    }

    hub_rules::DeviceEvent event;
    try {
      event = transport::decode_event(msg.event(), hub_rules::Clock::now());
    } catch (const std::invalid_argument &e) {
      log_err(std::string("invalid device event: ") + e.what());
      shutdown();
      return 3;
    }
    hub.apply_event(event);

    if (writer.failed()) {
      log_err("stdout closed; exiting");
      shutdown();
      return 4;
    }
  }
}
