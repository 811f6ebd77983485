#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "config.hpp"
#include "core/handlers.hpp"
#include "core/transport/framed_stdio.hpp"
#include "rulekit.pb.h"

static void set_binary_mode_stdio() {
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif
}

static void log_err(const std::string &msg) {
  std::cerr << "rulekit-provider: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: rulekit-provider --config <path/to/config.yaml> "
          "[--workers <n>] [--check]");
}

int main(int argc, char **argv) {
  std::optional<std::string> config_path;
  std::optional<int> workers_override;
  bool check_only = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      try {
        workers_override = std::stoi(argv[++i]);
      } catch (const std::exception &) {
        log_err("invalid --workers value");
        return 1;
      }
    } else if (arg == "--check") {
      check_only = true;
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

  handlers::ProviderState state;
  try {
    log_err("loading configuration from: " + *config_path);
    const auto config = rulekit_provider::load_config(*config_path);

    state.provider_name = config.provider_name.value_or("rulekit-provider");
    state.workers = config.workers;
    state.builder_system_prompt = config.builder_system_prompt;
    state.rules = rulekit_provider::build_rule_set(config);

    if (workers_override) {
      if (*workers_override < static_cast<int>(rulekit_provider::kMinWorkers) ||
          *workers_override > static_cast<int>(rulekit_provider::kMaxWorkers)) {
        throw std::runtime_error("--workers out of range");
      }
      state.workers = static_cast<std::size_t>(*workers_override);
    }

    log_err("loaded " + std::to_string(state.rules.size()) + " rules (" +
            std::to_string(state.rules.ordered().size()) + " enabled), workers=" +
            std::to_string(state.workers));
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to load rules: " + std::string(e.what()));
    return 1;
  }

  if (check_only) {
    for (const auto *rule : state.rules.ordered()) {
      log_err("  rule '" + rule->id + "' priority=" +
              std::to_string(rule->priority));
    }
    log_err("configuration OK");
    return 0;
  }

  set_binary_mode_stdio();
  log_err("starting (transport=stdio+uint32_le)");

  std::vector<uint8_t> frame;
  std::string io_err;

  while (true) {
    frame.clear();
    if (!transport::read_frame(std::cin, frame, io_err)) {
      if (io_err.empty()) {
        log_err("EOF on stdin; exiting cleanly");
        return 0;
      }
      log_err("read_frame error: " + io_err);
      return 2;
    }

    rulekit::v1::Request req;
    if (!req.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
      log_err("failed to parse Request protobuf");
      return 3;
    }

    rulekit::v1::Response resp;
    handlers::dispatch(state, req, resp);

    std::string resp_bytes;
    if (!resp.SerializeToString(&resp_bytes)) {
      log_err("failed to serialize Response protobuf");
      return 4;
    }

    if (!transport::write_frame(
            std::cout, reinterpret_cast<const uint8_t *>(resp_bytes.data()),
            resp_bytes.size(), io_err)) {
      log_err("write_frame error: " + io_err);
      return 5;
    }
  }
}
