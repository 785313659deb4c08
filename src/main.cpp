#include <netscope/capture/capture_lifecycle.h>
#include <netscope/capture/capture_runner.h>
#include <netscope/capture/log_sink.h>
#include <netscope/core/config.h>
#include <netscope/core/diagnostics.h>
#include <netscope/core/errors.h>
#include <netscope/driver/replay_script.h>
#include <netscope/driver/scripted_browser.h>
#include <netscope/session/session_registry.h>

#include <cstddef>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char kProgramName[] = "netscope_replay";
constexpr const char kVersionString[] = "netscope_replay 0.1.0";

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitBodyFailed = 2;

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " <test-name> <script> [--log-dir=DIR] [--console]\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && argv[1] != nullptr && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return kExitOk;
  }
  if (argc == 2 && argv[1] != nullptr && is_version_flag(argv[1])) {
    std::cout << kVersionString << "\n";
    return kExitOk;
  }

  netscope::core::CaptureSettings settings = netscope::core::load_settings_from_env();

  std::vector<std::string> positional_args;
  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    constexpr std::string_view kLogDirPrefix = "--log-dir=";
    if (starts_with(argument, kLogDirPrefix)) {
      const std::string_view dir = argument.substr(kLogDirPrefix.size());
      if (dir.empty()) {
        std::cerr << "Invalid --log-dir: directory must not be empty\n";
        print_usage(std::cerr);
        return kExitUsage;
      }
      settings.log_directory = std::string(dir);
      settings.sink_kind = netscope::core::SinkKind::File;
      continue;
    }
    if (argument == "--console") {
      settings.sink_kind = netscope::core::SinkKind::Console;
      continue;
    }
    if (starts_with(argument, "--")) {
      std::cerr << "Unknown flag '" << argument << "'\n";
      print_usage(std::cerr);
      return kExitUsage;
    }
    positional_args.emplace_back(argument);
  }

  if (positional_args.size() != 2) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  const std::string& test_name = positional_args[0];
  const netscope::driver::ParseResult parsed =
      netscope::driver::load_replay_script(positional_args[1]);
  if (!parsed.ok) {
    std::cerr << parsed.message << "\n";
    return kExitUsage;
  }

  netscope::core::DiagnosticEmitter diagnostics;
  diagnostics.set_min_severity(settings.min_severity);
  diagnostics.add_observer(netscope::core::stderr_observer());

  netscope::driver::ScriptedBrowser browser;
  std::unique_ptr<netscope::capture::LogSink> sink =
      netscope::capture::make_log_sink(settings, diagnostics);
  netscope::session::SessionRegistry& registry = netscope::session::SessionRegistry::instance();
  netscope::capture::CaptureLifecycle lifecycle(registry, browser, browser, *sink, diagnostics);

  try {
    netscope::capture::run_captured(lifecycle, test_name, [&]() {
      netscope::driver::Session* session = registry.current();
      if (session == nullptr) {
        throw netscope::core::SessionInitError("no current browser session");
      }
      netscope::driver::play_replay(parsed.script, browser, session->id());
    });
  } catch (const netscope::core::SessionInitError& e) {
    std::cerr << "session setup failed: " << e.what() << "\n";
    return kExitUsage;
  } catch (const std::exception& e) {
    std::cerr << "test body failed: " << e.what() << "\n";
    return kExitBodyFailed;
  }

  if (const std::size_t failures = browser.delivery_failures(); failures > 0) {
    diagnostics.emit(netscope::core::Severity::Warning, "replay", "delivery",
                     std::to_string(failures) + " event deliveries failed, last: " +
                         browser.last_delivery_failure());
  }

  if (settings.sink_kind == netscope::core::SinkKind::File) {
    if (const auto report = lifecycle.last_flush()) {
      std::cout << "captured " << report->event_count << " network events for "
                << report->test_name << " in " << settings.log_directory << "\n";
    }
  }
  return kExitOk;
}
