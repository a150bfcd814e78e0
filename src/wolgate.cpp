#include <wolgate/commands.hpp>
#include <wolgate/config.hpp>
#include <wolgate/dispatcher.hpp>
#include <wolgate/registry.hpp>
#include <wolgate/waker.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#include <syslog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>

static std::optional<Registry> load_registry(const Config& config) {
    auto loaded = Registry::load(config.devices);
    if (auto err = std::get_if<ConfigLoadError>(&loaded)) {
        spdlog::error("{}", to_string(*err));
        return std::nullopt;
    }
    return std::get<Registry>(std::move(loaded));
}

static std::optional<WakeDefaults> wake_defaults(const Config& config) {
    auto resolved = resolve_defaults(config);
    if (auto err = std::get_if<std::string>(&resolved)) {
        spdlog::error("{}", *err);
        return std::nullopt;
    }
    return std::get<WakeDefaults>(std::move(resolved));
}

static int wake(const Config& config, const std::string& key) {
    auto defaults = wake_defaults(config);
    if (!defaults) {
        return 1;
    }
    auto registry = load_registry(config);
    if (!registry) {
        return 1;
    }

    RegistryHandle handle{*std::move(registry)};
    UdpTransport transport{std::chrono::milliseconds(config.timeout_ms)};
    Dispatcher dispatcher{transport, DispatchPolicy{config.repeat, std::chrono::milliseconds(config.repeat_interval_ms)}};
    Waker waker{handle, dispatcher, *std::move(defaults)};

    auto result = waker.wake(key);
    if (result.status == WakeStatus::Success) {
        std::cout << describe(result) << '\n';
    } else {
        std::cerr << describe(result) << '\n';
    }
    return exit_code(result.status);
}

static int list(const Config& config) {
    auto defaults = wake_defaults(config);
    if (!defaults) {
        return 1;
    }
    auto registry = load_registry(config);
    if (!registry) {
        return 1;
    }

    for (const auto& row : list_devices(*registry, *defaults)) {
        std::cout << fmt::format("{:<16} {:<24} {:<17} {}\n", row.key, row.display_name, row.mac, row.destination);
    }
    return 0;
}

static int check(const Config& config) {
    auto registry = load_registry(config);
    if (!registry) {
        return 1;
    }

    auto report = check_devices(*registry, config);
    for (const auto& problem : report.problems) {
        spdlog::error("{}", problem);
    }
    if (!report.ok()) {
        return 1;
    }
    spdlog::info("{}: {} device(s) OK", config.devices, report.devices);
    return 0;
}

int wolgate(int argc, const char* const* argv) {
    Config config;
    std::string log_level{"info"};
    std::string log_file;
    bool use_syslog = false;
    std::string key;

    CLI::App app("Wake-on-LAN gateway");
    app.add_option("-l,--log-level", log_level, "Logging level: trace, debug, info, warning, error, off")->capture_default_str();
    app.add_option("--log-file", log_file, "File to write logs to (stdout if not specified)");
    app.add_flag("--syslog", use_syslog, "Write logs to syslog");
    app.add_option("-c,--devices", config.devices, "Device list (key,display_name,hardware_address[,broadcast_address])")->capture_default_str();
    app.add_option("-b,--broadcast", config.broadcast, "Default broadcast address for devices without one")->capture_default_str()->check(CLI::ValidIPV4);
    app.add_option("-i,--interface", config.iface, "Derive the default broadcast address from this interface");
    app.add_option("-p,--port", config.port, "UDP destination port")->capture_default_str()->check(CLI::Range(1, 65535));
    app.add_option("--timeout", config.timeout_ms, "Send timeout in milliseconds")->capture_default_str()->check(CLI::Range(1, std::numeric_limits<int>::max()));
    app.add_option("--repeat", config.repeat, "Number of magic packets to send per wake")->capture_default_str()->check(CLI::Range(1, 100));
    app.add_option("--repeat-interval", config.repeat_interval_ms, "Delay between repeated packets in milliseconds")->capture_default_str()->check(CLI::NonNegativeNumber);
    app.get_option("--broadcast")->excludes("--interface");
    app.get_option("--syslog")->excludes("--log-file");

    auto wake_cmd = app.add_subcommand("wake", "Send a magic packet to a registered device")->fallthrough();
    wake_cmd->add_option("device", key, "Device key from the device list")->required();

    auto list_cmd = app.add_subcommand("list", "List registered devices")->fallthrough();
    auto check_cmd = app.add_subcommand("check", "Validate the device list")->fallthrough();

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    spdlog::init_thread_pool(8192, 1);
    auto lvl = spdlog::level::info;
    if (log_level == "trace") {
        lvl = spdlog::level::trace;
    } else if (log_level == "debug") {
        lvl = spdlog::level::debug;
    } else if (log_level == "info") {
        lvl = spdlog::level::info;
    } else if (log_level == "warning") {
        lvl = spdlog::level::warn;
    } else if (log_level == "error") {
        lvl = spdlog::level::err;
    } else if (log_level == "off") {
        lvl = spdlog::level::off;
    }
    if (use_syslog) {
        auto logger = spdlog::create_async<spdlog::sinks::syslog_sink_mt>("syslog", "wolgate", LOG_PID, LOG_USER, false);
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    } else if (app.count("--log-file") > 0) {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("logfile", log_file);
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    } else {
        auto logger = spdlog::create_async<spdlog::sinks::stdout_color_sink_mt>("console");
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    }

    if (app.got_subcommand(wake_cmd)) {
        return wake(config, key);
    } else if (app.got_subcommand(list_cmd)) {
        return list(config);
    } else if (app.got_subcommand(check_cmd)) {
        return check(config);
    }
    spdlog::error("unknown command");
    return 1;
}

int main(int argc, char** argv) {
    int rc = 1;
    try {
        rc = wolgate(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
    }
    spdlog::shutdown();
    return rc;
}
