#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "dashwire/log/logger.hpp"
#include "dashwire/stream/config.hpp"

namespace dashwire::tools::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0) {
            return {};
        }
        if (value.rfind("wss://", 0) == 0) {
            return "wss:// is not supported by the Beast backend, use ws://";
        }
        return "URL must start with ws://";
    },
    "WebSocket URL validator"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        log::Level lvl;
        if (log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace | debug | info | warn | error | fatal";
    },
    "Log level validator"
);

struct Params {
    std::string url                     = "ws://localhost:3001/";
    std::vector<std::string> channels   = {};
    std::string log_level               = "info";
    int max_reconnect                   = 10;
    std::int64_t reconnect_delay_ms     = 1000;
    std::int64_t heartbeat_ms           = 30000;
    std::int64_t batch_interval_ms      = 100;
    std::size_t batch_size              = 50;
    std::size_t capacity                = 1000;
    bool no_aggregation                 = false;
    std::string export_path             = {};

    [[nodiscard]]
    inline stream::ClientConfig client_config() const {
        stream::ClientConfig cfg;
        cfg.transport.url = url;
        cfg.transport.max_reconnect_attempts = max_reconnect;
        cfg.transport.reconnect_delay = reconnect_delay_ms;
        cfg.transport.heartbeat_interval = heartbeat_ms;
        cfg.aggregation.enabled = !no_aggregation;
        cfg.aggregation.batch_interval = batch_interval_ms;
        cfg.aggregation.max_batch_size = batch_size;
        cfg.history_capacity = capacity;
        return cfg;
    }

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  URL         : " << url << "\n" << "  Channels    : ";
        for (const auto& c : channels) {
            os << c << " ";
        }
        os << "\n  Reconnect   : " << max_reconnect << " attempts, base " << reconnect_delay_ms << " ms"
           << "\n  Heartbeat   : " << heartbeat_ms << " ms"
           << "\n  Aggregation : ";
        if (no_aggregation) {
            os << "off";
        } else {
            os << batch_interval_ms << " ms / " << batch_size << " events";
        }
        os << "\n  History     : " << capacity << " events"
           << "\n  Log Level   : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "Dashboard WebSocket endpoint")->check(ws_url_validator)->default_val(params.url);
    app.add_option("-c,--channel", params.channels, "Channel(s) to subscribe, repeatable (e.g. -c agents -c tasks)");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")->check(log_level_validator)->default_val(params.log_level);
    app.add_option("--max-reconnect", params.max_reconnect, "Reconnect attempts before giving up")->check(CLI::NonNegativeNumber)->default_val(params.max_reconnect);
    app.add_option("--reconnect-delay-ms", params.reconnect_delay_ms, "Backoff base delay (ms)")->check(CLI::NonNegativeNumber)->default_val(params.reconnect_delay_ms);
    app.add_option("--heartbeat-ms", params.heartbeat_ms, "Ping interval (ms), 0 disables")->check(CLI::NonNegativeNumber)->default_val(params.heartbeat_ms);
    app.add_option("--batch-interval-ms", params.batch_interval_ms, "Batch window (ms)")->check(CLI::NonNegativeNumber)->default_val(params.batch_interval_ms);
    app.add_option("--batch-size", params.batch_size, "Maximum events per batch")->check(CLI::PositiveNumber)->default_val(params.batch_size);
    app.add_option("--capacity", params.capacity, "History capacity (events)")->check(CLI::PositiveNumber)->default_val(params.capacity);
    app.add_flag("--no-aggregation", params.no_aggregation, "Write events to the history one by one");
    app.add_option("--export", params.export_path, "Write the history as JSON to this file on exit");

    app.footer(
        "Runs until interrupted.\n"
        "Press Ctrl+C to print history statistics and exit."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    (void)log::set_level(params.log_level);
    return params;
}

} // namespace dashwire::tools::cli
