#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "dashwire.hpp"
#include "common/cli.hpp"

using namespace dashwire;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

namespace {

void print_stats(const history::Stats& stats) {
    std::cout << "\n=== History ===\n"
              << "Events   : " << stats.total_count << "\n";
    if (stats.time_range) {
        std::cout << "Range    : " << stats.time_range->earliest << " .. " << stats.time_range->latest << " ms\n";
    }
    std::cout << "By type  :\n";
    for (const auto& [type, n] : stats.by_type) {
        std::cout << "  " << type << " = " << n << "\n";
    }
    std::cout << "By channel:\n";
    for (const auto& [channel, n] : stats.by_channel) {
        std::cout << "  " << channel << " = " << n << "\n";
    }
}

bool export_history(const history::EventBuffer& buffer, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        DW_ERROR("[CLIENT] Cannot open export file: " << path);
        return false;
    }
    out << buffer.to_json();
    if (!out) {
        DW_ERROR("[CLIENT] Failed writing export file: " << path);
        return false;
    }
    DW_INFO("[CLIENT] Exported " << buffer.size() << " events to " << path);
    return true;
}

} // namespace

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = tools::cli::configure(argc, argv,
        "dashwire-tail - follow a dashboard event stream\n"
        "Subscribes to the given channels and prints every batch of events.\n");

    params.dump("=== dashwire-tail ===", std::cout);
    std::cout << "Press Ctrl+C to exit\n\n";

    std::signal(SIGINT, on_signal);

    // -------------------------------------------------------------
    // Client setup
    // -------------------------------------------------------------
    Client client(params.client_config());

    auto status_sub = client.on_status_change([](transport::State s) {
        DW_INFO("[CLIENT] Status -> " << transport::to_string(s));
    });

    client.on_batch([](const event::Batch& batch) {
        std::cout << " -> " << batch.id << " (" << batch.event_count() << " events)\n";
        for (const auto& ev : batch.events) {
            std::cout << "    [" << ev.type << "] "
                      << history::effective_channel(ev) << " " << ev.payload << "\n";
        }
    });

    if (!client.config().aggregation.enabled) {
        client.on_message([](const protocol::RawFrame& frame) {
            std::cout << " -> " << protocol::to_json(frame) << "\n";
        });
    }

    for (const auto& channel : params.channels) {
        client.subscribe(channel);
    }

    if (const auto err = client.connect(); err != transport::Error::None) {
        DW_ERROR("[CLIENT] Connect failed: " << transport::to_string(err));
        return EXIT_FAILURE;
    }

    // Main polling loop, also leaves once retries are exhausted
    client.run_while([&] {
        return running.load() && client.status() != transport::State::Error;
    }, std::chrono::milliseconds{5});

    if (client.status() == transport::State::Error) {
        DW_ERROR("[CLIENT] Giving up: " << transport::to_string(client.last_error()));
    }

    // Ctrl+C received
    client.flush();
    print_stats(client.history().get_stats());

    int rc = EXIT_SUCCESS;
    if (!params.export_path.empty() && !export_history(client.history(), params.export_path)) {
        rc = EXIT_FAILURE;
    }

    client.dispose();
    std::cout << "=== Done ===\n";
    return rc;
}
