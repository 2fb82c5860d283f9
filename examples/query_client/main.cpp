/// Query client example: runs a FOL query against a Triggerware server,
/// prints its rows in batches, then watches the same query for changes.
/// Usage: ./query_client [host] [port] [watch-seconds]
/// Example: ./query_client localhost 5221 30

#include <triggerware/triggerware.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

int main(int argc, char* argv[]) {
    triggerware::TriggerwareClient::Options opts;
    if (argc > 1) opts.host = argv[1];
    if (argc > 2) opts.port = static_cast<uint16_t>(std::stoi(argv[2]));
    int watch_seconds = argc > 3 ? std::stoi(argv[3]) : 0;
    opts.default_fetch_size = 2;
    opts.call_timeout = std::chrono::seconds(30);
    opts.log_level = spdlog::level::info;

    try {
        spdlog::info("Connecting to {}:{}", opts.host, opts.port);
        triggerware::TriggerwareClient client(opts);

        std::cout << "--- Connectors ---\n";
        for (const auto& group : client.get_rel_data()) {
            std::cout << "  " << group.name << " (" << group.elements.size() << " relations)\n";
        }

        auto query = triggerware::fol_query("((a) s.t. (inflation 1991 1995 a))");
        std::cout << "\n--- " << query.text << " ---\n";
        auto rows = client.execute_query(query);
        while (true) {
            auto batch = rows.pull(2);
            if (batch.empty()) break;
            for (const auto& row : batch) std::cout << "  " << row.dump() << "\n";
        }

        if (watch_seconds > 0) {
            triggerware::PolledQueryControlParameters controls;
            controls.report_initial = "with delta";
            triggerware::PolledQuery watch(
                client, query,
                [](const nlohmann::json& added, const nlohmann::json& deleted) {
                    std::cout << "[delta] +" << added.dump() << " -" << deleted.dump() << "\n";
                },
                std::nullopt, controls, triggerware::PolledQuerySchedule(int64_t{5}),
                [](const triggerware::PollError& e) {
                    spdlog::warn("poll skipped: {}", e.message);
                });
            spdlog::info("Watching {} for {}s", watch.method_name(), watch_seconds);
            std::this_thread::sleep_for(std::chrono::seconds(watch_seconds));
        }

        client.close();
    } catch (const triggerware::TwProtocolError& e) {
        spdlog::error("Server error {}: {}", e.code, e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    return 0;
}
