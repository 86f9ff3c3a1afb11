#include "strata/app/options.hpp"
#include "strata/core/platform.hpp"
#include "strata/events/components.hpp"
#include "strata/events/event_bus.hpp"
#include "strata/service/backup_service.hpp"
#include "strata/service/restore_service.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested.store(true);
}

int run_watch(const strata::app::Options& options, strata::events::EventBus& bus) {
    strata::service::BackupSettings settings;
    settings.watch_root = options.watch_root;
    settings.backup_root = options.backup_root;
    settings.interval = std::chrono::seconds(options.refresh_seconds);
    settings.segment_limit = options.segment_limit;

    strata::service::BackupService service(settings, bus);
    auto prepared = service.prepare();
    if (prepared.is_error()) {
        spdlog::error("{}", strata::to_string(prepared.error()));
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    service.run(g_stop_requested);
    return 0;
}

int run_restore(const strata::app::Options& options, strata::events::EventBus& bus) {
    strata::service::RestoreService service(bus);

    strata::journal::RestoreOptions restore_options;
    restore_options.until = options.until;

    auto result = service.restore(options.backup_root, options.restore_root, restore_options);
    if (result.is_error()) {
        spdlog::error("Restore failed: {}", strata::to_string(result.error()));
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "strata";

    auto parsed = strata::app::parse_options(argc, argv);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error().message);
        std::cout << "\n" << strata::app::usage(program);
        return 1;
    }

    const auto& options = parsed.value();
    spdlog::set_level(options.log_level);

    if (options.mode == strata::app::Mode::Help) {
        std::cout << strata::app::usage(program);
        return 0;
    }

    spdlog::debug("strata starting on {} (permission bits {}, nanosecond mtime {})",
                  strata::platform::name(), strata::platform::kPreservesPermissionBits,
                  strata::platform::kNanosecondTimes);

    strata::events::EventBus event_bus;
    strata::events::LoggerComponent logger(event_bus);
    strata::events::MetricsComponent metrics(event_bus);

    int status = 0;
    if (options.mode == strata::app::Mode::Watch) {
        status = run_watch(options, event_bus);
        metrics.print_stats();
    } else {
        status = run_restore(options, event_bus);
    }
    return status;
}
