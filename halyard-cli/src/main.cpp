#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Our library and UI helpers
#include "ui_helpers.h"
#include <libhy/config.h>
#include <libhy/installed_view.h>
#include <libhy/logging.h>
#include <libhy/operation_controller.h>
#include <libhy/package_state_store.h>
#include <libhy/progress_aggregator.h>
#include <libhy/snapd_client.h>

namespace {

    const char* const DEFAULT_CONFIG_PATH = "/etc/halyard/config.yaml";

    // Everything one invocation talks to, wired in dependency order.
    struct Session {
        hy::SnapdClient client;
        hy::InstalledSnapsView installed;
        hy::PackageStateStore store;

        explicit Session(const hy::Config& config)
            : client(hy::SnapdClientOptions{config.socket_path, config.poll_interval}),
              installed(client),
              store(client, installed, hy::StoreOptions{config.default_channel}) {}
    };

}

void print_usage() {
    ui::error("Invalid usage.");
    std::cerr << "Usage: halyard [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  --config <file>     Read settings from <file> (default: $HALYARD_CONFIG or "
              << DEFAULT_CONFIG_PATH << ")\n"
              << "  --channel <chan>    Channel to install or refresh from\n"
              << "  --verbose           Print debug output\n\n"
              << "Commands:\n"
              << "  info <snap>         Show local and store information\n"
              << "  install <snap>      Install a snap\n"
              << "  refresh <snap>      Refresh a snap\n"
              << "  remove <snap>       Remove a snap\n"
              << "  cancel <snap>       Abort the change running for a snap\n"
              << "  progress <id>...    Follow the combined progress of changes\n";
}

std::string error_to_string(hy::ErrorKind kind) {
    switch (kind) {
        case hy::ErrorKind::NotInstalled: return "The snap is not installed.";
        case hy::ErrorKind::PackageNotFound: return "No such snap, neither installed nor in the store.";
        case hy::ErrorKind::Precondition: return "The operation is not possible right now.";
        case hy::ErrorKind::Daemon: return "snapd reported an error.";
        case hy::ErrorKind::ChangeFailed: return "The change failed.";
        case hy::ErrorKind::Cancelled: return "The operation was cancelled.";
        default: return "An unknown error occurred.";
    }
}

int exit_code_for(hy::ErrorKind kind) {
    switch (kind) {
        case hy::ErrorKind::Precondition: return 2;
        case hy::ErrorKind::NotInstalled:
        case hy::ErrorKind::PackageNotFound: return 3;
        case hy::ErrorKind::ChangeFailed: return 4;
        case hy::ErrorKind::Cancelled: return 5;
        default: return 1;
    }
}

int report(const hy::Error& error) {
    ui::error(error_to_string(error.kind) + " " + error.message);
    return exit_code_for(error.kind);
}

// Pumps the client until `future` settles.
template<typename T>
std::expected<void, hy::Error> wait_for(hy::SnapdClient& client, const hy::Future<T>& future) {
    client.run_until([&future]() { return future.is_ready(); });
    if (!future.is_ready()) {
        return std::unexpected(hy::Error::daemon("snapd stopped answering"));
    }
    const auto& result = future.result();
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

std::optional<hy::Error> load_controller(Session& session, hy::OperationController& controller) {
    auto installed = wait_for(session.client, session.installed.loaded());
    if (!installed) {
        ui::warning("Could not list installed snaps: " + installed.error().message);
    }
    auto loaded = wait_for(session.client, controller.loaded());
    if (!loaded) {
        return loaded.error();
    }
    return std::nullopt;
}

// --- COMMAND HANDLERS ---

int do_info(Session& session, const std::string& name) {
    ui::action("Querying snapd for '" + name + "'...");
    hy::OperationController controller(session.client, session.store, session.installed, name);
    if (auto error = load_controller(session, controller)) {
        return report(*error);
    }
    ui::print_record(*controller.record());
    return 0;
}

int do_change(Session& session, const std::string& command, const std::string& name,
              const std::optional<std::string>& channel) {
    ui::action("Loading '" + name + "'...");
    hy::OperationController controller(session.client, session.store, session.installed, name);
    if (auto error = load_controller(session, controller)) {
        return report(*error);
    }

    if (channel) {
        auto selected = controller.select_channel(*channel);
        if (!selected.result()) {
            return report(selected.result().error());
        }
    }

    // Follows the change once snapd has named it.
    hy::ProgressAggregator aggregator(session.client);
    std::shared_ptr<hy::ProgressStream> stream;
    hy::Subscription samples;
    auto follow = controller.observe([&](const hy::PackageState::Value& value) {
        const hy::PackageRecord* record = value.value_or_null();
        if (stream || !record || !record->active_change_id) {
            return;
        }
        stream = aggregator.observe({*record->active_change_id});
        samples = stream->subscribe([&name](double mean) {
            hy::log::progress(name + " " + ui::percent(mean));
        });
    });

    hy::Future<void> operation;
    if (command == "install") {
        ui::action("Installing '" + name + "' from " + controller.record()->selected_channel + "...");
        operation = controller.install();
    } else if (command == "refresh") {
        ui::action("Refreshing '" + name + "' from " + controller.record()->selected_channel + "...");
        operation = controller.refresh();
    } else {
        ui::action("Removing '" + name + "'...");
        operation = controller.remove();
    }

    auto outcome = wait_for(session.client, operation);
    follow.cancel();
    samples.cancel();
    if (!outcome) {
        if (stream) std::cout << std::endl;
        return report(outcome.error());
    }
    if (stream) hy::log::progress_ok();
    ui::header(command + " of '" + name + "' completed successfully.");
    return 0;
}

int do_cancel(Session& session, const std::string& name) {
    ui::action("Loading '" + name + "'...");
    hy::OperationController controller(session.client, session.store, session.installed, name);
    if (auto error = load_controller(session, controller)) {
        return report(*error);
    }
    const auto active = controller.state().active_change_id();
    if (!active) {
        ui::header("Nothing to cancel.");
        return 0;
    }

    ui::action("Aborting change " + *active + "...");
    auto outcome = wait_for(session.client, controller.cancel());
    if (!outcome) {
        return report(outcome.error());
    }
    ui::header("Change " + *active + " aborted.");
    return 0;
}

int do_progress(Session& session, const std::vector<std::string>& change_ids) {
    ui::action("Following " + std::to_string(change_ids.size()) + " change(s)...");
    hy::ProgressAggregator aggregator(session.client);
    auto stream = aggregator.observe(change_ids);
    auto samples = stream->subscribe([](double mean) { hy::log::progress("overall " + ui::percent(mean)); });

    // Terminal snapshot or stream error, per change.
    std::map<std::string, hy::ChangeEvent> outcomes;
    std::map<std::string, hy::Subscription> watches;
    for (const auto& id : change_ids) {
        watches.emplace(id, session.client.watch_change(id, [&outcomes, &watches, id](const hy::ChangeEvent& event) {
            if (outcomes.contains(id) || (event && !event->ready)) {
                return;
            }
            outcomes.emplace(id, event);
            auto it = watches.find(id);
            if (it != watches.end()) it->second.cancel();
        }));
    }

    session.client.run_until([&]() { return outcomes.size() == watches.size(); });
    samples.cancel();
    std::cout << std::endl;

    int result = 0;
    for (const auto& [id, watch] : watches) {
        auto it = outcomes.find(id);
        if (it == outcomes.end()) {
            ui::warning("Lost track of change " + id);
            result = 1;
        } else if (!it->second) {
            ui::error("Change " + id + ": " + it->second.error().message);
            result = exit_code_for(it->second.error().kind);
        } else if (it->second->error) {
            ui::error("Change " + id + " failed: " + *it->second->error);
            result = exit_code_for(hy::ErrorKind::ChangeFailed);
        } else {
            ui::item("Change " + id + ": " + it->second->summary + " (" + it->second->status + ")");
        }
    }
    return result;
}

// --- Main Function ---

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path = DEFAULT_CONFIG_PATH;
    if (const char* env = std::getenv("HALYARD_CONFIG")) {
        config_path = env;
    }
    std::optional<std::string> channel;
    bool verbose_flag = false;

    std::vector<std::string> main_args;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config") {
            if (i + 1 >= args.size()) {
                ui::error("--config requires a file argument.");
                return 1;
            }
            config_path = args[++i];
        } else if (arg == "--channel") {
            if (i + 1 >= args.size()) {
                ui::error("--channel requires a channel argument.");
                return 1;
            }
            channel = args[++i];
        } else if (arg == "--verbose") {
            verbose_flag = true;
        } else {
            main_args.push_back(arg);
        }
    }

    if (main_args.empty()) {
        print_usage();
        return 1;
    }

    auto config = hy::Config::load(config_path);
    if (!config) {
        ui::error("Invalid configuration in " + config_path + " (see details above)");
        return 1;
    }
    hy::log::verbose() = verbose_flag || config->verbose;

    const std::string& command = main_args[0];
    std::vector<std::string> operands(main_args.begin() + 1, main_args.end());

    try {
        Session session(*config);

        // Command dispatch.
        if (command == "info") {
            if (operands.size() != 1) { print_usage(); return 1; }
            return do_info(session, operands[0]);
        } else if (command == "install" || command == "refresh") {
            if (operands.size() != 1) { print_usage(); return 1; }
            return do_change(session, command, operands[0], channel);
        } else if (command == "remove") {
            if (operands.size() != 1) { print_usage(); return 1; }
            return do_change(session, command, operands[0], std::nullopt);
        } else if (command == "cancel") {
            if (operands.size() != 1) { print_usage(); return 1; }
            return do_cancel(session, operands[0]);
        } else if (command == "progress") {
            if (operands.empty()) { print_usage(); return 1; }
            return do_progress(session, operands);
        } else {
            print_usage();
            return 1;
        }
    } catch (const hy::OperationException& e) {
        return report(e.get_error());
    }

    return 0;
}
