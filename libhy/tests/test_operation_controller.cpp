//
// Created by cv2 on 11/12/25.
//

#include "fake_daemon.h"
#include "libhy/logging.h"
#include "libhy/operation_controller.h"
#include <cassert>
#include <string>

using hy::Confinement;
using hy::testing::FakeDaemon;
using hy::testing::FakeInstalled;
using hy::testing::FakeUpdates;
using hy::testing::change;
using hy::testing::local_snap;
using hy::testing::store_snap;
using hy::testing::task;

// A daemon, its collaborators and a store, torn down in the right order.
struct Fixture {
    FakeDaemon daemon;
    FakeUpdates updates;
    FakeInstalled installed;
    hy::PackageStateStore store{daemon, updates};

    hy::OperationController controller(const std::string& name) {
        return hy::OperationController(daemon, store, installed, name);
    }
};

void test_install_runs_to_completion() {
    hy::log::info("Running test: Install follows its change to the end");
    Fixture f;
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    f.daemon.next_change_id = "42";
    auto controller = f.controller("hello");
    assert(controller.record() && !controller.record()->is_installed());

    auto install = controller.install();
    const auto* call = f.daemon.last("install");
    assert(call && call->target == "hello" && call->channel == "latest/stable" && !call->classic);
    assert(controller.record()->active_change_id == std::optional<std::string>("42"));
    assert(controller.state().phase() == hy::PackageState::Phase::InProgress);
    assert(controller.state().watch_count() == 1);
    assert(!install.is_ready());

    // One change per package.
    auto second = controller.install();
    assert(second.is_ready());
    assert(second.result().error().kind == hy::ErrorKind::Precondition);
    auto removal = controller.remove();
    assert(removal.result().error().kind == hy::ErrorKind::Precondition);
    assert(f.daemon.count("install") == 1);
    assert(f.daemon.count("remove") == 0);

    f.daemon.local["hello"] = local_snap("hello");
    f.daemon.push(change("42", false, std::nullopt, {task(1, 2)}));
    assert(!install.is_ready());
    f.daemon.push(change("42", true, std::nullopt, {task(2, 2)}));

    assert(install.is_ready());
    assert(install.result().has_value());
    assert(!controller.record()->active_change_id);
    assert(controller.record()->is_installed());
    assert(controller.state().phase() == hy::PackageState::Phase::Idle);
    // The finished watcher is dropped right away.
    assert(controller.state().watch_count() == 0);
    // Install does not touch the installed-packages view.
    assert(f.installed.invalidations == 0);

    hy::log::ok("Test Passed: Install follows its change to the end");
}

void test_classic_channel() {
    hy::log::info("Running test: Classic channels install with classic confinement");
    Fixture f;
    f.daemon.local["code"] = local_snap("code", "latest/stable");
    f.daemon.catalog["code"] = store_snap("code", {{"latest/stable", Confinement::Classic},
                                                  {"latest/edge", Confinement::Strict}});
    auto controller = f.controller("code");

    auto refresh = controller.refresh();
    const auto* call = f.daemon.last("refresh");
    assert(call && call->channel == "latest/stable" && call->classic);

    f.daemon.push(change("1", true));
    assert(refresh.result().has_value());

    auto selected = controller.select_channel("latest/edge");
    assert(selected.result().has_value());
    auto again = controller.refresh();
    call = f.daemon.last("refresh");
    assert(call->channel == "latest/edge" && !call->classic);
    f.daemon.push(change("1", true));
    assert(again.result().has_value());

    hy::log::ok("Test Passed: Classic channels install with classic confinement");
}

void test_failed_remove_keeps_view() {
    hy::log::info("Running test: Failed removal");
    Fixture f;
    f.daemon.local["foo"] = local_snap("foo");
    f.daemon.catalog["foo"] = store_snap("foo", {{"latest/stable", Confinement::Strict}});
    f.daemon.next_change_id = "7";
    auto controller = f.controller("foo");

    auto removal = controller.remove();
    assert(controller.record()->active_change_id == std::optional<std::string>("7"));
    f.daemon.push(change("7", true, "boom"));

    assert(removal.is_ready());
    assert(removal.result().error().kind == hy::ErrorKind::ChangeFailed);
    assert(removal.result().error().message == "boom");
    assert(f.installed.invalidations == 0);
    assert(!controller.record()->active_change_id);
    assert(controller.record()->last_change_error);
    assert(controller.record()->last_change_error->message == "boom");
    assert(!controller.state().busy());

    hy::log::ok("Test Passed: Failed removal");
}

void test_successful_remove_invalidates_view() {
    hy::log::info("Running test: Successful removal");
    Fixture f;
    f.daemon.local["foo"] = local_snap("foo");
    f.daemon.catalog["foo"] = store_snap("foo", {{"latest/stable", Confinement::Strict}});
    auto controller = f.controller("foo");

    auto removal = controller.remove();
    const auto* call = f.daemon.last("remove");
    assert(call && call->target == "foo");

    f.daemon.local.erase("foo");
    f.daemon.push(change("1", true));
    assert(removal.result().has_value());
    assert(f.installed.invalidations == 1);
    assert(!controller.record()->is_installed());

    hy::log::ok("Test Passed: Successful removal");
}

void test_rejected_request() {
    hy::log::info("Running test: Daemon rejects the command");
    Fixture f;
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    f.daemon.next_command_error = hy::Error::daemon("access denied", "login-required");
    auto controller = f.controller("hello");

    auto install = controller.install();
    assert(install.is_ready());
    assert(install.result().error().kind == hy::ErrorKind::Daemon);
    assert(install.result().error().daemon_kind == "login-required");
    assert(!controller.state().busy());
    assert(!controller.record()->active_change_id);
    assert(controller.record()->last_change_error->message == "access denied");
    assert(f.daemon.count("watch_change") == 0);

    // The next attempt is allowed.
    auto retry = controller.install();
    assert(!retry.is_ready());
    assert(controller.state().busy());

    hy::log::ok("Test Passed: Daemon rejects the command");
}

void test_preconditions() {
    hy::log::info("Running test: Commands before the catalog is known");
    Fixture f;
    f.daemon.local["core"] = local_snap("core");
    f.daemon.catalog_failures["core"] = hy::Error::daemon("offline");
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    auto offline = f.controller("core");
    auto online = f.controller("hello");

    assert(offline.record() && !offline.record()->has_catalog());
    assert(offline.install().result().error().kind == hy::ErrorKind::Precondition);
    assert(offline.refresh().result().error().kind == hy::ErrorKind::Precondition);
    assert(offline.cancel().result().error().kind == hy::ErrorKind::Precondition);
    assert(offline.select_channel("latest/stable").result().error().kind == hy::ErrorKind::Precondition);

    // Unknown channels are rejected; known ones are a local change.
    const auto calls = f.daemon.calls.size();
    assert(online.select_channel("9.9/edge").result().error().kind == hy::ErrorKind::Precondition);
    assert(online.select_channel("latest/stable").result().has_value());
    assert(f.daemon.calls.size() == calls);

    hy::log::ok("Test Passed: Commands before the catalog is known");
}

void test_cancel_without_change() {
    hy::log::info("Running test: Cancel with nothing running");
    Fixture f;
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    auto controller = f.controller("hello");

    const auto calls = f.daemon.calls.size();
    auto cancel = controller.cancel();
    assert(cancel.is_ready());
    assert(cancel.result().has_value());
    assert(f.daemon.calls.size() == calls);

    hy::log::ok("Test Passed: Cancel with nothing running");
}

void test_abort_flow() {
    hy::log::info("Running test: Aborting a running install");
    Fixture f;
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    f.daemon.next_change_id = "42";
    f.daemon.abort_change_id = "43";
    auto controller = f.controller("hello");

    auto install = controller.install();
    auto cancel = controller.cancel();
    const auto* call = f.daemon.last("abort_change");
    assert(call && call->target == "42");
    assert(controller.state().phase() == hy::PackageState::Phase::Aborting);
    assert(controller.record()->active_change_id == std::optional<std::string>("43"));

    auto twice = controller.cancel();
    assert(twice.result().error().kind == hy::ErrorKind::Precondition);
    assert(f.daemon.count("abort_change") == 1);

    f.daemon.push(change("42", true, "change was aborted"));
    assert(install.result().error().kind == hy::ErrorKind::ChangeFailed);
    // The abort still owns the record.
    assert(controller.record()->active_change_id == std::optional<std::string>("43"));
    assert(!cancel.is_ready());

    const auto lookups = f.daemon.count("get_local_info");
    f.daemon.push(change("43", true));
    assert(cancel.result().has_value());
    assert(!controller.record()->active_change_id);
    assert(controller.state().phase() == hy::PackageState::Phase::Idle);
    // Completing the abort does not rebuild.
    assert(f.daemon.count("get_local_info") == lookups);

    hy::log::ok("Test Passed: Aborting a running install");
}

void test_stream_error_keeps_change_active() {
    hy::log::info("Running test: Stream errors keep the change active");
    Fixture f;
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    auto controller = f.controller("hello");

    auto install = controller.install();
    f.daemon.push_error("1", hy::Error::daemon("timeout"));

    assert(!install.is_ready());
    assert(controller.state().busy());
    assert(controller.record()->active_change_id == std::optional<std::string>("1"));
    assert(f.daemon.watcher_count("1") == 1);

    auto second = controller.install();
    assert(second.result().error().kind == hy::ErrorKind::Precondition);
    assert(f.daemon.count("install") == 1);

    f.daemon.push(change("1", true));
    assert(install.result().has_value());
    assert(!controller.state().busy());

    hy::log::ok("Test Passed: Stream errors keep the change active");
}

void test_abort_reuses_change_id() {
    hy::log::info("Running test: Abort reported on the aborted change");
    Fixture f;
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    f.daemon.next_change_id = "42";
    auto controller = f.controller("hello");

    auto install = controller.install();
    auto cancel = controller.cancel();
    assert(controller.state().phase() == hy::PackageState::Phase::Aborting);
    assert(controller.record()->active_change_id == std::optional<std::string>("42"));
    // The install and the abort each follow change 42.
    assert(f.daemon.watcher_count("42") == 2);
    assert(controller.state().watch_count() == 2);

    const auto lookups = f.daemon.count("get_local_info");
    f.daemon.push(change("42", true, "change was aborted"));

    assert(install.result().error().kind == hy::ErrorKind::ChangeFailed);
    assert(cancel.is_ready());
    assert(cancel.result().error().kind == hy::ErrorKind::ChangeFailed);
    assert(cancel.result().error().message == "change was aborted");
    assert(!controller.record()->active_change_id);
    assert(controller.state().phase() == hy::PackageState::Phase::Idle);
    assert(controller.record()->last_change_error->message == "change was aborted");
    assert(f.daemon.count("get_local_info") == lookups);
    assert(f.daemon.watcher_count("42") == 0);
    assert(controller.state().watch_count() == 0);

    hy::log::ok("Test Passed: Abort reported on the aborted change");
}

void test_abort_too_late() {
    hy::log::info("Running test: Change completes despite the abort");
    Fixture f;
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    f.daemon.next_change_id = "42";
    auto controller = f.controller("hello");

    auto install = controller.install();
    auto cancel = controller.cancel();
    assert(f.daemon.watcher_count("42") == 2);

    f.daemon.local["hello"] = local_snap("hello");
    const auto lookups = f.daemon.count("get_local_info");
    f.daemon.push(change("42", true));

    assert(install.result().has_value());
    assert(cancel.result().has_value());
    assert(!controller.record()->active_change_id);
    assert(controller.state().phase() == hy::PackageState::Phase::Idle);
    assert(controller.record()->is_installed());
    // Only the install's watcher rebuilds.
    assert(f.daemon.count("get_local_info") == lookups + 1);
    assert(controller.state().watch_count() == 0);

    hy::log::ok("Test Passed: Change completes despite the abort");
}

void test_abort_rejected() {
    hy::log::info("Running test: Daemon refuses to abort");
    Fixture f;
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    f.daemon.next_change_id = "42";
    f.daemon.next_abort_error = hy::Error::daemon("cannot abort change 42 with nothing pending");
    auto controller = f.controller("hello");

    auto install = controller.install();
    auto cancel = controller.cancel();
    assert(cancel.result().error().kind == hy::ErrorKind::Daemon);
    assert(controller.state().phase() == hy::PackageState::Phase::InProgress);
    assert(controller.record()->active_change_id == std::optional<std::string>("42"));

    f.daemon.push(change("42", true));
    assert(install.result().has_value());

    hy::log::ok("Test Passed: Daemon refuses to abort");
}

void test_future_outlives_controller() {
    hy::log::info("Running test: Releasing the controller mid-change");
    Fixture f;
    f.daemon.catalog["hello"] = store_snap("hello", {{"latest/stable", Confinement::Strict}});
    hy::Future<void> install;
    {
        auto controller = f.controller("hello");
        install = controller.install();
        assert(f.daemon.watcher_count("1") == 1);
    }
    // The last handle is gone, so the entry and its watch are disposed.
    assert(!f.store.contains("hello"));
    assert(f.daemon.watcher_count("1") == 0);
    assert(install.is_ready());
    assert(install.result().error().kind == hy::ErrorKind::Cancelled);

    hy::log::ok("Test Passed: Releasing the controller mid-change");
}

int main() {
    try {
        test_install_runs_to_completion();
        test_classic_channel();
        test_failed_remove_keeps_view();
        test_successful_remove_invalidates_view();
        test_rejected_request();
        test_preconditions();
        test_cancel_without_change();
        test_abort_flow();
        test_stream_error_keeps_change_active();
        test_abort_reuses_change_id();
        test_abort_too_late();
        test_abort_rejected();
        test_future_outlives_controller();
    } catch (const std::exception& e) {
        hy::log::error(std::string("An assertion failed or an unexpected exception occurred: ") + e.what());
        return 1;
    }

    hy::log::ok("All operation controller tests completed successfully!");
    return 0;
}
