//
// Created by cv2 on 11/13/25.
//

#include "libhy/logging.h"
#include "libhy/response_parser.h"
#include <yaml-cpp/yaml.h>
#include <cassert>
#include <string>

void test_local_snap() {
    hy::log::info("Running test: Installed snap response");
    const std::string body = R"({
        "type": "sync", "status-code": 200, "status": "OK",
        "result": {
            "name": "hello", "version": "2.10", "revision": "42",
            "summary": "GNU Hello", "tracking-channel": "latest/stable",
            "confinement": "strict", "install-date": "2025-10-01T10:00:00Z"
        }
    })";

    auto lookup = hy::ResponseParser::parse_local_snap(body);
    assert(lookup.is_found());
    const auto& snap = lookup.value();
    assert(snap.name == "hello");
    assert(snap.version == "2.10");
    assert(snap.revision == "42");
    assert(snap.tracking_channel == "latest/stable");
    assert(snap.confinement == hy::Confinement::Strict);

    hy::log::ok("Test Passed: Installed snap response");
}

void test_not_found_and_errors() {
    hy::log::info("Running test: Error envelopes");
    const std::string missing = R"({"type": "error", "status-code": 404, "status": "Not Found",
        "result": {"message": "snap not installed", "kind": "snap-not-found", "value": "hello"}})";
    assert(hy::ResponseParser::parse_local_snap(missing).status() == hy::LookupStatus::NotFound);
    assert(hy::ResponseParser::parse_store_snap(missing, "hello").status() == hy::LookupStatus::NotFound);
    auto nothing = hy::ResponseParser::parse_refreshable(missing);
    assert(nothing && nothing->empty());

    const std::string denied = R"({"type": "error", "status-code": 401, "status": "Unauthorized",
        "result": {"message": "access denied", "kind": "login-required"}})";
    auto lookup = hy::ResponseParser::parse_local_snap(denied);
    assert(lookup.status() == hy::LookupStatus::Failed);
    assert(lookup.error().kind == hy::ErrorKind::Daemon);
    assert(lookup.error().message == "access denied");
    assert(lookup.error().daemon_kind == "login-required");

    auto command = hy::ResponseParser::parse_change_id(denied);
    assert(!command && command.error().daemon_kind == "login-required");

    auto garbage = hy::ResponseParser::parse_change("{\"type\": ");
    assert(!garbage && garbage.error().kind == hy::ErrorKind::Daemon);

    hy::log::ok("Test Passed: Error envelopes");
}

void test_store_snap() {
    hy::log::info("Running test: Store search response");
    const std::string body = R"({
        "type": "sync", "status-code": 200,
        "result": [{
            "name": "code", "version": "1.95", "summary": "Code editing. Redefined.",
            "publisher": {"id": "x", "username": "vscode", "display-name": "Visual Studio Code"},
            "default-track": "latest",
            "channels": {
                "latest/stable": {"version": "1.95", "revision": "170", "confinement": "classic",
                                  "released-at": "2025-10-20T00:00:00Z"},
                "latest/edge": {"version": "1.96-insider", "revision": "171", "confinement": "classic"}
            }
        }]
    })";

    auto lookup = hy::ResponseParser::parse_store_snap(body, "code");
    assert(lookup.is_found());
    const auto& snap = lookup.value();
    assert(snap.publisher == "Visual Studio Code");
    assert(snap.channels.size() == 2);
    assert(snap.channel_order.front() == "latest/stable");
    const auto* stable = snap.find_channel("latest/stable");
    assert(stable && stable->revision == "170" && stable->confinement == hy::Confinement::Classic);

    assert(hy::ResponseParser::parse_store_snap(body, "other").status() == hy::LookupStatus::NotFound);

    hy::log::ok("Test Passed: Store search response");
}

void test_changes() {
    hy::log::info("Running test: Change responses");
    const std::string body = R"({
        "type": "sync", "status-code": 200,
        "result": {
            "id": "42", "kind": "install-snap", "summary": "Install \"hello\" snap",
            "status": "Doing", "ready": false,
            "tasks": [
                {"kind": "download-snap", "summary": "Download", "status": "Doing",
                 "progress": {"label": "hello", "done": 512, "total": 1024}},
                {"kind": "link-snap", "summary": "Link", "status": "Do",
                 "progress": {"label": "", "done": 0, "total": 1}}
            ]
        }
    })";

    auto change = hy::ResponseParser::parse_change(body);
    assert(change);
    assert(change->id == "42");
    assert(!change->ready);
    assert(!change->error);
    assert(change->tasks.size() == 2);
    assert(change->tasks[0].done == 512.0);
    assert(change->progress() == 512.0 / 1025.0);

    const std::string list = R"({"type": "sync", "status-code": 200, "result": [
        {"id": "40", "kind": "refresh-snap", "status": "Error", "ready": true, "err": "cannot refresh"},
        {"id": "41", "kind": "remove-snap", "status": "Done", "ready": true}
    ]})";
    auto changes = hy::ResponseParser::parse_changes(list);
    assert(changes && changes->size() == 2);
    assert((*changes)[0].error && *(*changes)[0].error == "cannot refresh");
    assert((*changes)[1].ready && !(*changes)[1].error);

    const std::string started = R"({"type": "async", "status-code": 202, "status": "Accepted",
        "result": null, "change": "43"})";
    auto id = hy::ResponseParser::parse_change_id(started);
    assert(id && *id == "43");
    assert(!hy::ResponseParser::parse_change_id(list));

    hy::log::ok("Test Passed: Change responses");
}

void test_snap_lists() {
    hy::log::info("Running test: Snap list responses");
    const std::string installed = R"({"type": "sync", "status-code": 200, "result": [
        {"name": "core22", "version": "20250923", "revision": "2133", "confinement": "strict"},
        {"name": "code", "version": "1.95", "revision": "170", "confinement": "classic",
         "tracking-channel": "latest/stable"}
    ]})";
    auto snaps = hy::ResponseParser::parse_local_snaps(installed);
    assert(snaps && snaps->size() == 2);
    assert((*snaps)[1].confinement == hy::Confinement::Classic);

    const std::string refresh = R"({"type": "sync", "status-code": 200, "result": [
        {"name": "code", "version": "1.96"}
    ]})";
    auto names = hy::ResponseParser::parse_refreshable(refresh);
    assert(names && names->size() == 1 && names->front() == "code");

    hy::log::ok("Test Passed: Snap list responses");
}

void test_action_bodies() {
    hy::log::info("Running test: Command bodies");
    YAML::Node install = YAML::Load(hy::ResponseParser::action_body("install", std::string("latest/edge"), true));
    assert(install["action"].as<std::string>() == "install");
    assert(install["channel"].as<std::string>() == "latest/edge");
    assert(install["classic"].as<bool>());

    const std::string abort = hy::ResponseParser::action_body("abort");
    assert(abort.find("\"action\"") != std::string::npos);
    YAML::Node parsed = YAML::Load(abort);
    assert(parsed["action"].as<std::string>() == "abort");
    assert(!parsed["channel"]);
    assert(!parsed["classic"]);

    hy::log::ok("Test Passed: Command bodies");
}

int main() {
    try {
        test_local_snap();
        test_not_found_and_errors();
        test_store_snap();
        test_changes();
        test_snap_lists();
        test_action_bodies();
    } catch (const std::exception& e) {
        hy::log::error(std::string("An assertion failed or an unexpected exception occurred: ") + e.what());
        return 1;
    }

    hy::log::ok("All response parser tests completed successfully!");
    return 0;
}
