//
// Created by cv2 on 11/7/25.
//

#pragma once

#include "daemon_client.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>

namespace hy {

    struct SnapdClientOptions {
        std::filesystem::path socket_path = "/run/snapd.socket";
        // How often watch_change() re-reads a change that is not ready yet.
        std::chrono::milliseconds poll_interval{100};
    };

    // DaemonClient over snapd's REST API on its unix socket. Nothing blocks:
    // requests and change polls only advance inside run_once()/run_until(), and
    // every continuation runs on the thread calling them.
    class SnapdClient : public DaemonClient {
    public:
        explicit SnapdClient(SnapdClientOptions options = {});
        ~SnapdClient() override;

        Future<Lookup<LocalSnap>> get_local_info(const std::string& name) override;
        Future<Lookup<StoreSnap>> get_catalog_info(const std::string& name) override;
        Future<std::vector<ChangeRecord>> list_changes(const std::string& name) override;

        Future<std::string> install(const std::string& name, const std::string& channel, bool classic) override;
        Future<std::string> refresh(const std::string& name, const std::string& channel, bool classic) override;
        Future<std::string> remove(const std::string& name) override;
        Future<ChangeRecord> abort_change(const std::string& change_id) override;

        Subscription watch_change(const std::string& change_id,
                                  std::function<void(const ChangeEvent&)> on_event) override;

        Future<std::vector<LocalSnap>> list_installed() override;
        Future<std::vector<std::string>> list_refreshable() override;

        // Advances transfers and due polls, waiting at most `timeout` for socket
        // activity. Returns false once no request or watch is outstanding.
        bool run_once(std::chrono::milliseconds timeout = std::chrono::milliseconds(100));

        // Pumps until `done` returns true or there is nothing left to wait for.
        void run_until(const std::function<bool()>& done);

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

} // namespace hy
