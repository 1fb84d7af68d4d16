//
// Created by cv2 on 11/4/25.
//

#pragma once

#include "daemon_client.h"
#include "future.h"
#include "subscription.h"

#include <functional>
#include <string>

namespace hy {

    // What a watcher does to its package record when the change ends.
    struct WatchHooks {
        // Always runs once: on success, failure and cancellation.
        std::function<void(const std::string& change_id)> clear_active_change;
        // Runs after clear_active_change, on success only, if rebuild_on_success.
        std::function<void()> rebuild;
        bool rebuild_on_success = true;
    };

    class ChangeWatcher {
    public:
        ChangeWatcher(DaemonClient& client, std::string change_id, WatchHooks hooks = {});
        ~ChangeWatcher();

        ChangeWatcher(const ChangeWatcher&) = delete;
        ChangeWatcher& operator=(const ChangeWatcher&) = delete;

        // Subscribes on the first call; later calls return the same future.
        Future<void> watch();

        // Drops the subscription and settles the watch as Cancelled.
        void cancel();

        const std::string& change_id() const { return m_change_id; }
        bool is_resolved() const { return m_resolved; }

    private:
        void on_event(const ChangeEvent& event);
        void resolve(std::expected<void, Error> outcome);

        DaemonClient& m_client;
        std::string m_change_id;
        WatchHooks m_hooks;
        Promise<void> m_promise;
        Subscription m_subscription;
        bool m_started = false;
        bool m_resolved = false;
    };

} // namespace hy
