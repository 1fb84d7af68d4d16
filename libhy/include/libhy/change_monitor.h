//
// Created by cv2 on 11/6/25.
//

#pragma once

#include "broadcast.h"
#include "daemon_client.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace hy {

    // Latest snapshot of one change, shared by any number of consumers. The daemon
    // subscription is dropped once the change is ready or the last consumer leaves.
    class ChangeFeed {
    public:
        ChangeFeed(DaemonClient& client, std::string change_id);
        ~ChangeFeed();

        ChangeFeed(const ChangeFeed&) = delete;
        ChangeFeed& operator=(const ChangeFeed&) = delete;

        // Replays the latest snapshot, if any, to the new consumer.
        Subscription subscribe(std::function<void(const ChangeRecord&)> listener);

        const std::string& change_id() const { return m_change_id; }
        const std::optional<ChangeRecord>& latest() const { return m_latest; }
        bool finished() const { return m_latest && m_latest->ready; }

    private:
        void on_event(const ChangeEvent& event);

        DaemonClient& m_client;
        std::string m_change_id;
        std::optional<ChangeRecord> m_latest;
        Broadcast<ChangeRecord> m_output;
        Subscription m_source;
    };

    class ChangeMonitor {
    public:
        explicit ChangeMonitor(DaemonClient& client) : m_client(client) {}

        std::shared_ptr<ChangeFeed> observe(const std::string& change_id);

    private:
        DaemonClient& m_client;
    };

} // namespace hy
