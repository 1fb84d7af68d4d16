//
// Created by cv2 on 11/4/25.
//

#pragma once

#include "broadcast.h"
#include "daemon_client.h"
#include "subscription.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hy {

    // Mean progress of a fixed set of changes, republished on every update of any
    // of them. Lazy: daemon subscriptions start with the first consumer. Not
    // restartable: once the last consumer detaches, the stream is disposed.
    class ProgressStream {
    public:
        ProgressStream(DaemonClient& client, const std::vector<std::string>& change_ids);
        ~ProgressStream();

        ProgressStream(const ProgressStream&) = delete;
        ProgressStream& operator=(const ProgressStream&) = delete;

        // Throws OperationException once the stream has been disposed.
        Subscription subscribe(std::function<void(double)> on_sample);

        bool disposed() const { return m_disposed; }
        std::optional<double> latest() const { return m_latest; }
        std::size_t tracked_changes() const { return m_fractions.size(); }

    private:
        void start();
        void dispose();
        void on_change(const std::string& change_id, const ChangeEvent& event);

        DaemonClient& m_client;
        std::map<std::string, double> m_fractions;
        std::map<std::string, Subscription> m_sources;
        Broadcast<double> m_output;
        std::optional<double> m_latest;
        bool m_started = false;
        bool m_disposed = false;
    };

    class ProgressAggregator {
    public:
        explicit ProgressAggregator(DaemonClient& client) : m_client(client) {}

        // Duplicate ids are tracked once.
        std::shared_ptr<ProgressStream> observe(const std::vector<std::string>& change_ids);

    private:
        DaemonClient& m_client;
    };

} // namespace hy
