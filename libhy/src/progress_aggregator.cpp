//
// Created by cv2 on 11/4/25.
//

#include "libhy/progress_aggregator.h"
#include "libhy/logging.h"

#include <numeric>

namespace hy {

    ProgressStream::ProgressStream(DaemonClient& client, const std::vector<std::string>& change_ids)
            : m_client(client) {
        for (const auto& id : change_ids) {
            m_fractions.emplace(id, 0.0);
        }
        m_output.set_on_idle([this]() { dispose(); });
    }

    ProgressStream::~ProgressStream() {
        m_output.close();
        m_sources.clear();
    }

    Subscription ProgressStream::subscribe(std::function<void(double)> on_sample) {
        if (m_disposed) {
            throw OperationException(Error::precondition("progress stream has already been disposed"));
        }
        auto subscription = m_output.subscribe(std::move(on_sample));
        if (!m_started) {
            start();
        }
        return subscription;
    }

    void ProgressStream::start() {
        m_started = true;
        log::debug("Observing progress of " + std::to_string(m_fractions.size()) + " change(s)");
        for (const auto& [id, fraction] : m_fractions) {
            const std::string change_id = id;
            m_sources.emplace(change_id, m_client.watch_change(change_id, [this, change_id](const ChangeEvent& event) {
                on_change(change_id, event);
            }));
        }
    }

    void ProgressStream::dispose() {
        if (m_disposed) {
            return;
        }
        m_disposed = true;
        log::debug("Progress stream disposed");
        // Move out first: cancelling may re-enter through the client.
        auto sources = std::move(m_sources);
        m_sources.clear();
        for (auto& [id, subscription] : sources) {
            subscription.cancel();
        }
        m_output.close();
    }

    void ProgressStream::on_change(const std::string& change_id, const ChangeEvent& event) {
        if (m_disposed) {
            return;
        }
        if (!event) {
            log::warn("Progress of change " + change_id + " unavailable: " + event.error().message);
            return;
        }
        m_fractions[change_id] = event->progress();

        const double sum = std::accumulate(m_fractions.begin(), m_fractions.end(), 0.0,
                                           [](double acc, const auto& entry) { return acc + entry.second; });
        const double mean = sum / static_cast<double>(m_fractions.size());
        m_latest = mean;
        m_output.publish(mean);
    }

    std::shared_ptr<ProgressStream> ProgressAggregator::observe(const std::vector<std::string>& change_ids) {
        return std::make_shared<ProgressStream>(m_client, change_ids);
    }

} // namespace hy
