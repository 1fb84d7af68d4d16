//
// Created by cv2 on 11/6/25.
//

#include "libhy/change_monitor.h"
#include "libhy/logging.h"

namespace hy {

    ChangeFeed::ChangeFeed(DaemonClient& client, std::string change_id)
            : m_client(client), m_change_id(std::move(change_id)) {
        m_output.set_on_idle([this]() { m_source.cancel(); });
    }

    ChangeFeed::~ChangeFeed() {
        m_output.close();
        m_source.cancel();
    }

    Subscription ChangeFeed::subscribe(std::function<void(const ChangeRecord&)> listener) {
        if (m_latest) {
            listener(*m_latest);
        }
        auto subscription = m_output.subscribe(std::move(listener));
        if (!m_source.active() && !finished()) {
            m_source = m_client.watch_change(m_change_id, [this](const ChangeEvent& event) { on_event(event); });
        }
        return subscription;
    }

    void ChangeFeed::on_event(const ChangeEvent& event) {
        if (!event) {
            log::warn("Lost track of change " + m_change_id + ": " + event.error().message);
            return;
        }
        if (finished()) {
            return;
        }
        m_latest = *event;
        if (m_latest->ready) {
            m_source.cancel();
        }
        m_output.publish(*m_latest);
    }

    std::shared_ptr<ChangeFeed> ChangeMonitor::observe(const std::string& change_id) {
        return std::make_shared<ChangeFeed>(m_client, change_id);
    }

} // namespace hy
