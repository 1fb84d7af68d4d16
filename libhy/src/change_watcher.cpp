//
// Created by cv2 on 11/4/25.
//

#include "libhy/change_watcher.h"
#include "libhy/logging.h"

namespace hy {

    ChangeWatcher::ChangeWatcher(DaemonClient& client, std::string change_id, WatchHooks hooks)
            : m_client(client), m_change_id(std::move(change_id)), m_hooks(std::move(hooks)) {}

    ChangeWatcher::~ChangeWatcher() {
        cancel();
    }

    Future<void> ChangeWatcher::watch() {
        if (!m_started && !m_resolved) {
            m_started = true;
            log::debug("Watching change " + m_change_id);
            auto subscription = m_client.watch_change(m_change_id, [this](const ChangeEvent& event) {
                on_event(event);
            });
            // The stream may already have delivered a terminal event.
            if (m_resolved) {
                subscription.cancel();
            } else {
                m_subscription = std::move(subscription);
            }
        }
        return m_promise.get_future();
    }

    void ChangeWatcher::cancel() {
        if (m_resolved) {
            return;
        }
        log::debug("Watch on change " + m_change_id + " cancelled");
        resolve(std::unexpected(Error{ErrorKind::Cancelled, "Watch on change " + m_change_id + " was cancelled", {}}));
    }

    void ChangeWatcher::on_event(const ChangeEvent& event) {
        if (m_resolved) {
            return;
        }
        if (!event) {
            // The change is still running daemon-side; keep waiting for its outcome.
            log::warn("Event stream for change " + m_change_id + " failed: " + event.error().message);
            return;
        }
        if (event->error) {
            log::error("Change " + m_change_id + " failed: " + *event->error);
            resolve(std::unexpected(Error::change_failed(*event->error)));
        } else if (event->ready) {
            log::ok("Change " + m_change_id + " completed");
            resolve({});
        }
    }

    void ChangeWatcher::resolve(std::expected<void, Error> outcome) {
        m_resolved = true;

        // Hooks and continuations may destroy this watcher, so work from copies.
        auto subscription = std::move(m_subscription);
        auto hooks = m_hooks;
        auto promise = m_promise;
        const auto change_id = m_change_id;

        subscription.cancel();

        if (hooks.clear_active_change) {
            hooks.clear_active_change(change_id);
        }
        if (outcome && hooks.rebuild_on_success && hooks.rebuild) {
            hooks.rebuild();
        }
        promise.set_result(std::move(outcome));
    }

} // namespace hy
