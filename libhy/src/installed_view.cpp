//
// Created by cv2 on 11/5/25.
//

#include "libhy/installed_view.h"
#include "libhy/logging.h"

namespace hy {

    struct InstalledSnapsView::Core {
        DaemonClient& client;
        Value value;
        std::set<std::string> refreshable;
        Broadcast<Value> changes;
        Broadcast<std::set<std::string>> updates;
        Promise<void> load_done;
        unsigned generation = 0;

        explicit Core(DaemonClient& c) : client(c) {}

        void finish(Value next) {
            value = std::move(next);
            auto done = load_done;
            changes.publish(value);
            done.set_value();
        }
    };

    InstalledSnapsView::InstalledSnapsView(DaemonClient& client)
            : m_core(std::make_shared<Core>(client)) {
        invalidate();
    }

    InstalledSnapsView::~InstalledSnapsView() = default;

    void InstalledSnapsView::invalidate() {
        const auto generation = ++m_core->generation;
        if (m_core->load_done.is_settled()) {
            m_core->load_done = Promise<void>();
        }
        m_core->value = Value::loading();
        m_core->changes.publish(m_core->value);
        log::debug("Reloading installed snaps");

        // Refresh candidates first so has_update() is current once the list lands.
        std::weak_ptr<Core> weak = m_core;
        m_core->client.list_refreshable().on_complete([weak, generation](const auto& refreshable) {
            auto core = weak.lock();
            if (!core || core->generation != generation) {
                return;
            }
            std::set<std::string> next;
            if (refreshable) {
                next.insert(refreshable->begin(), refreshable->end());
            } else {
                log::warn("Could not list refreshable snaps: " + refreshable.error().message);
            }
            if (next != core->refreshable) {
                core->refreshable = std::move(next);
                log::debug(std::to_string(core->refreshable.size()) + " snap(s) with updates");
                core->updates.publish(core->refreshable);
                // A listener may have started another load.
                if (core->generation != generation) {
                    return;
                }
            }

            core->client.list_installed().on_complete([weak, generation](const auto& installed) {
                auto core = weak.lock();
                if (!core || core->generation != generation) {
                    return;
                }
                if (!installed) {
                    log::error("Could not list installed snaps: " + installed.error().message);
                    core->finish(Value::error(installed.error()));
                    return;
                }
                log::debug(std::to_string(installed->size()) + " snap(s) installed");
                core->finish(Value::value(*installed));
            });
        });
    }

    bool InstalledSnapsView::has_update(const std::string& name) const {
        return m_core->refreshable.contains(name);
    }

    Subscription InstalledSnapsView::observe_updates(std::function<void()> listener) {
        return m_core->updates.subscribe([listener = std::move(listener)](const std::set<std::string>&) {
            listener();
        });
    }

    const InstalledSnapsView::Value& InstalledSnapsView::installed() const {
        return m_core->value;
    }

    Subscription InstalledSnapsView::observe(std::function<void(const Value&)> listener) {
        return m_core->changes.subscribe(std::move(listener));
    }

    Future<void> InstalledSnapsView::loaded() const {
        return m_core->load_done.get_future();
    }

} // namespace hy
