//
// Created by cv2 on 11/3/25.
//

#pragma once

#include "errors.h"
#include "subscription.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace hy {

    // Publish/subscribe channel with any number of independent consumers.
    // The idle hook fires when the last consumer detaches.
    template<typename T>
    class Broadcast {
    public:
        using Listener = std::function<void(const T&)>;

        Broadcast() : m_core(std::make_shared<Core>()) {}
        ~Broadcast() { close(); }

        Broadcast(const Broadcast&) = delete;
        Broadcast& operator=(const Broadcast&) = delete;

        Subscription subscribe(Listener listener) {
            if (m_core->closed) {
                throw OperationException(Error::precondition("subscribe() on a closed channel"));
            }
            const auto id = m_core->next_id++;
            m_core->listeners.emplace(id, std::move(listener));

            std::weak_ptr<Core> weak = m_core;
            return Subscription([weak, id]() {
                auto core = weak.lock();
                if (!core || core->listeners.erase(id) == 0) {
                    return;
                }
                if (core->listeners.empty() && !core->closed && core->on_idle) {
                    auto on_idle = core->on_idle;
                    on_idle();
                }
            });
        }

        void publish(const T& value) {
            auto core = m_core;
            std::vector<std::uint64_t> ids;
            ids.reserve(core->listeners.size());
            for (const auto& [id, listener] : core->listeners) {
                ids.push_back(id);
            }
            // Listeners may detach (or attach) while we deliver.
            for (const auto id : ids) {
                auto it = core->listeners.find(id);
                if (it == core->listeners.end()) {
                    continue;
                }
                auto listener = it->second;
                listener(value);
            }
        }

        void set_on_idle(std::function<void()> on_idle) {
            m_core->on_idle = std::move(on_idle);
        }

        // Drops every consumer without firing the idle hook.
        void close() {
            m_core->closed = true;
            m_core->listeners.clear();
            m_core->on_idle = nullptr;
        }

        bool closed() const { return m_core->closed; }
        std::size_t subscriber_count() const { return m_core->listeners.size(); }

    private:
        struct Core {
            std::map<std::uint64_t, Listener> listeners;
            std::uint64_t next_id = 0;
            std::function<void()> on_idle;
            bool closed = false;
        };

        std::shared_ptr<Core> m_core;
    };

} // namespace hy
