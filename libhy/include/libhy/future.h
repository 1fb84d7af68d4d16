//
// Created by cv2 on 11/3/25.
//

#pragma once

#include "errors.h"

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace hy {

    template<typename T>
    class Promise;

    namespace detail {

        template<typename T>
        struct FutureState {
            std::optional<std::expected<T, Error>> result;
            std::vector<std::function<void(const std::expected<T, Error>&)>> callbacks;

            // First settlement wins; later ones are ignored.
            void settle(std::expected<T, Error> value) {
                if (result) {
                    return;
                }
                result = std::move(value);
                auto pending = std::move(callbacks);
                callbacks.clear();
                for (auto& callback : pending) {
                    callback(*result);
                }
            }
        };

    } // namespace detail

    // Single-threaded future. Continuations run on whichever thread settles the
    // promise, which is the thread pumping the daemon client.
    template<typename T>
    class Future {
    public:
        using Result = std::expected<T, Error>;

        Future() = default;

        bool valid() const { return m_state != nullptr; }
        bool is_ready() const { return m_state && m_state->result.has_value(); }

        const Result& result() const {
            if (!is_ready()) {
                throw OperationException(Error::precondition("future is not ready"));
            }
            return *m_state->result;
        }

        // Returns the value (nothing for Future<void>) or throws the stored Error.
        decltype(auto) get() const {
            const Result& r = result();
            if (!r) {
                throw OperationException(r.error());
            }
            if constexpr (std::is_void_v<T>) {
                return;
            } else {
                return (*r);
            }
        }

        // Runs immediately when already settled.
        void on_complete(std::function<void(const Result&)> callback) const {
            if (!m_state) {
                throw OperationException(Error::precondition("on_complete() on an empty future"));
            }
            if (m_state->result) {
                callback(*m_state->result);
                return;
            }
            m_state->callbacks.push_back(std::move(callback));
        }

    private:
        friend class Promise<T>;

        explicit Future(std::shared_ptr<detail::FutureState<T>> state) : m_state(std::move(state)) {}

        std::shared_ptr<detail::FutureState<T>> m_state;
    };

    template<typename T>
    class Promise {
    public:
        using Result = std::expected<T, Error>;

        Promise() : m_state(std::make_shared<detail::FutureState<T>>()) {}

        Future<T> get_future() const { return Future<T>(m_state); }
        bool is_settled() const { return m_state->result.has_value(); }

        template<typename... Args>
        void set_value(Args&&... args) {
            set_result(Result(std::in_place, std::forward<Args>(args)...));
        }

        void set_error(Error error) {
            set_result(Result(std::unexpect, std::move(error)));
        }

        void set_result(Result result) {
            // Keeps the state alive if a continuation drops the last other reference.
            auto state = m_state;
            state->settle(std::move(result));
        }

    private:
        std::shared_ptr<detail::FutureState<T>> m_state;
    };

    inline Future<void> make_ready_future() {
        Promise<void> promise;
        promise.set_value();
        return promise.get_future();
    }

    template<typename T>
    Future<std::decay_t<T>> make_ready_future(T&& value) {
        Promise<std::decay_t<T>> promise;
        promise.set_value(std::forward<T>(value));
        return promise.get_future();
    }

    template<typename T>
    Future<T> make_failed_future(Error error) {
        Promise<T> promise;
        promise.set_error(std::move(error));
        return promise.get_future();
    }

} // namespace hy
