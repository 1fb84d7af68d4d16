//
// Created by cv2 on 11/3/25.
//

#pragma once

#include "errors.h"

#include <optional>

namespace hy {

    // Loading | Value | Error, as published to UI-side collaborators.
    template<typename T>
    class AsyncValue {
    public:
        enum class State {
            Loading,
            Value,
            Error
        };

        AsyncValue() = default;

        static AsyncValue loading() { return AsyncValue(); }

        static AsyncValue value(T value) {
            AsyncValue result;
            result.m_state = State::Value;
            result.m_value = std::move(value);
            return result;
        }

        static AsyncValue error(hy::Error error) {
            AsyncValue result;
            result.m_state = State::Error;
            result.m_error = std::move(error);
            return result;
        }

        State state() const { return m_state; }
        bool is_loading() const { return m_state == State::Loading; }
        bool has_value() const { return m_state == State::Value; }
        bool has_error() const { return m_state == State::Error; }

        const T* value_or_null() const { return m_value ? &*m_value : nullptr; }
        T* value_or_null() { return m_value ? &*m_value : nullptr; }
        const hy::Error* error_or_null() const { return m_error ? &*m_error : nullptr; }

    private:
        State m_state = State::Loading;
        std::optional<T> m_value;
        std::optional<hy::Error> m_error;
    };

} // namespace hy
