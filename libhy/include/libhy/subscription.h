//
// Created by cv2 on 11/3/25.
//

#pragma once

#include <functional>

namespace hy {

    // Move-only handle to a live listener registration. Cancels on destruction.
    class Subscription {
    public:
        Subscription() = default;
        explicit Subscription(std::function<void()> canceller);
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        // Idempotent.
        void cancel();
        bool active() const { return static_cast<bool>(m_canceller); }

    private:
        std::function<void()> m_canceller;
    };

} // namespace hy
