//
// Created by cv2 on 11/3/25.
//

#include "libhy/subscription.h"

#include <utility>

namespace hy {

    Subscription::Subscription(std::function<void()> canceller) : m_canceller(std::move(canceller)) {}

    Subscription::~Subscription() {
        cancel();
    }

    Subscription::Subscription(Subscription&& other) noexcept : m_canceller(std::move(other.m_canceller)) {
        other.m_canceller = nullptr;
    }

    Subscription& Subscription::operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            m_canceller = std::move(other.m_canceller);
            other.m_canceller = nullptr;
        }
        return *this;
    }

    void Subscription::cancel() {
        if (!m_canceller) {
            return;
        }
        // Cleared before running so a re-entrant cancel() is a no-op.
        auto canceller = std::move(m_canceller);
        m_canceller = nullptr;
        canceller();
    }

} // namespace hy
