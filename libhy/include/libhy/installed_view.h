//
// Created by cv2 on 11/5/25.
//

#pragma once

#include "async_value.h"
#include "broadcast.h"
#include "daemon_client.h"
#include "future.h"
#include "snap.h"

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace hy {

    // Answers "does the store hold a newer revision of this snap?".
    class UpdateChecker {
    public:
        virtual ~UpdateChecker() = default;
        virtual bool has_update(const std::string& name) const = 0;
        // Notifies after the set of snaps with updates has changed.
        virtual Subscription observe_updates(std::function<void()> listener) = 0;
    };

    // An aggregate view whose membership depends on what is installed.
    class InstalledView {
    public:
        virtual ~InstalledView() = default;
        virtual void invalidate() = 0;
    };

    // The "installed snaps" list plus the set of snaps with pending refreshes.
    class InstalledSnapsView : public InstalledView, public UpdateChecker {
    public:
        using Value = AsyncValue<std::vector<LocalSnap>>;

        explicit InstalledSnapsView(DaemonClient& client);
        ~InstalledSnapsView() override;

        // Reloads both lists from the daemon.
        void invalidate() override;
        bool has_update(const std::string& name) const override;
        Subscription observe_updates(std::function<void()> listener) override;

        const Value& installed() const;
        Subscription observe(std::function<void(const Value&)> listener);

        // Settles when the load started by the latest invalidate() finishes.
        Future<void> loaded() const;

    private:
        struct Core;
        std::shared_ptr<Core> m_core;
    };

} // namespace hy
