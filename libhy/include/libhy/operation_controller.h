//
// Created by cv2 on 11/6/25.
//

#pragma once

#include "daemon_client.h"
#include "future.h"
#include "installed_view.h"
#include "package_state_store.h"

#include <string>

namespace hy {

    // Install/refresh/remove/cancel/select-channel for one package.
    //
    // Every command returns a future that settles when the daemon change reaches
    // a terminal state, or at once for no-ops, local mutations and rejected
    // preconditions. At most one change per package is in flight: a second
    // install/refresh/remove while one is running fails with Precondition.
    //
    // The controller keeps its package's store entry alive. Pending futures stay
    // valid after the controller is destroyed.
    class OperationController {
    public:
        OperationController(DaemonClient& client, PackageStateStore& store, InstalledView& installed,
                            const std::string& name);

        const std::string& name() const { return m_handle->name(); }
        const PackageState& state() const { return *m_handle; }
        const PackageState::Value& value() const { return m_handle->value(); }
        const PackageRecord* record() const { return m_handle->record(); }

        Subscription observe(std::function<void(const PackageState::Value&)> listener) const;
        Future<void> loaded() const { return m_handle->loaded(); }

        Future<void> install();
        Future<void> refresh();
        Future<void> remove();
        Future<void> cancel();
        Future<void> select_channel(const std::string& channel);

    private:
        Future<void> refresh_or_install(bool refresh);
        Future<void> await_change(Future<std::string> request, const std::string& action, bool invalidate_installed);
        Error not_loaded(const std::string& action) const;

        DaemonClient& m_client;
        InstalledView& m_installed;
        PackageHandle m_handle;
    };

} // namespace hy
