//
// Created by cv2 on 11/3/25.
//

#pragma once

#include "errors.h"
#include "future.h"
#include "snap.h"
#include "subscription.h"

#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace hy {

    // One element of a change's event stream: a fresh snapshot, or a stream error.
    using ChangeEvent = std::expected<ChangeRecord, Error>;

    // The daemon as seen by the client. Lookups always settle with a value;
    // "not found" and failures are carried inside the Lookup.
    class DaemonClient {
    public:
        virtual ~DaemonClient() = default;

        virtual Future<Lookup<LocalSnap>> get_local_info(const std::string& name) = 0;
        virtual Future<Lookup<StoreSnap>> get_catalog_info(const std::string& name) = 0;
        virtual Future<std::vector<ChangeRecord>> list_changes(const std::string& name) = 0;

        // --- Commands. Each settles with the id of the change the daemon started. ---
        virtual Future<std::string> install(const std::string& name, const std::string& channel, bool classic) = 0;
        virtual Future<std::string> refresh(const std::string& name, const std::string& channel, bool classic) = 0;
        virtual Future<std::string> remove(const std::string& name) = 0;
        virtual Future<ChangeRecord> abort_change(const std::string& change_id) = 0;

        // Delivers events until the returned Subscription is cancelled. Cancelling
        // stops observation only; the change keeps running in the daemon.
        virtual Subscription watch_change(const std::string& change_id,
                                          std::function<void(const ChangeEvent&)> on_event) = 0;

        virtual Future<std::vector<LocalSnap>> list_installed() = 0;
        virtual Future<std::vector<std::string>> list_refreshable() = 0;
    };

} // namespace hy
