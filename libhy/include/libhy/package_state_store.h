//
// Created by cv2 on 11/5/25.
//

#pragma once

#include "async_value.h"
#include "broadcast.h"
#include "change_watcher.h"
#include "daemon_client.h"
#include "future.h"
#include "installed_view.h"
#include "snap.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hy {

    struct PackageRecord {
        std::string name;
        std::optional<LocalSnap> local;
        std::optional<StoreSnap> catalog;
        std::string selected_channel;
        std::optional<std::string> active_change_id;
        bool has_update = false;
        // Set when the last install/refresh/remove on this record failed.
        std::optional<Error> last_change_error;

        bool is_installed() const { return local.has_value(); }
        bool has_catalog() const { return catalog.has_value(); }

        const ChannelInfo* selected_channel_info() const {
            return catalog ? catalog->find_channel(selected_channel) : nullptr;
        }
    };

    // Installed tracking channel, then the configured default, then the catalog's
    // own default. Channels the catalog does not offer are skipped once it is known.
    std::string default_selected_channel(const LocalSnap* local, const StoreSnap* catalog,
                                         const std::string& configured_default);

    struct StoreOptions {
        std::string default_channel = "latest/stable";
    };

    // The state machine behind one package key.
    class PackageState : public std::enable_shared_from_this<PackageState> {
    public:
        enum class Phase {
            Idle,
            Requested,  // command sent, no change id yet
            InProgress, // watching the change in active_change_id
            Aborting    // abort requested or abort change in flight
        };

        using Value = AsyncValue<PackageRecord>;

        PackageState(DaemonClient& client, UpdateChecker& updates, const StoreOptions& options, std::string name);
        ~PackageState();

        PackageState(const PackageState&) = delete;
        PackageState& operator=(const PackageState&) = delete;

        const std::string& name() const { return m_name; }
        const Value& value() const { return m_value; }
        const PackageRecord* record() const { return m_value.value_or_null(); }
        Phase phase() const { return m_phase; }
        const std::optional<std::string>& active_change_id() const { return m_active_change; }
        bool busy() const { return m_phase != Phase::Idle; }
        bool disposed() const { return m_disposed; }
        std::size_t watch_count() const { return m_watchers.size(); }

        Subscription observe(std::function<void(const Value&)> listener);

        // Settles with the outcome of the most recent build.
        Future<void> loaded() const { return m_build_done.get_future(); }

        // Discards the current record and any build in flight, then builds anew.
        void rebuild();

        // --- Transitions driven by OperationController ---
        void begin_request();
        void abandon_request();
        void begin_change(const std::string& change_id, Phase phase);
        void abort_failed();
        void set_phase(Phase phase);
        void set_selected_channel(const std::string& channel);
        void record_failure(const Error& error);
        void clear_active_change(const std::string& change_id);

        // Watches `change_id` on behalf of this record; see WatchHooks.
        Future<void> track_change(const std::string& change_id, bool rebuild_on_success);

        // Cancels every watch and build. The state publishes nothing afterwards.
        void dispose();

    private:
        struct BuildContext;

        bool is_current(unsigned generation) const { return !m_disposed && generation == m_generation; }
        void on_local_info(const std::shared_ptr<BuildContext>& ctx, const Future<Lookup<LocalSnap>>::Result& result);
        void on_catalog_info(const std::shared_ptr<BuildContext>& ctx, const Future<Lookup<StoreSnap>>::Result& result);
        void on_changes(const std::shared_ptr<BuildContext>& ctx, const Future<std::vector<ChangeRecord>>::Result& result);
        void finish_build(const std::shared_ptr<BuildContext>& ctx);
        void fail_build(const Error& error);
        void publish();
        void on_updates_changed();
        bool watching(const std::string& change_id) const;
        void purge_watchers();

        DaemonClient& m_client;
        UpdateChecker& m_updates;
        StoreOptions m_options;
        std::string m_name;

        Value m_value;
        Phase m_phase = Phase::Idle;
        std::optional<std::string> m_active_change;
        std::vector<std::unique_ptr<ChangeWatcher>> m_watchers;
        Broadcast<Value> m_changes;
        Subscription m_updates_subscription;
        Promise<void> m_build_done;
        unsigned m_generation = 0;
        bool m_disposed = false;
    };

    class PackageStateStore;

    // Counted reference to a store entry. The entry is disposed when the last
    // handle for its key goes away. The store must outlive its handles.
    class PackageHandle {
    public:
        PackageHandle() = default;
        ~PackageHandle();

        PackageHandle(const PackageHandle& other);
        PackageHandle& operator=(const PackageHandle& other);
        PackageHandle(PackageHandle&& other) noexcept;
        PackageHandle& operator=(PackageHandle&& other) noexcept;

        void reset();

        explicit operator bool() const { return m_state != nullptr; }
        PackageState* operator->() const { return m_state.get(); }
        PackageState& operator*() const { return *m_state; }
        const std::shared_ptr<PackageState>& state() const { return m_state; }

    private:
        friend class PackageStateStore;
        PackageHandle(PackageStateStore* store, std::shared_ptr<PackageState> state);

        PackageStateStore* m_store = nullptr;
        std::shared_ptr<PackageState> m_state;
    };

    class PackageStateStore {
    public:
        PackageStateStore(DaemonClient& client, UpdateChecker& updates, StoreOptions options = {});
        ~PackageStateStore();

        PackageStateStore(const PackageStateStore&) = delete;
        PackageStateStore& operator=(const PackageStateStore&) = delete;

        // Creates and starts building the entry on first access.
        PackageHandle acquire(const std::string& name);

        // Rebuilds a live entry; unknown keys are ignored.
        void invalidate(const std::string& name);

        bool contains(const std::string& name) const { return m_entries.contains(name); }
        std::size_t size() const { return m_entries.size(); }
        std::size_t ref_count(const std::string& name) const;

    private:
        friend class PackageHandle;
        void retain(const std::string& name);
        void release(const std::string& name);

        struct Entry {
            std::shared_ptr<PackageState> state;
            std::size_t refs = 0;
        };

        DaemonClient& m_client;
        UpdateChecker& m_updates;
        StoreOptions m_options;
        std::map<std::string, Entry> m_entries;
    };

} // namespace hy
