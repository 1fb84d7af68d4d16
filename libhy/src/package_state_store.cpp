//
// Created by cv2 on 11/5/25.
//

#include "libhy/package_state_store.h"
#include "libhy/logging.h"

#include <algorithm>

namespace hy {

    std::string default_selected_channel(const LocalSnap* local, const StoreSnap* catalog,
                                         const std::string& configured_default) {
        auto offered = [catalog](const std::string& channel) {
            return !channel.empty() && (!catalog || catalog->channels.contains(channel));
        };

        if (local && offered(local->tracking_channel)) {
            return local->tracking_channel;
        }
        if (!catalog) {
            return configured_default;
        }
        if (offered(configured_default)) {
            return configured_default;
        }
        const std::string track_stable = catalog->default_track + "/stable";
        if (offered(track_stable)) {
            return track_stable;
        }
        if (!catalog->channel_order.empty()) {
            return catalog->channel_order.front();
        }
        if (!catalog->channels.empty()) {
            return catalog->channels.begin()->first;
        }
        return {};
    }

    // --- PackageState ---

    struct PackageState::BuildContext {
        unsigned generation = 0;
        std::optional<LocalSnap> local;
        std::optional<StoreSnap> catalog;
        std::optional<std::string> active_change_id;
    };

    PackageState::PackageState(DaemonClient& client, UpdateChecker& updates, const StoreOptions& options,
                               std::string name)
            : m_client(client), m_updates(updates), m_options(options), m_name(std::move(name)) {}

    PackageState::~PackageState() {
        dispose();
    }

    Subscription PackageState::observe(std::function<void(const Value&)> listener) {
        return m_changes.subscribe(std::move(listener));
    }

    void PackageState::rebuild() {
        if (m_disposed) {
            return;
        }
        auto ctx = std::make_shared<BuildContext>();
        ctx->generation = ++m_generation;
        if (m_build_done.is_settled()) {
            m_build_done = Promise<void>();
        }
        m_value = Value::loading();
        log::debug("Building state for '" + m_name + "'");
        publish();

        std::weak_ptr<PackageState> weak = weak_from_this();
        if (!m_updates_subscription.active()) {
            m_updates_subscription = m_updates.observe_updates([weak]() {
                if (auto self = weak.lock()) {
                    self->on_updates_changed();
                }
            });
        }
        m_client.get_local_info(m_name).on_complete([weak, ctx](const Future<Lookup<LocalSnap>>::Result& result) {
            auto self = weak.lock();
            if (self && self->is_current(ctx->generation)) {
                self->on_local_info(ctx, result);
            }
        });
    }

    void PackageState::on_local_info(const std::shared_ptr<BuildContext>& ctx,
                                     const Future<Lookup<LocalSnap>>::Result& result) {
        if (!result) {
            fail_build(result.error());
            return;
        }
        switch (result->status()) {
            case LookupStatus::Found:
                ctx->local = result->value();
                break;
            case LookupStatus::NotFound:
                // Simply not installed.
                log::debug("'" + m_name + "' is not installed");
                break;
            case LookupStatus::Failed:
                fail_build(result->error());
                return;
        }

        std::weak_ptr<PackageState> weak = weak_from_this();
        m_client.get_catalog_info(m_name).on_complete([weak, ctx](const Future<Lookup<StoreSnap>>::Result& result) {
            auto self = weak.lock();
            if (self && self->is_current(ctx->generation)) {
                self->on_catalog_info(ctx, result);
            }
        });
    }

    void PackageState::on_catalog_info(const std::shared_ptr<BuildContext>& ctx,
                                       const Future<Lookup<StoreSnap>>::Result& result) {
        std::optional<Error> failure;
        if (!result) {
            failure = result.error();
        } else if (result->status() == LookupStatus::Failed) {
            failure = result->error();
        } else if (result->is_found()) {
            ctx->catalog = result->value();
        }

        if (failure) {
            if (!ctx->local) {
                fail_build(*failure);
                return;
            }
            log::warn("Catalog lookup for '" + m_name + "' failed, using local data only: " + failure->message);
        }

        std::weak_ptr<PackageState> weak = weak_from_this();
        m_client.list_changes(m_name).on_complete([weak, ctx](const Future<std::vector<ChangeRecord>>::Result& result) {
            auto self = weak.lock();
            if (self && self->is_current(ctx->generation)) {
                self->on_changes(ctx, result);
            }
        });
    }

    void PackageState::on_changes(const std::shared_ptr<BuildContext>& ctx,
                                  const Future<std::vector<ChangeRecord>>::Result& result) {
        if (!result) {
            fail_build(result.error());
            return;
        }
        auto pending = std::find_if(result->begin(), result->end(),
                                    [](const ChangeRecord& change) { return !change.ready; });
        if (pending != result->end()) {
            ctx->active_change_id = pending->id;
        }
        finish_build(ctx);
    }

    void PackageState::finish_build(const std::shared_ptr<BuildContext>& ctx) {
        if (!ctx->local && !ctx->catalog) {
            fail_build(Error::package_not_found(m_name));
            return;
        }

        PackageRecord record;
        record.name = m_name;
        record.local = std::move(ctx->local);
        record.catalog = std::move(ctx->catalog);
        // Recomputed on every build, never cached.
        record.has_update = m_updates.has_update(m_name);
        record.selected_channel = default_selected_channel(record.local ? &*record.local : nullptr,
                                                           record.catalog ? &*record.catalog : nullptr,
                                                           m_options.default_channel);

        if (ctx->active_change_id) {
            m_active_change = ctx->active_change_id;
            if (m_phase == Phase::Idle) {
                m_phase = Phase::InProgress;
            }
        } else if (m_phase == Phase::Idle) {
            m_active_change.reset();
        }

        m_value = Value::value(std::move(record));
        log::debug("State for '" + m_name + "' is ready");
        publish();

        if (ctx->active_change_id && !watching(*ctx->active_change_id)) {
            const std::string change_id = *ctx->active_change_id;
            log::info("Resuming change " + change_id + " for '" + m_name + "'");
            const std::string name = m_name;
            track_change(change_id, true).on_complete([name, change_id](const Future<void>::Result& outcome) {
                if (!outcome) {
                    log::warn("Resumed change " + change_id + " for '" + name + "' ended: " + outcome.error().message);
                }
            });
        }

        auto done = m_build_done;
        done.set_value();
    }

    void PackageState::fail_build(const Error& error) {
        if (error.kind == ErrorKind::PackageNotFound) {
            log::warn(error.message);
        } else {
            log::error("Could not load '" + m_name + "': " + error.message);
        }
        m_value = Value::error(error);
        publish();
        auto done = m_build_done;
        done.set_error(error);
    }

    void PackageState::publish() {
        if (m_disposed) {
            return;
        }
        if (auto* record = m_value.value_or_null()) {
            record->active_change_id = m_active_change;
        }
        m_changes.publish(m_value);
    }

    void PackageState::on_updates_changed() {
        const PackageRecord* current = record();
        // A build in flight reads the new answer when it finishes.
        if (m_disposed || !current || current->has_update == m_updates.has_update(m_name)) {
            return;
        }
        log::debug("Update availability of '" + m_name + "' changed");
        rebuild();
    }

    void PackageState::begin_request() {
        m_phase = Phase::Requested;
    }

    void PackageState::abandon_request() {
        if (m_phase == Phase::Requested) {
            m_phase = m_active_change ? Phase::InProgress : Phase::Idle;
        }
    }

    void PackageState::begin_change(const std::string& change_id, Phase phase) {
        m_active_change = change_id;
        m_phase = phase;
        publish();
    }

    void PackageState::abort_failed() {
        if (m_phase == Phase::Aborting) {
            m_phase = m_active_change ? Phase::InProgress : Phase::Idle;
        }
    }

    void PackageState::set_phase(Phase phase) {
        m_phase = phase;
    }

    void PackageState::set_selected_channel(const std::string& channel) {
        if (auto* record = m_value.value_or_null()) {
            record->selected_channel = channel;
            publish();
        }
    }

    void PackageState::record_failure(const Error& error) {
        if (auto* record = m_value.value_or_null()) {
            record->last_change_error = error;
            publish();
        }
    }

    void PackageState::clear_active_change(const std::string& change_id) {
        purge_watchers();
        if (m_active_change != change_id) {
            return;
        }
        m_active_change.reset();
        m_phase = Phase::Idle;
        publish();
    }

    Future<void> PackageState::track_change(const std::string& change_id, bool rebuild_on_success) {
        purge_watchers();

        std::weak_ptr<PackageState> weak = weak_from_this();
        WatchHooks hooks;
        hooks.clear_active_change = [weak](const std::string& id) {
            if (auto self = weak.lock()) {
                self->clear_active_change(id);
            }
        };
        hooks.rebuild = [weak]() {
            if (auto self = weak.lock()) {
                self->rebuild();
            }
        };
        hooks.rebuild_on_success = rebuild_on_success;

        auto watcher = std::make_unique<ChangeWatcher>(m_client, change_id, std::move(hooks));
        auto future = watcher->watch();
        if (!watcher->is_resolved()) {
            m_watchers.push_back(std::move(watcher));
        }
        return future;
    }

    bool PackageState::watching(const std::string& change_id) const {
        return std::any_of(m_watchers.begin(), m_watchers.end(), [&change_id](const auto& watcher) {
            return !watcher->is_resolved() && watcher->change_id() == change_id;
        });
    }

    void PackageState::purge_watchers() {
        std::erase_if(m_watchers, [](const auto& watcher) { return watcher->is_resolved(); });
    }

    void PackageState::dispose() {
        if (m_disposed) {
            return;
        }
        m_disposed = true;
        ++m_generation;
        m_changes.close();
        m_updates_subscription.cancel();
        log::debug("Disposing state for '" + m_name + "'");

        // Cancelling runs each watcher's hooks, which must not find it in the list.
        auto watchers = std::move(m_watchers);
        m_watchers.clear();
        for (auto& watcher : watchers) {
            watcher->cancel();
        }

        if (!m_build_done.is_settled()) {
            auto done = m_build_done;
            done.set_error(Error{ErrorKind::Cancelled, "State for '" + m_name + "' was disposed", {}});
        }
    }

    // --- PackageHandle ---

    PackageHandle::PackageHandle(PackageStateStore* store, std::shared_ptr<PackageState> state)
            : m_store(store), m_state(std::move(state)) {}

    PackageHandle::~PackageHandle() {
        reset();
    }

    PackageHandle::PackageHandle(const PackageHandle& other) : m_store(other.m_store), m_state(other.m_state) {
        if (m_store && m_state) {
            m_store->retain(m_state->name());
        }
    }

    PackageHandle& PackageHandle::operator=(const PackageHandle& other) {
        if (this != &other) {
            PackageHandle copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    PackageHandle::PackageHandle(PackageHandle&& other) noexcept
            : m_store(other.m_store), m_state(std::move(other.m_state)) {
        other.m_store = nullptr;
        other.m_state.reset();
    }

    PackageHandle& PackageHandle::operator=(PackageHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_store = other.m_store;
            m_state = std::move(other.m_state);
            other.m_store = nullptr;
            other.m_state.reset();
        }
        return *this;
    }

    void PackageHandle::reset() {
        auto* store = m_store;
        auto state = std::move(m_state);
        m_store = nullptr;
        m_state.reset();
        if (store && state) {
            store->release(state->name());
        }
    }

    // --- PackageStateStore ---

    PackageStateStore::PackageStateStore(DaemonClient& client, UpdateChecker& updates, StoreOptions options)
            : m_client(client), m_updates(updates), m_options(std::move(options)) {}

    PackageStateStore::~PackageStateStore() {
        auto entries = std::move(m_entries);
        m_entries.clear();
        for (auto& [name, entry] : entries) {
            entry.state->dispose();
        }
    }

    PackageHandle PackageStateStore::acquire(const std::string& name) {
        auto it = m_entries.find(name);
        if (it != m_entries.end()) {
            ++it->second.refs;
            return PackageHandle(this, it->second.state);
        }

        auto state = std::make_shared<PackageState>(m_client, m_updates, m_options, name);
        m_entries.emplace(name, Entry{state, 1});
        log::debug("Created state for '" + name + "'");
        PackageHandle handle(this, state);
        state->rebuild();
        return handle;
    }

    void PackageStateStore::invalidate(const std::string& name) {
        auto it = m_entries.find(name);
        if (it != m_entries.end()) {
            auto state = it->second.state;
            state->rebuild();
        }
    }

    std::size_t PackageStateStore::ref_count(const std::string& name) const {
        auto it = m_entries.find(name);
        return it == m_entries.end() ? 0 : it->second.refs;
    }

    void PackageStateStore::retain(const std::string& name) {
        auto it = m_entries.find(name);
        if (it != m_entries.end()) {
            ++it->second.refs;
        }
    }

    void PackageStateStore::release(const std::string& name) {
        auto it = m_entries.find(name);
        if (it == m_entries.end()) {
            return;
        }
        if (--it->second.refs > 0) {
            return;
        }
        // Erase before disposing: disposal callbacks may come back to the store.
        auto state = std::move(it->second.state);
        m_entries.erase(it);
        state->dispose();
    }

} // namespace hy
