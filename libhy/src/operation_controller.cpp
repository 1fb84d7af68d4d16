//
// Created by cv2 on 11/6/25.
//

#include "libhy/operation_controller.h"
#include "libhy/logging.h"

namespace hy {

    OperationController::OperationController(DaemonClient& client, PackageStateStore& store,
                                             InstalledView& installed, const std::string& name)
            : m_client(client), m_installed(installed), m_handle(store.acquire(name)) {}

    Subscription OperationController::observe(std::function<void(const PackageState::Value&)> listener) const {
        return m_handle->observe(std::move(listener));
    }

    Error OperationController::not_loaded(const std::string& action) const {
        return Error::precondition("'" + name() + "' must be loaded from the catalog before " + action);
    }

    Future<void> OperationController::install() {
        return refresh_or_install(false);
    }

    Future<void> OperationController::refresh() {
        return refresh_or_install(true);
    }

    Future<void> OperationController::refresh_or_install(bool refresh) {
        const std::string action = refresh ? "refreshing it" : "installing it";
        const PackageRecord* record = m_handle->record();
        if (!record || !record->has_catalog()) {
            return make_failed_future<void>(not_loaded(action));
        }
        if (m_handle->busy()) {
            return make_failed_future<void>(Error::precondition("Another change is in progress for '" + name() + "'"));
        }
        const ChannelInfo* channel = record->selected_channel_info();
        if (!channel) {
            return make_failed_future<void>(
                    Error::precondition("Invalid channel '" + record->selected_channel + "' for '" + name() + "'"));
        }

        const std::string channel_name = record->selected_channel;
        const bool classic = channel->confinement == Confinement::Classic;
        log::info((refresh ? "Refreshing '" : "Installing '") + name() + "' from " + channel_name +
                  (classic ? " (classic)" : ""));

        m_handle->begin_request();
        auto request = refresh ? m_client.refresh(name(), channel_name, classic)
                               : m_client.install(name(), channel_name, classic);
        return await_change(std::move(request), refresh ? "refresh" : "install", false);
    }

    Future<void> OperationController::remove() {
        if (!m_handle->record()) {
            return make_failed_future<void>(
                    Error::precondition("'" + name() + "' must be loaded before removing it"));
        }
        if (m_handle->busy()) {
            return make_failed_future<void>(Error::precondition("Another change is in progress for '" + name() + "'"));
        }

        log::info("Removing '" + name() + "'");
        m_handle->begin_request();
        return await_change(m_client.remove(name()), "remove", true);
    }

    Future<void> OperationController::await_change(Future<std::string> request, const std::string& action,
                                                   bool invalidate_installed) {
        auto state = m_handle.state();
        InstalledView* installed = invalidate_installed ? &m_installed : nullptr;
        Promise<void> promise;

        request.on_complete([state, installed, promise, action](const Future<std::string>::Result& change_id) mutable {
            if (!change_id) {
                log::error("Daemon rejected " + action + " of '" + state->name() + "': " + change_id.error().message);
                state->abandon_request();
                state->record_failure(change_id.error());
                promise.set_error(change_id.error());
                return;
            }

            log::debug(action + " of '" + state->name() + "' started as change " + *change_id);
            state->begin_change(*change_id, PackageState::Phase::InProgress);
            state->track_change(*change_id, true).on_complete(
                    [state, installed, promise](const Future<void>::Result& outcome) mutable {
                        if (!outcome) {
                            state->record_failure(outcome.error());
                            promise.set_error(outcome.error());
                            return;
                        }
                        // Only a successful change alters what is installed.
                        if (installed) {
                            installed->invalidate();
                        }
                        promise.set_value();
                    });
        });
        return promise.get_future();
    }

    Future<void> OperationController::cancel() {
        const PackageRecord* record = m_handle->record();
        if (!record || !record->has_catalog()) {
            return make_failed_future<void>(not_loaded("aborting an action"));
        }
        const auto active = m_handle->active_change_id();
        if (!active) {
            log::debug("Nothing to cancel for '" + name() + "'");
            return make_ready_future();
        }
        if (m_handle->phase() == PackageState::Phase::Aborting) {
            return make_failed_future<void>(
                    Error::precondition("An abort is already in progress for '" + name() + "'"));
        }

        log::info("Aborting change " + *active + " of '" + name() + "'");
        auto state = m_handle.state();
        state->set_phase(PackageState::Phase::Aborting);
        Promise<void> promise;

        m_client.abort_change(*active).on_complete([state, promise](const Future<ChangeRecord>::Result& abort) mutable {
            if (!abort) {
                log::error("Could not abort change for '" + state->name() + "': " + abort.error().message);
                state->abort_failed();
                promise.set_error(abort.error());
                return;
            }
            state->begin_change(abort->id, PackageState::Phase::Aborting);
            // No rebuild here; the aborted change's own watcher settles the record.
            state->track_change(abort->id, false).on_complete([promise](const Future<void>::Result& outcome) mutable {
                promise.set_result(outcome);
            });
        });
        return promise.get_future();
    }

    Future<void> OperationController::select_channel(const std::string& channel) {
        const PackageRecord* record = m_handle->record();
        if (!record || !record->has_catalog()) {
            return make_failed_future<void>(not_loaded("changing channel"));
        }
        if (!record->catalog->find_channel(channel)) {
            return make_failed_future<void>(
                    Error::precondition("'" + name() + "' has no channel '" + channel + "'"));
        }
        m_handle->set_selected_channel(channel);
        return make_ready_future();
    }

} // namespace hy
