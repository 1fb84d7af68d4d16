//
// Created by cv2 on 11/7/25.
//

#include "libhy/snapd_client.h"
#include "libhy/logging.h"
#include "libhy/response_parser.h"

#include <curl/curl.h>
#include <algorithm>
#include <cstdint>
#include <map>
#include <vector>

namespace hy {

    namespace {

        using Clock = std::chrono::steady_clock;
        using Response = std::expected<std::string, Error>;
        using ResponseHandler = std::function<void(const Response&)>;

        // The write callback for collecting a response body
        size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
            auto* body = static_cast<std::string*>(userdata);
            body->append(ptr, size * nmemb);
            return size * nmemb;
        }

        std::string escape(const std::string& value) {
            CURL* handle = curl_easy_init();
            if (!handle) {
                return value;
            }
            char* escaped = curl_easy_escape(handle, value.c_str(), static_cast<int>(value.size()));
            std::string result = escaped ? escaped : value;
            curl_free(escaped);
            curl_easy_cleanup(handle);
            return result;
        }

        struct Transfer {
            CURL* handle = nullptr;
            curl_slist* headers = nullptr;
            std::string request_body; // must outlive the transfer, curl does not copy it
            std::string response_body;
            ResponseHandler on_done;
        };

        struct Watch {
            std::string change_id;
            std::function<void(const ChangeEvent&)> on_event;
            Clock::time_point next_poll;
            bool in_flight = false;
        };

    } // namespace

// --- PIMPL Implementation ---
    struct SnapdClient::Impl {
        SnapdClientOptions options;
        CURLM* multi_handle;
        std::map<CURL*, std::unique_ptr<Transfer>> transfers;
        std::map<std::uint64_t, Watch> watches;
        std::uint64_t next_watch_id = 0;
        // Lets Subscriptions that outlive the client cancel safely.
        std::shared_ptr<bool> alive = std::make_shared<bool>(true);

        explicit Impl(SnapdClientOptions opts) : options(std::move(opts)) {
            curl_global_init(CURL_GLOBAL_ALL);
            multi_handle = curl_multi_init();
        }

        ~Impl() {
            for (auto& [easy_handle, transfer] : transfers) {
                curl_multi_remove_handle(multi_handle, easy_handle);
                curl_easy_cleanup(easy_handle);
                curl_slist_free_all(transfer->headers);
            }
            transfers.clear();
            curl_multi_cleanup(multi_handle);
            curl_global_cleanup();
        }

        void start(const std::string& method, const std::string& path, std::string body, ResponseHandler on_done) {
            CURL* easy_handle = curl_easy_init();
            if (!easy_handle) {
                on_done(std::unexpected(Error::daemon("Could not create a request handle")));
                return;
            }

            auto transfer = std::make_unique<Transfer>();
            transfer->handle = easy_handle;
            transfer->request_body = std::move(body);
            transfer->on_done = std::move(on_done);

            // The host part is ignored when talking over the unix socket.
            const std::string url = "http://localhost" + path;
            curl_easy_setopt(easy_handle, CURLOPT_UNIX_SOCKET_PATH, options.socket_path.c_str());
            curl_easy_setopt(easy_handle, CURLOPT_URL, url.c_str());
            curl_easy_setopt(easy_handle, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(easy_handle, CURLOPT_WRITEDATA, &transfer->response_body);
            curl_easy_setopt(easy_handle, CURLOPT_NOSIGNAL, 1L);

            if (method == "POST") {
                transfer->headers = curl_slist_append(nullptr, "Content-Type: application/json");
                curl_easy_setopt(easy_handle, CURLOPT_HTTPHEADER, transfer->headers);
                curl_easy_setopt(easy_handle, CURLOPT_POSTFIELDS, transfer->request_body.c_str());
                curl_easy_setopt(easy_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(transfer->request_body.size()));
            }

            log::debug(method + " " + path);
            curl_multi_add_handle(multi_handle, easy_handle);
            transfers.emplace(easy_handle, std::move(transfer));
        }

        template<typename T, typename Parse>
        Future<T> request(const std::string& method, const std::string& path, std::string body, Parse parse) {
            Promise<T> promise;
            start(method, path, std::move(body), [promise, parse](const Response& response) mutable {
                if (!response) {
                    promise.set_error(response.error());
                    return;
                }
                promise.set_result(parse(*response));
            });
            return promise.get_future();
        }

        template<typename T, typename Parse>
        Future<Lookup<T>> lookup(const std::string& path, Parse parse) {
            Promise<Lookup<T>> promise;
            start("GET", path, {}, [promise, parse](const Response& response) mutable {
                if (!response) {
                    promise.set_value(Lookup<T>::failed(response.error()));
                    return;
                }
                promise.set_value(parse(*response));
            });
            return promise.get_future();
        }

        void schedule_polls() {
            const auto now = Clock::now();
            std::vector<std::uint64_t> due;
            for (auto& [id, watch] : watches) {
                if (!watch.in_flight && watch.next_poll <= now) {
                    watch.in_flight = true;
                    due.push_back(id);
                }
            }
            // start() may report failures inline, and listeners may unsubscribe.
            for (const auto watch_id : due) {
                auto it = watches.find(watch_id);
                if (it == watches.end()) {
                    continue;
                }
                start("GET", "/v2/changes/" + escape(it->second.change_id), {},
                      [this, watch_id](const Response& response) { on_poll(watch_id, response); });
            }
        }

        void on_poll(std::uint64_t watch_id, const Response& response) {
            auto it = watches.find(watch_id);
            if (it == watches.end()) {
                return; // unsubscribed while the poll was in flight
            }
            it->second.in_flight = false;
            it->second.next_poll = Clock::now() + options.poll_interval;

            ChangeEvent event = response ? ResponseParser::parse_change(*response)
                                         : ChangeEvent(std::unexpect, response.error());
            // Copy: the listener may unsubscribe, which erases the watch.
            auto on_event = it->second.on_event;
            if (event && event->ready) {
                // Ready changes never change again.
                watches.erase(it);
            }
            on_event(event);
        }

        void collect_finished() {
            CURLMsg* msg;
            int msgs_left;
            while ((msg = curl_multi_info_read(multi_handle, &msgs_left))) {
                if (msg->msg != CURLMSG_DONE) {
                    continue;
                }
                CURL* easy_handle = msg->easy_handle;
                const CURLcode result = msg->data.result;

                auto it = transfers.find(easy_handle);
                if (it == transfers.end()) {
                    continue;
                }
                auto transfer = std::move(it->second);
                transfers.erase(it);
                curl_multi_remove_handle(multi_handle, easy_handle);
                curl_easy_cleanup(easy_handle);
                curl_slist_free_all(transfer->headers);

                if (result != CURLE_OK) {
                    log::error(std::string("Request to snapd failed: ") + curl_easy_strerror(result));
                    transfer->on_done(std::unexpected(
                            Error::daemon(std::string("Cannot reach snapd: ") + curl_easy_strerror(result))));
                } else {
                    transfer->on_done(transfer->response_body);
                }
            }
        }

        bool idle() const {
            return transfers.empty() && watches.empty();
        }

        bool run_once(std::chrono::milliseconds timeout) {
            schedule_polls();
            int still_running = 0;
            curl_multi_perform(multi_handle, &still_running);
            collect_finished();
            if (idle()) {
                return false;
            }

            auto wait = timeout;
            if (!watches.empty()) {
                const auto now = Clock::now();
                for (const auto& [id, watch] : watches) {
                    if (!watch.in_flight) {
                        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(watch.next_poll - now);
                        wait = std::min(wait, std::max(until, std::chrono::milliseconds(0)));
                    }
                }
            }
            curl_multi_poll(multi_handle, nullptr, 0, static_cast<int>(wait.count()), nullptr);
            curl_multi_perform(multi_handle, &still_running);
            collect_finished();
            return !idle();
        }
    };

// --- Public Class Implementation ---
    SnapdClient::SnapdClient(SnapdClientOptions options) : pimpl(std::make_unique<Impl>(std::move(options))) {}
    SnapdClient::~SnapdClient() = default;

    Future<Lookup<LocalSnap>> SnapdClient::get_local_info(const std::string& name) {
        return pimpl->lookup<LocalSnap>("/v2/snaps/" + escape(name), [](const std::string& body) {
            return ResponseParser::parse_local_snap(body);
        });
    }

    Future<Lookup<StoreSnap>> SnapdClient::get_catalog_info(const std::string& name) {
        return pimpl->lookup<StoreSnap>("/v2/find?name=" + escape(name), [name](const std::string& body) {
            return ResponseParser::parse_store_snap(body, name);
        });
    }

    Future<std::vector<ChangeRecord>> SnapdClient::list_changes(const std::string& name) {
        return pimpl->request<std::vector<ChangeRecord>>("GET", "/v2/changes?select=all&for=" + escape(name), {},
                                                         [](const std::string& body) {
                                                             return ResponseParser::parse_changes(body);
                                                         });
    }

    Future<std::string> SnapdClient::install(const std::string& name, const std::string& channel, bool classic) {
        return pimpl->request<std::string>("POST", "/v2/snaps/" + escape(name),
                                           ResponseParser::action_body("install", channel, classic),
                                           [](const std::string& body) {
                                               return ResponseParser::parse_change_id(body);
                                           });
    }

    Future<std::string> SnapdClient::refresh(const std::string& name, const std::string& channel, bool classic) {
        return pimpl->request<std::string>("POST", "/v2/snaps/" + escape(name),
                                           ResponseParser::action_body("refresh", channel, classic),
                                           [](const std::string& body) {
                                               return ResponseParser::parse_change_id(body);
                                           });
    }

    Future<std::string> SnapdClient::remove(const std::string& name) {
        return pimpl->request<std::string>("POST", "/v2/snaps/" + escape(name),
                                           ResponseParser::action_body("remove"),
                                           [](const std::string& body) {
                                               return ResponseParser::parse_change_id(body);
                                           });
    }

    Future<ChangeRecord> SnapdClient::abort_change(const std::string& change_id) {
        return pimpl->request<ChangeRecord>("POST", "/v2/changes/" + escape(change_id),
                                            ResponseParser::action_body("abort"),
                                            [](const std::string& body) {
                                                return ResponseParser::parse_change(body);
                                            });
    }

    Subscription SnapdClient::watch_change(const std::string& change_id,
                                           std::function<void(const ChangeEvent&)> on_event) {
        const auto watch_id = pimpl->next_watch_id++;
        pimpl->watches.emplace(watch_id, Watch{change_id, std::move(on_event), Clock::now(), false});

        std::weak_ptr<bool> alive = pimpl->alive;
        Impl* impl = pimpl.get();
        return Subscription([alive, impl, watch_id]() {
            if (alive.lock()) {
                impl->watches.erase(watch_id);
            }
        });
    }

    Future<std::vector<LocalSnap>> SnapdClient::list_installed() {
        return pimpl->request<std::vector<LocalSnap>>("GET", "/v2/snaps", {}, [](const std::string& body) {
            return ResponseParser::parse_local_snaps(body);
        });
    }

    Future<std::vector<std::string>> SnapdClient::list_refreshable() {
        return pimpl->request<std::vector<std::string>>("GET", "/v2/find?select=refresh", {},
                                                        [](const std::string& body) {
                                                            return ResponseParser::parse_refreshable(body);
                                                        });
    }

    bool SnapdClient::run_once(std::chrono::milliseconds timeout) {
        return pimpl->run_once(timeout);
    }

    void SnapdClient::run_until(const std::function<bool()>& done) {
        while (!done()) {
            if (!pimpl->run_once(std::chrono::milliseconds(100))) {
                break;
            }
        }
    }

} // namespace hy
