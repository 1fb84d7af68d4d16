//
// Created by cv2 on 11/7/25.
//

#pragma once

#include "errors.h"
#include "snap.h"

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace hy {

    // Decodes snapd REST responses. Every body is an envelope of the form
    // {"type": "sync"|"async"|"error", "status-code": ..., "result": ..., "change": ...}.
    // An error envelope becomes Error{Daemon, message, kind}.
    class ResponseParser {
    public:
        // GET /v2/snaps/{name}; "snap-not-found" is NotFound.
        static Lookup<LocalSnap> parse_local_snap(const std::string& body);

        // GET /v2/find?name={name}; an empty result or "snap-not-found" is NotFound.
        static Lookup<StoreSnap> parse_store_snap(const std::string& body, const std::string& name);

        // GET /v2/snaps
        static std::expected<std::vector<LocalSnap>, Error> parse_local_snaps(const std::string& body);

        // GET /v2/find?select=refresh; "snap-not-found" means nothing to refresh.
        static std::expected<std::vector<std::string>, Error> parse_refreshable(const std::string& body);

        // GET /v2/changes/{id} and POST /v2/changes/{id}
        static std::expected<ChangeRecord, Error> parse_change(const std::string& body);

        // GET /v2/changes?select=all&for={name}
        static std::expected<std::vector<ChangeRecord>, Error> parse_changes(const std::string& body);

        // Any async command response; yields the started change's id.
        static std::expected<std::string, Error> parse_change_id(const std::string& body);

        // JSON body for POST /v2/snaps/{name} and POST /v2/changes/{id}.
        static std::string action_body(const std::string& action,
                                       const std::optional<std::string>& channel = std::nullopt,
                                       std::optional<bool> classic = std::nullopt);
    };

} // namespace hy
