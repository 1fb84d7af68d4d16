//
// Created by cv2 on 11/7/25.
//

#include "libhy/response_parser.h"
#include "libhy/logging.h"

#include <yaml-cpp/yaml.h> // JSON is a subset of YAML's flow style

namespace hy {

    namespace {

        const std::string kSnapNotFound = "snap-not-found";

        struct Envelope {
            std::string type;
            int status_code = 0;
            YAML::Node result;
            std::string change;
        };

        std::string get_optional_scalar(const YAML::Node& node, const std::string& key) {
            if (node[key] && node[key].IsScalar()) {
                return node[key].as<std::string>();
            }
            return "";
        }

        double get_optional_number(const YAML::Node& node, const std::string& key) {
            if (node[key] && node[key].IsScalar()) {
                return node[key].as<double>();
            }
            return 0.0;
        }

        Error malformed(const std::string& what) {
            log::error("Malformed daemon response: " + what);
            return Error::daemon("Malformed daemon response: " + what);
        }

        std::expected<Envelope, Error> parse_envelope(const std::string& body) {
            YAML::Node root;
            try {
                root = YAML::Load(body);
            } catch (const YAML::Exception& e) {
                return std::unexpected(malformed(e.what()));
            }
            const YAML::Node& doc = root;
            if (!doc.IsMap() || !doc["type"]) {
                return std::unexpected(malformed("missing 'type'"));
            }

            Envelope envelope;
            envelope.type = doc["type"].as<std::string>();
            if (doc["status-code"] && doc["status-code"].IsScalar()) {
                envelope.status_code = doc["status-code"].as<int>();
            }
            envelope.result = doc["result"];
            envelope.change = get_optional_scalar(doc, "change");

            if (envelope.type == "error") {
                const YAML::Node& result = envelope.result;
                std::string message;
                std::string kind;
                if (result && result.IsMap()) {
                    message = get_optional_scalar(result, "message");
                    kind = get_optional_scalar(result, "kind");
                }
                if (message.empty()) {
                    message = "daemon returned status " + std::to_string(envelope.status_code);
                }
                return std::unexpected(Error::daemon(message, kind));
            }
            return envelope;
        }

        LocalSnap decode_local_snap(const YAML::Node& node) {
            LocalSnap snap;
            snap.name = get_optional_scalar(node, "name");
            snap.version = get_optional_scalar(node, "version");
            snap.revision = get_optional_scalar(node, "revision");
            snap.summary = get_optional_scalar(node, "summary");
            snap.tracking_channel = get_optional_scalar(node, "tracking-channel");
            snap.confinement = confinement_from_string(get_optional_scalar(node, "confinement"));
            snap.install_date = get_optional_scalar(node, "install-date");
            return snap;
        }

        StoreSnap decode_store_snap(const YAML::Node& node) {
            StoreSnap snap;
            snap.name = get_optional_scalar(node, "name");
            snap.version = get_optional_scalar(node, "version");
            snap.summary = get_optional_scalar(node, "summary");
            if (node["publisher"] && node["publisher"].IsMap()) {
                snap.publisher = get_optional_scalar(node["publisher"], "display-name");
            }
            const auto default_track = get_optional_scalar(node, "default-track");
            if (!default_track.empty()) {
                snap.default_track = default_track;
            }

            const YAML::Node& channels = node["channels"];
            if (channels && channels.IsMap()) {
                for (auto it = channels.begin(); it != channels.end(); ++it) {
                    ChannelInfo channel;
                    channel.name = it->first.as<std::string>();
                    channel.version = get_optional_scalar(it->second, "version");
                    channel.revision = get_optional_scalar(it->second, "revision");
                    channel.confinement = confinement_from_string(get_optional_scalar(it->second, "confinement"));
                    channel.released_at = get_optional_scalar(it->second, "released-at");
                    snap.channel_order.push_back(channel.name);
                    snap.channels.emplace(channel.name, std::move(channel));
                }
            }
            return snap;
        }

        ChangeRecord decode_change(const YAML::Node& node) {
            ChangeRecord change;
            change.id = get_optional_scalar(node, "id");
            change.kind = get_optional_scalar(node, "kind");
            change.summary = get_optional_scalar(node, "summary");
            change.status = get_optional_scalar(node, "status");
            if (node["ready"] && node["ready"].IsScalar()) {
                change.ready = node["ready"].as<bool>();
            }
            const auto err = get_optional_scalar(node, "err");
            if (!err.empty()) {
                change.error = err;
            }

            const YAML::Node& tasks = node["tasks"];
            if (tasks && tasks.IsSequence()) {
                for (const auto& item : tasks) {
                    TaskProgress task;
                    task.kind = get_optional_scalar(item, "kind");
                    task.summary = get_optional_scalar(item, "summary");
                    task.status = get_optional_scalar(item, "status");
                    const YAML::Node& progress = item["progress"];
                    if (progress && progress.IsMap()) {
                        task.label = get_optional_scalar(progress, "label");
                        task.done = get_optional_number(progress, "done");
                        task.total = get_optional_number(progress, "total");
                    }
                    change.tasks.push_back(std::move(task));
                }
            }
            return change;
        }

    } // namespace

    Lookup<LocalSnap> ResponseParser::parse_local_snap(const std::string& body) {
        auto envelope = parse_envelope(body);
        if (!envelope) {
            if (envelope.error().daemon_kind == kSnapNotFound) {
                return Lookup<LocalSnap>::not_found();
            }
            return Lookup<LocalSnap>::failed(envelope.error());
        }
        try {
            if (!envelope->result.IsMap()) {
                return Lookup<LocalSnap>::failed(malformed("snap result is not an object"));
            }
            return Lookup<LocalSnap>::found(decode_local_snap(envelope->result));
        } catch (const YAML::Exception& e) {
            return Lookup<LocalSnap>::failed(malformed(e.what()));
        }
    }

    Lookup<StoreSnap> ResponseParser::parse_store_snap(const std::string& body, const std::string& name) {
        auto envelope = parse_envelope(body);
        if (!envelope) {
            if (envelope.error().daemon_kind == kSnapNotFound) {
                return Lookup<StoreSnap>::not_found();
            }
            return Lookup<StoreSnap>::failed(envelope.error());
        }
        try {
            if (!envelope->result.IsSequence()) {
                return Lookup<StoreSnap>::failed(malformed("find result is not a list"));
            }
            for (const auto& item : envelope->result) {
                if (get_optional_scalar(item, "name") == name) {
                    return Lookup<StoreSnap>::found(decode_store_snap(item));
                }
            }
            return Lookup<StoreSnap>::not_found();
        } catch (const YAML::Exception& e) {
            return Lookup<StoreSnap>::failed(malformed(e.what()));
        }
    }

    std::expected<std::vector<LocalSnap>, Error> ResponseParser::parse_local_snaps(const std::string& body) {
        auto envelope = parse_envelope(body);
        if (!envelope) {
            return std::unexpected(envelope.error());
        }
        try {
            std::vector<LocalSnap> snaps;
            if (envelope->result.IsSequence()) {
                for (const auto& item : envelope->result) {
                    snaps.push_back(decode_local_snap(item));
                }
            }
            return snaps;
        } catch (const YAML::Exception& e) {
            return std::unexpected(malformed(e.what()));
        }
    }

    std::expected<std::vector<std::string>, Error> ResponseParser::parse_refreshable(const std::string& body) {
        auto envelope = parse_envelope(body);
        if (!envelope) {
            if (envelope.error().daemon_kind == kSnapNotFound) {
                return std::vector<std::string>{};
            }
            return std::unexpected(envelope.error());
        }
        try {
            std::vector<std::string> names;
            if (envelope->result.IsSequence()) {
                for (const auto& item : envelope->result) {
                    auto name = get_optional_scalar(item, "name");
                    if (!name.empty()) {
                        names.push_back(std::move(name));
                    }
                }
            }
            return names;
        } catch (const YAML::Exception& e) {
            return std::unexpected(malformed(e.what()));
        }
    }

    std::expected<ChangeRecord, Error> ResponseParser::parse_change(const std::string& body) {
        auto envelope = parse_envelope(body);
        if (!envelope) {
            return std::unexpected(envelope.error());
        }
        try {
            if (!envelope->result.IsMap()) {
                return std::unexpected(malformed("change result is not an object"));
            }
            return decode_change(envelope->result);
        } catch (const YAML::Exception& e) {
            return std::unexpected(malformed(e.what()));
        }
    }

    std::expected<std::vector<ChangeRecord>, Error> ResponseParser::parse_changes(const std::string& body) {
        auto envelope = parse_envelope(body);
        if (!envelope) {
            return std::unexpected(envelope.error());
        }
        try {
            std::vector<ChangeRecord> changes;
            if (envelope->result.IsSequence()) {
                for (const auto& item : envelope->result) {
                    changes.push_back(decode_change(item));
                }
            }
            return changes;
        } catch (const YAML::Exception& e) {
            return std::unexpected(malformed(e.what()));
        }
    }

    std::expected<std::string, Error> ResponseParser::parse_change_id(const std::string& body) {
        auto envelope = parse_envelope(body);
        if (!envelope) {
            return std::unexpected(envelope.error());
        }
        if (envelope->type != "async" || envelope->change.empty()) {
            return std::unexpected(malformed("expected an async response carrying a change id"));
        }
        return envelope->change;
    }

    std::string ResponseParser::action_body(const std::string& action, const std::optional<std::string>& channel,
                                            std::optional<bool> classic) {
        YAML::Emitter out;
        out.SetMapFormat(YAML::Flow);
        out.SetSeqFormat(YAML::Flow);
        out.SetStringFormat(YAML::DoubleQuoted);
        out.SetBoolFormat(YAML::TrueFalseBool);
        out.SetBoolFormat(YAML::LowerCase);

        out << YAML::BeginMap;
        out << YAML::Key << "action" << YAML::Value << action;
        if (channel && !channel->empty()) {
            out << YAML::Key << "channel" << YAML::Value << *channel;
        }
        if (classic) {
            out << YAML::Key << "classic" << YAML::Value << *classic;
        }
        out << YAML::EndMap;
        return out.c_str();
    }

} // namespace hy
