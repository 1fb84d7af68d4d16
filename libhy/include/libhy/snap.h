//
// Created by cv2 on 11/2/25.
//

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hy {

    enum class Confinement {
        Strict,
        Classic,
        Devmode,
        Unknown
    };

    Confinement confinement_from_string(const std::string& value);
    std::string to_string(Confinement confinement);

    // One "track/risk" entry of a catalog listing.
    struct ChannelInfo {
        std::string name; // e.g. "latest/stable"
        std::string version;
        std::string revision;
        Confinement confinement = Confinement::Strict;
        std::string released_at;
    };

    // A snap as the daemon reports it installed on this system.
    struct LocalSnap {
        std::string name;
        std::string version;
        std::string revision;
        std::string summary;
        std::string tracking_channel; // "track/risk", empty for local installs
        Confinement confinement = Confinement::Strict;
        std::string install_date;
    };

    // A snap as the store catalog describes it.
    struct StoreSnap {
        std::string name;
        std::string version;
        std::string summary;
        std::string publisher;
        std::string default_track = "latest";

        // --- Channels ---
        std::map<std::string, ChannelInfo> channels;
        std::vector<std::string> channel_order; // as listed by the store

        const ChannelInfo* find_channel(const std::string& channel) const {
            auto it = channels.find(channel);
            return it == channels.end() ? nullptr : &it->second;
        }
    };

    struct TaskProgress {
        std::string kind;
        std::string summary;
        std::string status;
        std::string label;
        double done = 0.0;
        double total = 0.0;
    };

    // Snapshot of a daemon change. Once ready it never changes again.
    struct ChangeRecord {
        std::string id;
        std::string kind;
        std::string summary;
        std::string status;
        bool ready = false;
        std::optional<std::string> error;
        std::vector<TaskProgress> tasks;

        // sum(done) / sum(total) across all tasks, 0 when nothing is to be done.
        double progress() const;
    };

} // namespace hy
