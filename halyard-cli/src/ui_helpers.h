//
// Created by cv2 on 11/9/25.
//

#pragma once

#include <cmath>
#include <iostream>
#include <string>
#include <vector>
#include <libhy/package_state_store.h>
#include <libhy/snap.h>

namespace ui {

// --- ANSI Color Codes ---
    const char* const RESET = "\033[0m";
    const char* const BOLD = "\033[1m";
    const char* const BLUE = "\033[1;34m";
    const char* const GREEN = "\033[0;32m";
    const char* const RED = "\033[1;31m";
    const char* const YELLOW = "\033[1;33m";
    const char* const CYAN = "\033[0;36m";

// --- Formatted Printing Functions ---

    void action(const std::string& msg) {
        std::cout << BLUE << ":: " << RESET << BOLD << msg << RESET << std::endl;
    }

    void header(const std::string& msg) {
        std::cout << BOLD << msg << RESET << std::endl;
    }

    void item(const std::string& msg) {
        std::cout << " " << GREEN << "-" << RESET << " " << msg << std::endl;
    }

    void field(const std::string& key, const std::string& value) {
        std::cout << "  " << CYAN << key << ":" << RESET << " " << value << std::endl;
    }

    void error(const std::string& msg) {
        std::cerr << RED << "error: " << RESET << msg << std::endl;
    }

    void warning(const std::string& msg) {
        std::cout << YELLOW << "warning: " << RESET << msg << std::endl;
    }

    std::string percent(double fraction) {
        return std::to_string(static_cast<int>(std::lround(fraction * 100.0))) + "%";
    }

    // Prints what snapd and the store know about one snap.
    void print_record(const hy::PackageRecord& record) {
        header("\n" + record.name);
        if (record.catalog) {
            if (!record.catalog->summary.empty()) field("summary", record.catalog->summary);
            if (!record.catalog->publisher.empty()) field("publisher", record.catalog->publisher);
        }
        if (record.local) {
            field("installed", record.local->version + " (" + record.local->revision + ")");
            if (!record.local->tracking_channel.empty()) field("tracking", record.local->tracking_channel);
            field("confinement", hy::to_string(record.local->confinement));
            if (record.has_update) field("update", "available");
        } else {
            field("installed", "no");
        }
        if (record.active_change_id) {
            field("change", *record.active_change_id + " in progress");
        }
        if (record.last_change_error) {
            field("last error", record.last_change_error->message);
        }

        if (record.catalog && !record.catalog->channel_order.empty()) {
            header("\nChannels:");
            for (const auto& name : record.catalog->channel_order) {
                const hy::ChannelInfo* channel = record.catalog->find_channel(name);
                if (!channel) continue;
                std::string line = name + "  " + channel->version + " (" + channel->revision + ")";
                if (channel->confinement != hy::Confinement::Strict) {
                    line += " " + hy::to_string(channel->confinement);
                }
                if (name == record.selected_channel) {
                    line += std::string(" ") + BOLD + "<- selected" + RESET;
                }
                item(line);
            }
        }
        std::cout << std::endl;
    }

} // namespace ui
