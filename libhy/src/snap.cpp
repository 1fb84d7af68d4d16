//
// Created by cv2 on 11/2/25.
//

#include "libhy/snap.h"

namespace hy {

    Confinement confinement_from_string(const std::string& value) {
        if (value == "strict") return Confinement::Strict;
        if (value == "classic") return Confinement::Classic;
        if (value == "devmode") return Confinement::Devmode;
        return Confinement::Unknown;
    }

    std::string to_string(Confinement confinement) {
        switch (confinement) {
            case Confinement::Strict: return "strict";
            case Confinement::Classic: return "classic";
            case Confinement::Devmode: return "devmode";
            default: return "unknown";
        }
    }

    double ChangeRecord::progress() const {
        double done = 0.0;
        double total = 0.0;
        for (const auto& task : tasks) {
            done += task.done;
            total += task.total;
        }
        return total != 0.0 ? done / total : 0.0;
    }

} // namespace hy
