//
// Created by cv2 on 11/2/25.
//

#include "libhy/errors.h"

namespace hy {

    std::string to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::NotInstalled: return "not installed";
            case ErrorKind::PackageNotFound: return "package not found";
            case ErrorKind::Precondition: return "precondition failed";
            case ErrorKind::Daemon: return "daemon error";
            case ErrorKind::ChangeFailed: return "change failed";
            case ErrorKind::Cancelled: return "cancelled";
            default: return "unknown error";
        }
    }

} // namespace hy
