//
// Created by cv2 on 11/2/25.
//

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace hy {

    enum class ErrorKind {
        // Local lookup reported "snap-not-found". Recovered, never surfaced.
        NotInstalled,
        // Neither the local nor the catalog lookup found the package.
        PackageNotFound,
        // Caller acted before the record was ready or while a change is in flight.
        Precondition,
        // Any other daemon, transport or decoding failure.
        Daemon,
        // A watched change became ready carrying an error.
        ChangeFailed,
        // A watch was dropped locally before its change finished.
        Cancelled
    };

    std::string to_string(ErrorKind kind);

    struct Error {
        ErrorKind kind = ErrorKind::Daemon;
        std::string message;
        std::string daemon_kind; // snapd's "kind" field, e.g. "snap-not-found"

        static Error precondition(std::string message) {
            return {ErrorKind::Precondition, std::move(message), {}};
        }

        static Error daemon(std::string message, std::string daemon_kind = {}) {
            return {ErrorKind::Daemon, std::move(message), std::move(daemon_kind)};
        }

        static Error package_not_found(const std::string& name) {
            return {ErrorKind::PackageNotFound, "Package not found: " + name, {}};
        }

        static Error change_failed(std::string message) {
            return {ErrorKind::ChangeFailed, std::move(message), {}};
        }

        std::string describe() const {
            return to_string(kind) + ": " + message;
        }
    };

    class OperationException : public std::runtime_error {
    public:
        explicit OperationException(Error error)
            : std::runtime_error(error.describe()), m_error(std::move(error)) {}

        const Error& get_error() const {
            return m_error;
        }

    private:
        Error m_error;
    };

    enum class LookupStatus {
        Found,
        NotFound,
        Failed
    };

    // Outcome of a daemon lookup where "not found" is a valid answer rather than a failure.
    template<typename T>
    class Lookup {
    public:
        static Lookup found(T value) {
            Lookup lookup(LookupStatus::Found);
            lookup.m_value = std::move(value);
            return lookup;
        }

        static Lookup not_found() {
            return Lookup(LookupStatus::NotFound);
        }

        static Lookup failed(Error error) {
            Lookup lookup(LookupStatus::Failed);
            lookup.m_error = std::move(error);
            return lookup;
        }

        LookupStatus status() const { return m_status; }
        bool is_found() const { return m_status == LookupStatus::Found; }

        const T& value() const {
            if (!m_value) {
                throw OperationException(Error::precondition("lookup holds no value"));
            }
            return *m_value;
        }

        const Error& error() const {
            if (!m_error) {
                throw OperationException(Error::precondition("lookup holds no error"));
            }
            return *m_error;
        }

    private:
        explicit Lookup(LookupStatus status) : m_status(status) {}

        LookupStatus m_status;
        std::optional<T> m_value;
        std::optional<Error> m_error;
    };

} // namespace hy
