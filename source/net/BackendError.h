#pragma once

// ============================================================================
// BackendError - Error value delivered with every backend callback
// ============================================================================
// Part of the TransDesk workbench engine
//
// Backend calls never throw. Each completion callback receives a BackendError
// which is null on success. The kind decides how the caller recovers:
// - NotFound:  the record/source no longer exists remotely (stale reference)
// - Transient: network failure, timeout or server error (retry later)
// - Rejected:  the request itself was refused (bad input, permissions)
// ============================================================================

#include <QString>

/**
 * @brief Classified failure of a backend call.
 */
struct BackendError {
    enum class Kind {
        None,       ///< Call succeeded
        NotFound,   ///< Target no longer exists on the backend
        Transient,  ///< Network/timeout/5xx, worth retrying
        Rejected    ///< Refused by the backend (4xx other than not-found)
    };

    Kind kind = Kind::None;
    int httpStatus = 0;     ///< HTTP status if one was received, else 0
    QString message;        ///< Human readable description

    bool isNull() const { return kind == Kind::None; }
    bool isNotFound() const { return kind == Kind::NotFound; }
    bool isTransient() const { return kind == Kind::Transient; }

    static BackendError notFound(const QString& msg, int status = 404) {
        return BackendError{Kind::NotFound, status, msg};
    }
    static BackendError transient(const QString& msg, int status = 0) {
        return BackendError{Kind::Transient, status, msg};
    }
    static BackendError rejected(const QString& msg, int status = 400) {
        return BackendError{Kind::Rejected, status, msg};
    }

    /**
     * @brief Classify an HTTP status code.
     *
     * 404 and 410 mean the referenced object is gone, 5xx and 408/429 are
     * worth retrying, every other 4xx is a rejection.
     */
    static Kind kindForStatus(int status) {
        if (status >= 200 && status < 300) return Kind::None;
        if (status == 404 || status == 410) return Kind::NotFound;
        if (status >= 500 || status == 408 || status == 429 || status == 0) return Kind::Transient;
        return Kind::Rejected;
    }
};
