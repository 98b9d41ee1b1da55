#include "slimetrack/core/Error.hpp"

#include <string>

namespace slimetrack {

namespace {

class TrackerCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "slimetrack"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::ResolveFailed:      return "server address could not be resolved";
            case Errc::BindFailed:         return "failed to bind UDP socket";
            case Errc::SocketOptionFailed: return "failed to set socket option";
            case Errc::SendFailed:         return "failed to send datagram";
            case Errc::InvalidIdentity:    return "invalid tracker identity";
            case Errc::InvalidConfig:      return "invalid connection config";
            case Errc::NotInitialized:     return "tracker is not initialized";
            case Errc::SensorLimitReached: return "sensor registry is full";
            case Errc::CalledFromIoThread: return "blocking call issued from the I/O thread";
            case Errc::EncodeFailed:       return "packet encoding failed";
            case Errc::Cancelled:          return "session was torn down";
        }
        return "unknown slimetrack error";
    }

    std::error_condition default_error_condition(int value) const noexcept override {
        return make_error_condition(kindOf(static_cast<Errc>(value)));
    }
};

class ErrorKindCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "slimetrack-kind"; }

    std::string message(int value) const override {
        switch (static_cast<ErrorKind>(value)) {
            case ErrorKind::Transport:    return "transport error";
            case ErrorKind::Precondition: return "precondition error";
            case ErrorKind::Protocol:     return "protocol error";
            case ErrorKind::Cancelled:    return "cancelled";
        }
        return "unknown error kind";
    }
};

} // namespace

const std::error_category& trackerCategory() noexcept {
    static const TrackerCategory category;
    return category;
}

const std::error_category& errorKindCategory() noexcept {
    static const ErrorKindCategory category;
    return category;
}

std::error_code make_error_code(Errc code) noexcept {
    return {static_cast<int>(code), trackerCategory()};
}

std::error_condition make_error_condition(ErrorKind kind) noexcept {
    return {static_cast<int>(kind), errorKindCategory()};
}

ErrorKind kindOf(Errc code) noexcept {
    switch (code) {
        case Errc::ResolveFailed:
        case Errc::BindFailed:
        case Errc::SocketOptionFailed:
        case Errc::SendFailed:
            return ErrorKind::Transport;
        case Errc::InvalidIdentity:
        case Errc::InvalidConfig:
        case Errc::NotInitialized:
        case Errc::SensorLimitReached:
        case Errc::CalledFromIoThread:
            return ErrorKind::Precondition;
        case Errc::EncodeFailed:
            return ErrorKind::Protocol;
        case Errc::Cancelled:
            return ErrorKind::Cancelled;
    }
    return ErrorKind::Protocol;
}

} // namespace slimetrack
