#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace RFS {

struct Error {
    enum class Code {
        UnknownError = 0,
        NotFound,
        InvalidPath,
        IoError,
        NotInitialized,
        AlreadyClosed,
        Timeout,
        Cancelled,
        WatcherFailure,
        ComputationFailed,
        MalformedInput,
        CapacityExceeded
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::IoError:
        return "io_error";
    case Error::Code::NotInitialized:
        return "not_initialized";
    case Error::Code::AlreadyClosed:
        return "already_closed";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::Cancelled:
        return "cancelled";
    case Error::Code::WatcherFailure:
        return "watcher_failure";
    case Error::Code::ComputationFailed:
        return "computation_failed";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace RFS
