#pragma once

/// @file error_code.hpp
/// @brief Error codes grouped by the subsystem that raises them.

#include <cstdint>
#include <string_view>

namespace sfe::foundation {

/// The high byte of a code names its subsystem; see errorSubsystem().
enum class ErrorCode : uint16_t {
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    AlreadyExists = 0x0003,

    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,
    ConfigValueInvalid = 0x0103,

    DatabaseError = 0x0200,
    NotConnected = 0x0201,
    QueryFailed = 0x0202,
    ConnectionPoolExhausted = 0x0203,

    JobScheduleFailed = 0x0300,
    JobNotFound = 0x0301,
    JobFailed = 0x0302,

    LoggerFlushFailed = 0x0400,

    RepositoryError = 0x0500,
    InvalidMatchRecord = 0x0501,
    MalformedRow = 0x0502,
};

constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint16_t>(code) >> 8) {
        case 0x00: return "General";
        case 0x01: return "Config";
        case 0x02: return "Database";
        case 0x03: return "Scheduler";
        case 0x04: return "Logger";
        case 0x05: return "Repository";
    }
    return "Unknown";
}

} // namespace sfe::foundation
