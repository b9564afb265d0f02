#pragma once

#include <cstdint>

namespace core {

enum class ErrorCode : std::uint8_t {
    Ok = 0,
    NotFound,
    InvalidFormat,
    CorruptRecording,
    EmptyRecording,
    TransportError,
    InvalidArgument,
    IoError,
    InvalidState,
};

inline const char* to_string(ErrorCode ec) noexcept {
    switch (ec) {
    case ErrorCode::Ok: return "Ok";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::InvalidFormat: return "InvalidFormat";
    case ErrorCode::CorruptRecording: return "CorruptRecording";
    case ErrorCode::EmptyRecording: return "EmptyRecording";
    case ErrorCode::TransportError: return "TransportError";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

} // namespace core
