#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace juhradial {

enum class Error : uint8_t {
    None,
    MalformedFrame,
    Timeout,
    DeviceUnavailable,
    DeviceError,
    FeatureUnsupported,
    FeatureBlocked,
    InvalidSlot,
    InvalidPairing,
    UnknownPeer,
    PayloadTooLarge,
    LengthRequired,
    UntrustedOrigin,
    BadRequest,
    NotFound,
    RandomSourceFailed,
    IoError,
};

inline std::string_view to_string(Error error) {
    switch (error) {
        case Error::None: return "none";
        case Error::MalformedFrame: return "malformed_frame";
        case Error::Timeout: return "timeout";
        case Error::DeviceUnavailable: return "device_unavailable";
        case Error::DeviceError: return "device_error";
        case Error::FeatureUnsupported: return "feature_unsupported";
        case Error::FeatureBlocked: return "feature_blocked";
        case Error::InvalidSlot: return "invalid_slot";
        case Error::InvalidPairing: return "invalid_pairing";
        case Error::UnknownPeer: return "unknown_peer";
        case Error::PayloadTooLarge: return "payload_too_large";
        case Error::LengthRequired: return "length_required";
        case Error::UntrustedOrigin: return "untrusted_origin";
        case Error::BadRequest: return "bad_request";
        case Error::NotFound: return "not_found";
        case Error::RandomSourceFailed: return "random_source_failed";
        case Error::IoError: return "io_error";
    }
    return "unknown";
}

// Value plus error, the error is None on success
template<typename T>
struct Result {
    T value{};
    Error error = Error::None;

    bool ok() const { return error == Error::None; }
    explicit operator bool() const { return ok(); }
};

template<typename T>
inline Result<T> fail(Error error) {
    Result<T> result;
    result.error = error;
    return result;
}

enum class PairingState : uint8_t {
    Unpaired,
    Pairing,
    Paired,
};

inline std::string_view to_string(PairingState state) {
    switch (state) {
        case PairingState::Unpaired: return "unpaired";
        case PairingState::Pairing: return "pairing";
        case PairingState::Paired: return "paired";
    }
    return "unknown";
}

enum class SyncType : uint8_t {
    Clipboard,
    FocusHandoff,
};

inline std::string_view to_string(SyncType type) {
    switch (type) {
        case SyncType::Clipboard: return "clipboard";
        case SyncType::FocusHandoff: return "focus-handoff";
    }
    return "unknown";
}

inline std::optional<SyncType> sync_type_from_string(std::string_view s) {
    if (s == "clipboard") return SyncType::Clipboard;
    if (s == "focus-handoff" || s == "focus_handoff") return SyncType::FocusHandoff;
    return std::nullopt;
}

// How the device is attached to this host
enum class ConnectionType {
    Unknown,
    Usb,
    Bluetooth,
    Bolt,
    Unifying,
};

inline std::string_view to_string(ConnectionType type) {
    switch (type) {
        case ConnectionType::Unknown: return "unknown";
        case ConnectionType::Usb: return "usb";
        case ConnectionType::Bluetooth: return "bluetooth";
        case ConnectionType::Bolt: return "bolt";
        case ConnectionType::Unifying: return "unifying";
    }
    return "unknown";
}

// Receivers multiplex paired devices, direct links address the device as 0xFF
inline bool is_receiver(ConnectionType type) {
    return type == ConnectionType::Bolt || type == ConnectionType::Unifying;
}

} // namespace juhradial
