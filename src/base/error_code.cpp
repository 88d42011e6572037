#include "lanshare/base/error_code.h"

namespace lanshare {

namespace {

class LanShareCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "LanShare";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const LanShareCategory& get_category() {
    static LanShareCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::SocketError: return "Socket error";
        case ErrorCode::BindFailed: return "Bind failed";
        case ErrorCode::BroadcastSetupFailed: return "Failed to enable broadcast";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::NotStarted: return "Discovery service not started";
        case ErrorCode::AlreadyStarted: return "Discovery service already started";
        case ErrorCode::PeerNotFound: return "Peer not found";
        case ErrorCode::TextTooLong: return "Text too long";
        case ErrorCode::MessageTooLarge: return "Message too large";
        default: return "Unknown error";
    }
}

LanShareError::LanShareError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* LanShareError::what() const noexcept {
    return message_.c_str();
}

} // namespace lanshare
