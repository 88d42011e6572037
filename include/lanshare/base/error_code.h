#ifndef LANSHARE_BASE_ERROR_CODE_H
#define LANSHARE_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace lanshare {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    ConfigError = 1001,

    // Network errors (2000-2999)
    SocketError = 2001,
    BindFailed = 2002,
    BroadcastSetupFailed = 2003,
    SendFailed = 2004,

    // Discovery errors (3000-3999)
    NotStarted = 3001,
    AlreadyStarted = 3002,
    PeerNotFound = 3003,

    // Messaging errors (4000-4999)
    TextTooLong = 4001,
    MessageTooLarge = 4002
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class LanShareError : public std::exception {
public:
    LanShareError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace lanshare

namespace std {
template <>
struct is_error_code_enum<lanshare::ErrorCode> : true_type {};
} // namespace std

#endif // LANSHARE_BASE_ERROR_CODE_H
