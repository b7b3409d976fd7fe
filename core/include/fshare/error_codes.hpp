/**
 * fshare - Error codes shared by the transfer core and the client layer.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace fshare
{

    enum class ErrorCode
    {
        InvalidUsage,
        AuthenticationFailed,
        SessionCreationFailed,
        ChunkTransferFailed,
        RedirectRequested,
        FileIo,
        NetworkError,
        InvalidResponse
    };

    // Stable snake_case label used in log lines.
    std::string_view to_string(ErrorCode code) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code_(code) {}

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace fshare
