#include "fshare/error_codes.hpp"

namespace fshare
{

    std::string_view to_string(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::InvalidUsage:
            return "invalid_usage";
        case ErrorCode::AuthenticationFailed:
            return "authentication_failed";
        case ErrorCode::SessionCreationFailed:
            return "session_creation_failed";
        case ErrorCode::ChunkTransferFailed:
            return "chunk_transfer_failed";
        case ErrorCode::RedirectRequested:
            return "redirect_requested";
        case ErrorCode::FileIo:
            return "file_io";
        case ErrorCode::NetworkError:
            return "network_error";
        case ErrorCode::InvalidResponse:
            return "invalid_response";
        }
        return "unknown";
    }

} // namespace fshare
