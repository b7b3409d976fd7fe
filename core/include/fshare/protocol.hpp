/**
 * fshare - JSON payloads of the FShare REST API and their serialization.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace fshare::protocol
{

    inline constexpr const char *kDefaultApiUrl = "https://api.fshare.vn/api";
    inline constexpr const char *kFileBaseUrl = "https://www.fshare.vn/file/";

    inline constexpr const char *kLoginEndpoint = "/user/login";
    inline constexpr const char *kUploadSessionEndpoint = "/session/upload";
    inline constexpr const char *kDownloadSessionEndpoint = "/session/download";

    struct LoginRequest
    {
        std::string app_key{};
        std::string user_email{};
        std::string password{};
    };

    void to_json(nlohmann::json &json, const LoginRequest &request);
    void from_json(const nlohmann::json &json, LoginRequest &request);

    struct LoginResponse
    {
        int code{};
        std::string msg{};
        std::string token{};
        std::string session_id{};
    };

    void to_json(nlohmann::json &json, const LoginResponse &response);
    void from_json(const nlohmann::json &json, LoginResponse &response);

    struct UploadSessionRequest
    {
        std::string name{};
        std::uint64_t size{};
        std::string path{"/"};
        std::string token{};
        bool secured{true};
    };

    // `size` goes out as a decimal string and `secured` as 1/0, as the service expects.
    void to_json(nlohmann::json &json, const UploadSessionRequest &request);
    void from_json(const nlohmann::json &json, UploadSessionRequest &request);

    struct DownloadSessionRequest
    {
        std::string url{};
        std::string token{};
        std::optional<std::string> password{};
    };

    void to_json(nlohmann::json &json, const DownloadSessionRequest &request);
    void from_json(const nlohmann::json &json, DownloadSessionRequest &request);

    struct SessionResponse
    {
        std::optional<std::string> location{};
    };

    void to_json(nlohmann::json &json, const SessionResponse &response);
    void from_json(const nlohmann::json &json, SessionResponse &response);

} // namespace fshare::protocol
