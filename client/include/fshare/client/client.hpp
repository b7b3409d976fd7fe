#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "fshare/byte_source.hpp"
#include "fshare/client/range_uploader.hpp"
#include "fshare/http.hpp"
#include "fshare/protocol.hpp"

namespace fshare::client
{

    enum class RedirectMode
    {
        Follow,
        Manual,
        Error
    };

    struct ClientOptions
    {
        HttpHeaders headers;
        std::string api_url{protocol::kDefaultApiUrl};
        std::string app_key;
    };

    struct DownloadOptions
    {
        RedirectMode redirect{RedirectMode::Follow};
        BodySink sink;
        // Called with the issued location before its body is requested.
        std::function<void(const std::string &)> on_location;
    };

    struct UploadOptions
    {
        std::uint64_t size{};
        ByteSource *source{};
        RedirectMode redirect{RedirectMode::Follow};
        std::size_t chunk_size{kDefaultUploadChunkSize};
        bool secured{true};
        ChunkObserver observer;
    };

    /**
     * FShare API client.
     *
     * Holds the header template shared by every request (content type, user agent,
     * Basic credentials, and the session cookie once logged in) plus the cached
     * token. Transfer state lives in the individual calls.
     */
    class Client
    {
    public:
        Client(ClientOptions options, HttpTransport &transport);

        static std::string credentials_header(const std::string &username, const std::string &password);

        /**
         * Exchanges the Basic credentials for a token. Returns 401 when no
         * credentials were supplied or the service issued no token; otherwise
         * the service's code and message as status and reason.
         */
        HttpResponse login();

        /**
         * Requests a download session for a file URL or bare file id.
         *
         * Follow: GETs the issued location and streams its body to options.sink.
         * Manual: returns 303 with the location. Error: throws RedirectRequested.
         */
        HttpResponse download(const std::string &url, const DownloadOptions &options = {});

        /**
         * Creates an upload session for `remote_path` (e.g. /folder/file.txt) and
         * sends options.source to it in ranges of options.chunk_size bytes.
         *
         * Returns the last chunk response, the first failing one, or the session
         * response when nothing had to be sent. Manual and Error redirect modes
         * stop before the first chunk.
         */
        HttpResponse upload(const std::string &remote_path, const UploadOptions &options);

        bool logged_in() const noexcept { return !token_.empty(); }
        const std::string &token() const noexcept { return token_; }
        const HttpHeaders &headers() const noexcept { return headers_; }

    private:
        std::optional<HttpResponse> ensure_login();
        HttpHeaders session_headers() const;
        HttpResponse post_json(const std::string &endpoint, const HttpHeaders &headers, const nlohmann::json &body);
        std::optional<HttpResponse> redirect_result(const std::string &location, RedirectMode mode) const;

        HttpHeaders headers_;
        std::string api_url_;
        std::string app_key_;
        HttpTransport &transport_;
        std::string token_;
    };

    HttpResponse unauthorized_response();

    struct RemoteTarget
    {
        std::string name;
        std::string path{"/"};
    };

    // Splits "/folder/file.txt" into name "file.txt" and path "/folder".
    RemoteTarget split_remote_path(const std::string &remote_path);

} // namespace fshare::client
