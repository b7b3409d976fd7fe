#include "fshare/client/client.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "fshare/encoding/base64.hpp"
#include "fshare/error_codes.hpp"
#include "fshare/url.hpp"
#include "fshare/version.hpp"

namespace fshare::client
{

    namespace
    {

        struct BasicCredentials
        {
            std::string user_email;
            std::string password;
        };

        // Mirrors /^Basic\s+(.*)$/: anything else decodes to empty credentials.
        BasicCredentials decode_basic(std::string_view authorization)
        {
            constexpr std::string_view kScheme = "Basic";
            if (authorization.size() <= kScheme.size() || authorization.substr(0, kScheme.size()) != kScheme ||
                (authorization[kScheme.size()] != ' ' && authorization[kScheme.size()] != '\t'))
            {
                return {};
            }
            auto encoded = authorization.substr(kScheme.size());
            while (!encoded.empty() && (encoded.front() == ' ' || encoded.front() == '\t'))
            {
                encoded.remove_prefix(1);
            }

            const auto decoded = encoding::decode_base64(encoded).value_or(std::string{});
            const auto colon = decoded.find(':');
            if (colon == std::string::npos)
            {
                return {.user_email = decoded, .password = {}};
            }
            return {.user_email = decoded.substr(0, colon), .password = decoded.substr(colon + 1)};
        }

        nlohmann::json parse_body(const HttpResponse &response, std::string_view what)
        {
            try
            {
                return nlohmann::json::parse(response.text());
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw Error(ErrorCode::InvalidResponse, std::string(what) + " returned HTTP " +
                                                            std::to_string(response.status) +
                                                            " with a body that is not JSON: " + ex.what());
            }
        }

        template <typename T>
        T decode_body(const HttpResponse &response, std::string_view what)
        {
            const auto json = parse_body(response, what);
            try
            {
                return json.get<T>();
            }
            catch (const std::exception &ex)
            {
                throw Error(ErrorCode::InvalidResponse, std::string(what) + " response is malformed: " + ex.what());
            }
        }

    } // namespace

    HttpResponse unauthorized_response()
    {
        HttpResponse response;
        response.status = 401;
        response.reason = "Unauthorized";
        response.headers.set("WWW-Authenticate", R"(Basic realm="Login", charset="UTF-8")");
        response.body = to_bytes("401 Unauthorized");
        return response;
    }

    RemoteTarget split_remote_path(const std::string &remote_path)
    {
        const auto normalized = remove_dot_segments(remote_path.starts_with('/') ? remote_path : "/" + remote_path);
        const auto slash = normalized.rfind('/');

        RemoteTarget target;
        target.name = normalized.substr(slash + 1);
        target.path = slash == 0 ? std::string("/") : normalized.substr(0, slash);
        return target;
    }

    Client::Client(ClientOptions options, HttpTransport &transport)
        : headers_(std::move(options.headers)),
          api_url_(std::move(options.api_url)),
          app_key_(std::move(options.app_key)),
          transport_(transport)
    {
        headers_.set("Content-Type", "application/json; charset=utf-8");
        if (!headers_.has("User-Agent"))
        {
            headers_.set("User-Agent", std::string("fshare-cpp/") + fshare::version());
        }
        while (!api_url_.empty() && api_url_.back() == '/')
        {
            api_url_.pop_back();
        }
    }

    std::string Client::credentials_header(const std::string &username, const std::string &password)
    {
        return "Basic " + encoding::encode_base64(username + ":" + password);
    }

    HttpResponse Client::login()
    {
        const auto authorization = headers_.get("Authorization");
        if (!authorization)
        {
            spdlog::warn("{}: no credentials supplied", to_string(ErrorCode::AuthenticationFailed));
            return unauthorized_response();
        }

        const auto credentials = decode_basic(*authorization);
        const protocol::LoginRequest request{
            .app_key = app_key_,
            .user_email = credentials.user_email,
            .password = credentials.password,
        };
        const auto response = post_json(protocol::kLoginEndpoint, headers_, request);
        const auto issued = decode_body<protocol::LoginResponse>(response, "Login");

        if (issued.token.empty())
        {
            spdlog::warn("{}: login for {} issued no token ({} {})", to_string(ErrorCode::AuthenticationFailed),
                         credentials.user_email, issued.code, issued.msg);
            return unauthorized_response();
        }

        token_ = issued.token;
        headers_.set("Cookie", "session_id=" + issued.session_id + ";");
        spdlog::info("Logged in as {}", credentials.user_email);

        HttpResponse result;
        result.status = issued.code;
        result.reason = issued.msg;
        return result;
    }

    std::optional<HttpResponse> Client::ensure_login()
    {
        if (!token_.empty())
        {
            return std::nullopt;
        }
        auto response = login();
        if (!response.ok())
        {
            return response;
        }
        return std::nullopt;
    }

    HttpHeaders Client::session_headers() const
    {
        // Basic credentials are for the login endpoint only.
        HttpHeaders headers = headers_;
        headers.remove("Authorization");
        return headers;
    }

    HttpResponse Client::post_json(const std::string &endpoint, const HttpHeaders &headers, const nlohmann::json &body)
    {
        HttpRequest request;
        request.method = "POST";
        request.url = api_url_ + endpoint;
        request.headers = headers;
        request.body = to_bytes(body.dump());
        return transport_.send(request);
    }

    std::optional<HttpResponse> Client::redirect_result(const std::string &location, RedirectMode mode) const
    {
        switch (mode)
        {
        case RedirectMode::Manual:
            return make_redirect_response(location, 303);
        case RedirectMode::Error:
            throw Error(ErrorCode::RedirectRequested, "Redirected to " + location);
        case RedirectMode::Follow:
            break;
        }
        return std::nullopt;
    }

    HttpResponse Client::download(const std::string &url, const DownloadOptions &options)
    {
        if (auto failure = ensure_login())
        {
            return std::move(*failure);
        }
        const auto headers = session_headers();

        const auto base = Url::parse(protocol::kFileBaseUrl);
        auto target = Url::resolve(url, *base);
        if (!target)
        {
            throw Error(ErrorCode::InvalidUsage, "Invalid download URL: " + url);
        }
        auto password = target->query_param("password");
        target->remove_query_param("password");

        const protocol::DownloadSessionRequest request{
            .url = target->to_string(),
            .token = token_,
            .password = std::move(password),
        };
        const auto response = post_json(protocol::kDownloadSessionEndpoint, headers, request);
        const auto session = decode_body<protocol::SessionResponse>(response, "Download session");
        if (!session.location)
        {
            spdlog::error("{}: no download location for {} (HTTP {})", to_string(ErrorCode::SessionCreationFailed),
                          request.url, response.status);
            return unauthorized_response();
        }

        if (auto redirect = redirect_result(*session.location, options.redirect))
        {
            return std::move(*redirect);
        }

        if (options.on_location)
        {
            options.on_location(*session.location);
        }

        HttpRequest get;
        get.method = "GET";
        get.url = *session.location;
        get.headers = headers;
        spdlog::info("Downloading {}", get.url);
        return transport_.send(get, options.sink);
    }

    HttpResponse Client::upload(const std::string &remote_path, const UploadOptions &options)
    {
        if (options.source == nullptr)
        {
            throw std::invalid_argument("Upload requires a byte source");
        }
        if (auto failure = ensure_login())
        {
            return std::move(*failure);
        }
        const auto headers = session_headers();

        const auto target = split_remote_path(remote_path);
        if (target.name.empty())
        {
            throw Error(ErrorCode::InvalidUsage, "Remote path does not name a file: " + remote_path);
        }

        const protocol::UploadSessionRequest request{
            .name = target.name,
            .size = options.size,
            .path = target.path,
            .token = token_,
            .secured = options.secured,
        };
        auto response = post_json(protocol::kUploadSessionEndpoint, headers, request);
        const auto session = decode_body<protocol::SessionResponse>(response, "Upload session");
        if (!session.location)
        {
            spdlog::error("{}: no upload location for {}/{} (HTTP {})", to_string(ErrorCode::SessionCreationFailed),
                          target.path, target.name, response.status);
            return unauthorized_response();
        }

        if (auto redirect = redirect_result(*session.location, options.redirect))
        {
            return std::move(*redirect);
        }

        RangeUploader uploader(transport_);
        auto last = uploader.upload(*session.location, headers, options.size, *options.source, options.chunk_size,
                                    options.observer);
        if (!last)
        {
            // Empty input: the session itself is the whole upload.
            return response;
        }
        return std::move(*last);
    }

} // namespace fshare::client
