/**
 * fshare - Blocking HTTP/1.1 transport over asio, with TLS for https URLs.
 */
#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <filesystem>
#include <optional>

#include "fshare/http.hpp"
#include "fshare/url.hpp"

namespace fshare
{

    struct TransportOptions
    {
        bool verify_peer{true};
        std::optional<std::filesystem::path> ca_file;
    };

    class AsioHttpTransport : public HttpTransport
    {
    public:
        AsioHttpTransport();
        explicit AsioHttpTransport(TransportOptions options);

        HttpResponse send(const HttpRequest &request, const BodySink &sink = {}) override;

    private:
        HttpResponse send_plain(const HttpRequest &request, const Url &url, const BodySink &sink);
        HttpResponse send_tls(const HttpRequest &request, const Url &url, const BodySink &sink);

        TransportOptions options_;
        asio::io_context io_context_;
        asio::ssl::context ssl_context_;
    };

} // namespace fshare
