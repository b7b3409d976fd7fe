#include "fshare/asio_transport.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "fshare/error_codes.hpp"

namespace fshare
{

    namespace
    {

        constexpr std::size_t kReadBlock = 64 * 1024;
        constexpr std::size_t kMaxLineBuffer = 1024 * 1024;

        struct ResponseHead
        {
            int status{};
            std::string reason;
            HttpHeaders headers;
        };

        using Deliver = std::function<void(std::span<const std::byte>)>;

        std::string serialize_head(const HttpRequest &request, const Url &url)
        {
            std::string head = request.method + " " + url.target() + " HTTP/1.1\r\n";
            if (!request.headers.has("Host"))
            {
                head += "Host: " + url.authority() + "\r\n";
            }
            for (const auto &[name, value] : request.headers.fields())
            {
                head += name + ": " + value + "\r\n";
            }
            if (!request.headers.has("Content-Length") &&
                (!request.body.empty() || request.method == "POST" || request.method == "PUT"))
            {
                head += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
            }
            head += "\r\n";
            return head;
        }

        std::string take(asio::streambuf &buffer, std::size_t count)
        {
            const auto begin = asio::buffers_begin(buffer.data());
            std::string text(begin, begin + static_cast<std::ptrdiff_t>(count));
            buffer.consume(count);
            return text;
        }

        template <typename Stream>
        std::string read_line(Stream &stream, asio::streambuf &buffer)
        {
            const auto size = asio::read_until(stream, buffer, "\r\n");
            auto line = take(buffer, size);
            line.resize(line.size() - 2);
            return line;
        }

        ResponseHead parse_head(const std::string &text)
        {
            ResponseHead head;
            std::size_t line_end = text.find("\r\n");
            const std::string_view status_line(text.data(), line_end);
            if (status_line.substr(0, 5) != "HTTP/")
            {
                throw Error(ErrorCode::InvalidResponse, "Malformed HTTP status line");
            }
            const auto first_space = status_line.find(' ');
            if (first_space == std::string_view::npos)
            {
                throw Error(ErrorCode::InvalidResponse, "Malformed HTTP status line");
            }
            const auto code_text = status_line.substr(first_space + 1, 3);
            const auto result = std::from_chars(code_text.data(), code_text.data() + code_text.size(), head.status);
            if (result.ec != std::errc{} || head.status < 100 || head.status > 999)
            {
                throw Error(ErrorCode::InvalidResponse, "Malformed HTTP status code");
            }
            if (status_line.size() > first_space + 5)
            {
                head.reason = std::string(status_line.substr(first_space + 5));
            }

            while (line_end + 2 < text.size())
            {
                const auto next = text.find("\r\n", line_end + 2);
                const std::string_view line(text.data() + line_end + 2, next - line_end - 2);
                if (line.empty())
                {
                    break;
                }
                head.headers.add_line(line);
                line_end = next;
            }
            return head;
        }

        template <typename Stream>
        ResponseHead read_head(Stream &stream, asio::streambuf &buffer)
        {
            while (true)
            {
                const auto size = asio::read_until(stream, buffer, "\r\n\r\n");
                auto head = parse_head(take(buffer, size));
                // Interim responses carry no body; the final one follows.
                if (head.status >= 100 && head.status < 200 && head.status != 101)
                {
                    continue;
                }
                return head;
            }
        }

        void drain(asio::streambuf &buffer, std::size_t count, const Deliver &deliver)
        {
            const auto data = buffer.data();
            deliver(std::span<const std::byte>(static_cast<const std::byte *>(data.data()), count));
            buffer.consume(count);
        }

        template <typename Stream>
        void read_exact(Stream &stream, asio::streambuf &buffer, std::uint64_t count, const Deliver &deliver)
        {
            const auto buffered = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), count));
            if (buffered > 0)
            {
                drain(buffer, buffered, deliver);
                count -= buffered;
            }
            std::vector<std::byte> block(static_cast<std::size_t>(std::min<std::uint64_t>(count, kReadBlock)));
            while (count > 0)
            {
                const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(count, block.size()));
                const auto received = stream.read_some(asio::buffer(block.data(), want));
                deliver(std::span<const std::byte>(block.data(), received));
                count -= received;
            }
        }

        bool is_end_of_stream(const asio::error_code &ec)
        {
            return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
        }

        template <typename Stream>
        void read_until_close(Stream &stream, asio::streambuf &buffer, const Deliver &deliver)
        {
            if (buffer.size() > 0)
            {
                drain(buffer, buffer.size(), deliver);
            }
            std::vector<std::byte> block(kReadBlock);
            while (true)
            {
                asio::error_code ec;
                const auto received = stream.read_some(asio::buffer(block), ec);
                if (received > 0)
                {
                    deliver(std::span<const std::byte>(block.data(), received));
                }
                if (is_end_of_stream(ec))
                {
                    return;
                }
                if (ec)
                {
                    throw asio::system_error(ec);
                }
            }
        }

        template <typename Stream>
        void read_chunked(Stream &stream, asio::streambuf &buffer, const Deliver &deliver)
        {
            while (true)
            {
                auto line = read_line(stream, buffer);
                const auto extension = line.find(';');
                if (extension != std::string::npos)
                {
                    line.resize(extension);
                }
                while (!line.empty() && (line.back() == ' ' || line.back() == '\t'))
                {
                    line.pop_back();
                }

                std::uint64_t size = 0;
                const auto result = std::from_chars(line.data(), line.data() + line.size(), size, 16);
                if (line.empty() || result.ec != std::errc{} || result.ptr != line.data() + line.size())
                {
                    throw Error(ErrorCode::InvalidResponse, "Malformed chunk size line: " + line);
                }
                if (size == 0)
                {
                    // Trailer fields end with an empty line.
                    while (!read_line(stream, buffer).empty())
                    {
                    }
                    return;
                }
                read_exact(stream, buffer, size, deliver);
                if (!read_line(stream, buffer).empty())
                {
                    throw Error(ErrorCode::InvalidResponse, "Missing CRLF after chunk data");
                }
            }
        }

        bool has_body(const HttpRequest &request, int status)
        {
            return request.method != "HEAD" && status != 204 && status != 304 && status >= 200;
        }

        template <typename Stream>
        HttpResponse exchange(Stream &stream, const HttpRequest &request, const Url &url, const BodySink &sink)
        {
            const auto head_text = serialize_head(request, url);
            const std::array<asio::const_buffer, 2> outgoing{
                asio::buffer(head_text),
                asio::buffer(request.body),
            };
            asio::write(stream, outgoing);

            asio::streambuf buffer(kMaxLineBuffer);
            auto head = read_head(stream, buffer);

            HttpResponse response;
            response.status = head.status;
            response.reason = std::move(head.reason);
            response.headers = std::move(head.headers);

            const Deliver deliver = [&](std::span<const std::byte> bytes)
            {
                if (sink)
                {
                    sink(bytes);
                }
                else
                {
                    response.body.insert(response.body.end(), bytes.begin(), bytes.end());
                }
            };

            if (!has_body(request, response.status))
            {
                return response;
            }

            const auto transfer_encoding = response.headers.get("Transfer-Encoding");
            const auto content_length = response.headers.get("Content-Length");
            if (transfer_encoding && transfer_encoding->find("chunked") != std::string::npos)
            {
                read_chunked(stream, buffer, deliver);
            }
            else if (content_length)
            {
                std::uint64_t length = 0;
                const auto *last = content_length->data() + content_length->size();
                const auto result = std::from_chars(content_length->data(), last, length);
                if (result.ec != std::errc{} || result.ptr != last)
                {
                    throw Error(ErrorCode::InvalidResponse, "Malformed Content-Length: " + *content_length);
                }
                read_exact(stream, buffer, length, deliver);
            }
            else
            {
                read_until_close(stream, buffer, deliver);
            }
            return response;
        }

    } // namespace

    AsioHttpTransport::AsioHttpTransport()
        : AsioHttpTransport(TransportOptions{}) {}

    AsioHttpTransport::AsioHttpTransport(TransportOptions options)
        : options_(std::move(options)),
          ssl_context_(asio::ssl::context::tls_client)
    {
        if (options_.ca_file)
        {
            ssl_context_.load_verify_file(options_.ca_file->string());
        }
        else
        {
            ssl_context_.set_default_verify_paths();
        }
        ssl_context_.set_verify_mode(options_.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);
    }

    HttpResponse AsioHttpTransport::send(const HttpRequest &request, const BodySink &sink)
    {
        const auto url = Url::parse(request.url);
        if (!url)
        {
            throw Error(ErrorCode::InvalidUsage, "Unsupported URL: " + request.url);
        }

        spdlog::debug("-> {} {} ({} bytes)", request.method, url->to_string(), request.body.size());
        try
        {
            auto response = url->secure() ? send_tls(request, *url, sink) : send_plain(request, *url, sink);
            spdlog::debug("<- {} {} from {}", response.status, response.reason, url->authority());
            return response;
        }
        catch (const asio::system_error &ex)
        {
            throw Error(ErrorCode::NetworkError, request.method + " " + url->authority() + " failed: " + ex.what());
        }
    }

    HttpResponse AsioHttpTransport::send_plain(const HttpRequest &request, const Url &url, const BodySink &sink)
    {
        asio::ip::tcp::resolver resolver(io_context_);
        asio::ip::tcp::socket socket(io_context_);
        asio::connect(socket, resolver.resolve(url.host, std::to_string(url.port)));

        auto response = exchange(socket, request, url, sink);

        asio::error_code ec;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected)
        {
            spdlog::debug("socket shutdown for {}: {}", url.authority(), ec.message());
        }
        return response;
    }

    HttpResponse AsioHttpTransport::send_tls(const HttpRequest &request, const Url &url, const BodySink &sink)
    {
        asio::ip::tcp::resolver resolver(io_context_);
        asio::ssl::stream<asio::ip::tcp::socket> stream(io_context_, ssl_context_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
        {
            throw Error(ErrorCode::NetworkError, "Failed to set TLS server name for " + url.host);
        }
        if (options_.verify_peer)
        {
            stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
        }
        asio::connect(stream.lowest_layer(), resolver.resolve(url.host, std::to_string(url.port)));
        stream.handshake(asio::ssl::stream_base::client);

        auto response = exchange(stream, request, url, sink);

        // The peer may hold a keep-alive connection open, so skip the close_notify wait.
        asio::error_code ec;
        stream.lowest_layer().close(ec);
        if (ec)
        {
            spdlog::debug("socket close for {}: {}", url.authority(), ec.message());
        }
        return response;
    }

} // namespace fshare
