#include <asio.hpp>

#include <cassert>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "fshare/asio_transport.hpp"
#include "fshare/error_codes.hpp"
#include "fshare/http.hpp"

using namespace fshare;

namespace
{

    struct CapturedRequest
    {
        std::string head;
        std::string body;
    };

    std::size_t declared_length(const std::string &head)
    {
        constexpr std::string_view kField = "Content-Length: ";
        const auto pos = head.find(kField);
        if (pos == std::string::npos)
        {
            return 0;
        }
        return std::stoul(head.substr(pos + kField.size(), head.find("\r\n", pos) - pos - kField.size()));
    }

    // Accepts one connection per canned reply on 127.0.0.1, records the request, answers, then closes.
    class LoopbackServer
    {
    public:
        explicit LoopbackServer(std::vector<std::string> replies)
            : acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
              port_(acceptor_.local_endpoint().port()),
              replies_(std::move(replies))
        {
            thread_ = std::thread([this]
                                  { serve(); });
        }

        ~LoopbackServer()
        {
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        std::string url(const std::string &target) const
        {
            return "http://127.0.0.1:" + std::to_string(port_) + target;
        }

        const std::vector<CapturedRequest> &finish()
        {
            thread_.join();
            assert(failure_.empty());
            return captured_;
        }

    private:
        void serve()
        {
            try
            {
                for (const auto &reply : replies_)
                {
                    asio::ip::tcp::socket socket(io_context_);
                    acceptor_.accept(socket);

                    asio::streambuf buffer;
                    const auto size = asio::read_until(socket, buffer, "\r\n\r\n");
                    const auto begin = asio::buffers_begin(buffer.data());
                    CapturedRequest request;
                    request.head.assign(begin, begin + static_cast<std::ptrdiff_t>(size));
                    buffer.consume(size);

                    const auto length = declared_length(request.head);
                    if (buffer.size() < length)
                    {
                        asio::read(socket, buffer, asio::transfer_exactly(length - buffer.size()));
                    }
                    const auto body = asio::buffers_begin(buffer.data());
                    request.body.assign(body, body + static_cast<std::ptrdiff_t>(length));
                    captured_.push_back(std::move(request));

                    asio::write(socket, asio::buffer(reply));
                    asio::error_code ec;
                    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
                    socket.close(ec);
                }
            }
            catch (const std::exception &ex)
            {
                failure_ = ex.what();
            }
        }

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        unsigned short port_{};
        std::vector<std::string> replies_;
        std::vector<CapturedRequest> captured_;
        std::string failure_;
        std::thread thread_;
    };

    void test_post_with_content_length_reply()
    {
        const std::string json = R"({"url":"https://www.fshare.vn/file/NEW"})";
        LoopbackServer server({"HTTP/1.1 100 Continue\r\n\r\n"
                               "HTTP/1.1 201 Created\r\nContent-Type: application/json\r\nContent-Length: " +
                               std::to_string(json.size()) + "\r\n\r\n" + json});

        HttpRequest request;
        request.method = "POST";
        request.url = server.url("/upload/abc?x=1");
        request.headers.set("Content-Range", "bytes 0-9/10");
        request.body = to_bytes("0123456789");

        AsioHttpTransport transport;
        const auto response = transport.send(request);
        const auto &captured = server.finish();

        assert(response.status == 201);
        assert(response.reason == "Created");
        assert(response.ok());
        assert(response.text() == json);
        assert(response.headers.get("content-type") == std::optional<std::string>("application/json"));

        assert(captured.size() == 1);
        assert(captured[0].head.starts_with("POST /upload/abc?x=1 HTTP/1.1\r\n"));
        assert(captured[0].head.find("Content-Range: bytes 0-9/10\r\n") != std::string::npos);
        assert(captured[0].head.find("Content-Length: 10\r\n") != std::string::npos);
        assert(captured[0].head.find("Host: 127.0.0.1:") != std::string::npos);
        assert(captured[0].body == "0123456789");
    }

    void test_chunked_reply_into_sink()
    {
        LoopbackServer server({"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                               "6\r\nhello \r\n"
                               "5;ext=1\r\nworld\r\n"
                               "0\r\nX-Trailer: done\r\n\r\n"});

        HttpRequest request;
        request.url = server.url("/get/file.bin");

        std::string received;
        std::size_t calls = 0;
        AsioHttpTransport transport;
        const auto response = transport.send(request, [&](std::span<const std::byte> bytes)
                                             {
                                                 ++calls;
                                                 received.append(reinterpret_cast<const char *>(bytes.data()), bytes.size()); });
        const auto &captured = server.finish();

        assert(response.ok());
        assert(response.body.empty());
        assert(received == "hello world");
        assert(calls >= 2);
        assert(captured[0].head.starts_with("GET /get/file.bin HTTP/1.1\r\n"));
        assert(captured[0].head.find("Content-Length") == std::string::npos);
    }

    void test_reply_until_close_and_no_body()
    {
        LoopbackServer server({
            "HTTP/1.0 200 OK\r\nServer: loopback\r\n\r\nstreamed to the end",
            "HTTP/1.1 204 No Content\r\n\r\n",
        });

        AsioHttpTransport transport;
        HttpRequest first;
        first.url = server.url("/");
        const auto streamed = transport.send(first);

        HttpRequest second;
        second.method = "POST";
        second.url = server.url("/empty");
        const auto empty = transport.send(second);
        const auto &captured = server.finish();

        assert(streamed.text() == "streamed to the end");
        assert(empty.status == 204);
        assert(empty.body.empty());
        assert(captured[1].head.find("Content-Length: 0\r\n") != std::string::npos);
    }

    void test_transport_errors()
    {
        AsioHttpTransport transport;

        HttpRequest unsupported;
        unsupported.url = "ftp://127.0.0.1/file";
        bool usage = false;
        try
        {
            transport.send(unsupported);
        }
        catch (const Error &ex)
        {
            usage = ex.code() == ErrorCode::InvalidUsage;
        }
        assert(usage);

        unsigned short port = 0;
        {
            asio::io_context io_context;
            asio::ip::tcp::acceptor acceptor(io_context,
                                             asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
            port = acceptor.local_endpoint().port();
        }
        HttpRequest refused;
        refused.url = "http://127.0.0.1:" + std::to_string(port) + "/";
        bool network = false;
        try
        {
            transport.send(refused);
        }
        catch (const Error &ex)
        {
            network = ex.code() == ErrorCode::NetworkError;
        }
        assert(network);
    }

} // namespace

void run_transport_tests()
{
    test_post_with_content_length_reply();
    test_chunked_reply_into_sink();
    test_reply_until_close_and_no_body();
    test_transport_errors();
}
