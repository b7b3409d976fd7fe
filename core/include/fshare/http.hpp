/**
 * fshare - HTTP/1.1 message model and the transport seam used by the client.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fshare
{

    /**
     * Ordered header list with case-insensitive names. Order of insertion is kept
     * on the wire.
     */
    class HttpHeaders
    {
    public:
        using Field = std::pair<std::string, std::string>;

        HttpHeaders() = default;
        HttpHeaders(std::initializer_list<Field> fields);

        // Replaces every field named `name` with a single one.
        void set(const std::string &name, std::string value);
        void add(const std::string &name, std::string value);
        void remove(std::string_view name);

        bool has(std::string_view name) const;
        std::optional<std::string> get(std::string_view name) const;

        // Parses "Name: value" (the space after the colon is optional).
        void add_line(std::string_view line);

        const std::vector<Field> &fields() const noexcept { return fields_; }
        bool empty() const noexcept { return fields_.empty(); }
        std::size_t size() const noexcept { return fields_.size(); }

    private:
        std::vector<Field> fields_;
    };

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        HttpHeaders headers;
        std::vector<std::byte> body;
    };

    struct HttpResponse
    {
        int status{};
        std::string reason;
        HttpHeaders headers;
        std::vector<std::byte> body;

        bool ok() const noexcept { return status >= 200 && status <= 299; }
        std::optional<std::string> location() const { return headers.get("Location"); }
        std::string text() const;
    };

    std::vector<std::byte> to_bytes(std::string_view text);

    std::string_view default_reason(int status) noexcept;

    // Empty-bodied 3xx response pointing at `location`.
    HttpResponse make_redirect_response(const std::string &location, int status = 303);

    // Receives body bytes as they arrive; when set, HttpResponse::body stays empty.
    using BodySink = std::function<void(std::span<const std::byte>)>;

    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        /**
         * Performs one request/response round trip.
         * Throws fshare::Error (NetworkError, InvalidResponse) when no response
         * could be obtained; HTTP error statuses are returned, not thrown.
         */
        virtual HttpResponse send(const HttpRequest &request, const BodySink &sink = {}) = 0;
    };

} // namespace fshare
