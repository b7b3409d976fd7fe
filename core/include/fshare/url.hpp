/**
 * fshare - Minimal absolute URL handling for http and https endpoints.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fshare
{

    struct Url
    {
        std::string scheme;
        std::string host;
        std::uint16_t port{};
        std::string path{"/"};
        std::string query;

        // Accepts "scheme://host[:port][/path][?query][#fragment]"; the fragment is dropped.
        static std::optional<Url> parse(std::string_view text);

        // Resolves `reference` against `base` the way a browser resolves a link.
        static std::optional<Url> resolve(std::string_view reference, const Url &base);

        bool secure() const noexcept { return scheme == "https"; }
        bool default_port() const noexcept;

        // Host header value: host, plus ":port" when it is not the scheme default.
        std::string authority() const;
        // Request target: path plus "?query".
        std::string target() const;
        std::string to_string() const;

        // Last path segment, empty for directory URLs.
        std::string filename() const;

        std::optional<std::string> query_param(std::string_view name) const;
        void remove_query_param(std::string_view name);
    };

    std::string percent_decode(std::string_view text);

    std::string remove_dot_segments(std::string_view path);

} // namespace fshare
