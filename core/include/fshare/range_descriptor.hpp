/**
 * fshare - Byte range of one chunk within a whole transfer.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fshare
{

    struct RangeDescriptor
    {
        std::uint64_t start{};
        std::uint64_t end{};
        std::uint64_t total{};

        std::uint64_t length() const noexcept { return end - start + 1; }

        // True when this range closes the declared total.
        bool is_final() const noexcept { return end + 1 == total; }

        bool operator==(const RangeDescriptor &) const = default;
    };

    // `length` must be positive.
    RangeDescriptor make_range(std::uint64_t start, std::uint64_t length, std::uint64_t total) noexcept;

    // "start-end/total", as logged per chunk.
    std::string to_string(const RangeDescriptor &range);

    // "bytes start-end/total", the Content-Range header value.
    std::string to_content_range(const RangeDescriptor &range);

    std::optional<RangeDescriptor> parse_content_range(std::string_view value);

} // namespace fshare
