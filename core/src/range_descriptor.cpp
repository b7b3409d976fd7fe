#include "fshare/range_descriptor.hpp"

#include <charconv>
#include <system_error>

namespace fshare
{

    namespace
    {

        bool parse_u64(std::string_view text, std::uint64_t &value)
        {
            if (text.empty())
            {
                return false;
            }
            const auto *first = text.data();
            const auto *last = text.data() + text.size();
            const auto result = std::from_chars(first, last, value);
            return result.ec == std::errc{} && result.ptr == last;
        }

    } // namespace

    RangeDescriptor make_range(std::uint64_t start, std::uint64_t length, std::uint64_t total) noexcept
    {
        return RangeDescriptor{
            .start = start,
            .end = start + length - 1,
            .total = total,
        };
    }

    std::string to_string(const RangeDescriptor &range)
    {
        return std::to_string(range.start) + "-" + std::to_string(range.end) + "/" + std::to_string(range.total);
    }

    std::string to_content_range(const RangeDescriptor &range)
    {
        return "bytes " + to_string(range);
    }

    std::optional<RangeDescriptor> parse_content_range(std::string_view value)
    {
        constexpr std::string_view kUnit = "bytes ";
        if (value.substr(0, kUnit.size()) != kUnit)
        {
            return std::nullopt;
        }
        value.remove_prefix(kUnit.size());

        const auto dash = value.find('-');
        const auto slash = value.find('/');
        if (dash == std::string_view::npos || slash == std::string_view::npos || slash < dash)
        {
            return std::nullopt;
        }

        RangeDescriptor range{};
        if (!parse_u64(value.substr(0, dash), range.start) ||
            !parse_u64(value.substr(dash + 1, slash - dash - 1), range.end) ||
            !parse_u64(value.substr(slash + 1), range.total))
        {
            return std::nullopt;
        }
        if (range.end < range.start)
        {
            return std::nullopt;
        }
        return range;
    }

} // namespace fshare
