/**
 * fshare - Re-slices a ByteSource into threshold-sized chunks.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "fshare/byte_source.hpp"

namespace fshare
{

    using Chunk = std::vector<std::byte>;

    inline constexpr std::size_t kDefaultChunkThreshold = 65536;

    /**
     * Pull-driven chunk sequence over a ByteSource.
     *
     * Every chunk except the last holds at least `threshold` bytes. The last one
     * carries whatever is left when the source runs dry and is never empty. The
     * sequence is single pass: once exhausted, next() returns std::nullopt
     * without touching the source again.
     */
    class StreamChunker
    {
    public:
        explicit StreamChunker(ByteSource &source, std::size_t threshold = kDefaultChunkThreshold,
                               std::size_t fragment_size = kDefaultChunkThreshold);

        std::optional<Chunk> next();

        std::size_t threshold() const noexcept { return threshold_; }
        std::uint64_t bytes_consumed() const noexcept { return bytes_consumed_; }
        bool exhausted() const noexcept { return exhausted_; }

    private:
        ByteSource &source_;
        std::size_t threshold_;
        std::size_t fragment_size_;
        Chunk buffer_;
        std::uint64_t bytes_consumed_{};
        bool exhausted_{};
    };

} // namespace fshare
