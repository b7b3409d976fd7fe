#include "fshare/stream_chunker.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>
#include <utility>

namespace fshare
{

    StreamChunker::StreamChunker(ByteSource &source, std::size_t threshold, std::size_t fragment_size)
        : source_(source),
          threshold_(threshold),
          fragment_size_(fragment_size == 0 ? threshold : fragment_size)
    {
        if (threshold_ == 0)
        {
            throw std::invalid_argument("Chunk threshold must be positive");
        }
    }

    std::optional<Chunk> StreamChunker::next()
    {
        if (exhausted_)
        {
            return std::nullopt;
        }

        while (buffer_.size() < threshold_)
        {
            const auto filled = buffer_.size();
            const auto want = std::min(fragment_size_, threshold_ - filled);
            if (buffer_.capacity() < filled + want)
            {
                // Doubling keeps many short reads amortized; never past the threshold.
                buffer_.reserve(std::min(threshold_, std::max(filled + want, buffer_.capacity() * 2)));
            }
            buffer_.resize(filled + want);
            const auto count = source_.read(std::span<std::byte>(buffer_.data() + filled, want));
            buffer_.resize(filled + count);
            if (count == 0)
            {
                exhausted_ = true;
                if (buffer_.empty())
                {
                    return std::nullopt;
                }
                break;
            }
            bytes_consumed_ += count;
        }

        Chunk chunk;
        chunk.swap(buffer_);
        return chunk;
    }

} // namespace fshare
