#include "fshare/byte_source.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "fshare/error_codes.hpp"

namespace fshare
{

    StreamByteSource::StreamByteSource(std::istream &input)
        : input_(input) {}

    std::size_t StreamByteSource::read(std::span<std::byte> out)
    {
        if (out.empty() || input_.eof())
        {
            return 0;
        }
        input_.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(out.size()));
        const auto count = static_cast<std::size_t>(input_.gcount());
        if (input_.bad())
        {
            throw Error(ErrorCode::FileIo, "Failed to read from input stream");
        }
        return count;
    }

    MemoryByteSource::MemoryByteSource(std::vector<std::byte> data, std::size_t max_fragment)
        : data_(std::move(data)), max_fragment_(max_fragment) {}

    MemoryByteSource::MemoryByteSource(std::string_view data, std::size_t max_fragment)
        : max_fragment_(max_fragment)
    {
        data_.resize(data.size());
        if (!data.empty())
        {
            std::memcpy(data_.data(), data.data(), data.size());
        }
    }

    std::size_t MemoryByteSource::read(std::span<std::byte> out)
    {
        ++reads_;
        auto count = std::min(out.size(), remaining());
        if (max_fragment_ > 0)
        {
            count = std::min(count, max_fragment_);
        }
        std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), count, out.begin());
        offset_ += count;
        return count;
    }

} // namespace fshare
