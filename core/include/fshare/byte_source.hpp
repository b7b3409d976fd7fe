/**
 * fshare - Single-pass byte producers consumed by the upload path.
 */
#pragma once

#include <cstddef>
#include <istream>
#include <span>
#include <string_view>
#include <vector>

namespace fshare
{

    /**
     * A finite, non-rewindable stream of bytes, read exactly once and in order.
     */
    class ByteSource
    {
    public:
        virtual ~ByteSource() = default;

        /**
         * Reads up to out.size() bytes into out.
         * Returns 0 once the source is exhausted. Throws fshare::Error on I/O errors.
         */
        virtual std::size_t read(std::span<std::byte> out) = 0;
    };

    class StreamByteSource : public ByteSource
    {
    public:
        explicit StreamByteSource(std::istream &input);

        std::size_t read(std::span<std::byte> out) override;

    private:
        std::istream &input_;
    };

    class MemoryByteSource : public ByteSource
    {
    public:
        // max_fragment == 0 hands out as much as the caller asks for.
        explicit MemoryByteSource(std::vector<std::byte> data, std::size_t max_fragment = 0);
        explicit MemoryByteSource(std::string_view data, std::size_t max_fragment = 0);

        std::size_t read(std::span<std::byte> out) override;

        std::size_t reads() const noexcept { return reads_; }
        std::size_t remaining() const noexcept { return data_.size() - offset_; }

    private:
        std::vector<std::byte> data_;
        std::size_t max_fragment_{};
        std::size_t offset_{};
        std::size_t reads_{};
    };

} // namespace fshare
