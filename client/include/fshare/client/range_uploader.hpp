#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "fshare/byte_source.hpp"
#include "fshare/http.hpp"
#include "fshare/range_descriptor.hpp"

namespace fshare::client
{

    // 65536 * 1024 / 4: the slice size the upload endpoint is fed with.
    inline constexpr std::size_t kDefaultUploadChunkSize = 16 * 1024 * 1024;

    using ChunkObserver = std::function<void(const RangeDescriptor &, const HttpResponse &)>;

    /**
     * Streams a ByteSource to an upload session location as a sequence of
     * Content-Range addressed POST requests.
     *
     * Chunks go out strictly one after another. The first non-2xx response ends
     * the transfer and is returned; nothing is retried and bytes the service
     * already accepted are left as they are.
     */
    class RangeUploader
    {
    public:
        explicit RangeUploader(HttpTransport &transport);

        /**
         * Returns the response of the last chunk sent, or std::nullopt when the
         * source produced no bytes at all. `session_headers` must not carry
         * credentials meant for the API; any Authorization field is dropped.
         */
        std::optional<HttpResponse> upload(const std::string &location, const HttpHeaders &session_headers,
                                           std::uint64_t total_size, ByteSource &source,
                                           std::size_t chunk_size = kDefaultUploadChunkSize,
                                           const ChunkObserver &observer = {});

        static std::uint64_t expected_chunks(std::uint64_t total_size, std::size_t chunk_size) noexcept;

    private:
        HttpTransport &transport_;
    };

} // namespace fshare::client
