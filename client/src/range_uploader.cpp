#include "fshare/client/range_uploader.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "fshare/error_codes.hpp"
#include "fshare/stream_chunker.hpp"

namespace fshare::client
{

    namespace
    {

        HttpHeaders chunk_headers(const HttpHeaders &session_headers, const RangeDescriptor &range)
        {
            HttpHeaders headers = session_headers;
            headers.remove("Authorization");
            headers.set("Accept", "*/*");
            headers.set("Accept-Language", "en-US,en;q=0.5");
            headers.set("Accept-Encoding", "gzip, deflate, br");
            headers.set("Content-Length", std::to_string(range.length()));
            headers.set("Content-Range", to_content_range(range));
            headers.set("Connection", "keep-alive");
            return headers;
        }

    } // namespace

    RangeUploader::RangeUploader(HttpTransport &transport)
        : transport_(transport) {}

    std::uint64_t RangeUploader::expected_chunks(std::uint64_t total_size, std::size_t chunk_size) noexcept
    {
        if (chunk_size == 0)
        {
            return 0;
        }
        return (total_size + chunk_size - 1) / chunk_size;
    }

    std::optional<HttpResponse> RangeUploader::upload(const std::string &location, const HttpHeaders &session_headers,
                                                      std::uint64_t total_size, ByteSource &source,
                                                      std::size_t chunk_size, const ChunkObserver &observer)
    {
        StreamChunker chunker(source, chunk_size);
        spdlog::info("Uploading {} chunks of approximately {} bytes each...", expected_chunks(total_size, chunk_size),
                     chunk_size);

        std::uint64_t bytes_sent = 0;
        std::optional<HttpResponse> last_response;
        std::optional<RangeDescriptor> last_range;

        while (auto chunk = chunker.next())
        {
            const auto range = make_range(bytes_sent, chunk->size(), total_size);
            if (range.end >= total_size)
            {
                spdlog::warn("Chunk {} runs past the declared size of {} bytes", to_string(range), total_size);
            }

            HttpRequest request;
            request.method = "POST";
            request.url = location;
            request.headers = chunk_headers(session_headers, range);
            request.body = std::move(*chunk);

            auto response = transport_.send(request);
            bytes_sent += range.length();
            last_range = range;

            if (observer)
            {
                observer(range, response);
            }

            if (!response.ok())
            {
                spdlog::error("{}: chunk {} rejected with {} {}", to_string(ErrorCode::ChunkTransferFailed),
                              to_string(range), response.status, response.reason);
                return response;
            }
            spdlog::info("Uploaded chunk {}", to_string(range));
            last_response = std::move(response);
        }

        if (last_range && !last_range->is_final())
        {
            spdlog::warn("Source ended after {} of {} declared bytes", bytes_sent, total_size);
        }
        return last_response;
    }

} // namespace fshare::client
