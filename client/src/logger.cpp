#include "fshare/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace fshare::client
{

    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (log_path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("fshare", sinks.begin(), sinks.end());
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace fshare::client
