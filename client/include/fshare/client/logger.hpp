#pragma once

#include <filesystem>
#include <optional>

namespace fshare::client
{

    /**
     * Installs the process-wide spdlog logger: colored output on stderr (stdout
     * carries transfer data and links) plus an append-mode file when `log_path`
     * is given.
     */
    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose);

} // namespace fshare::client
