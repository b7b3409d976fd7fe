#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fshare::client
{

    struct ClientConfig
    {
        std::string command;
        std::vector<std::string> arguments;
        std::optional<std::string> username;
        std::optional<std::string> password;
        std::vector<std::string> headers;
        bool follow_location{};
        std::optional<std::filesystem::path> output;
        bool remote_name{};
        std::size_t chunk_size{};
        std::string app_key;
        std::string api_url;
        std::optional<std::filesystem::path> log_path;
        bool verbose{};
        bool show_help{};
    };

    // Flags override the FSHARE_USER_EMAIL, FSHARE_PASSWORD and FSHARE_APP_KEY environment defaults.
    ClientConfig parse_arguments(int argc, char *argv[]);

    const char *usage();

} // namespace fshare::client
