#include "fshare/client/config.hpp"

#include <charconv>
#include <cstdlib>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "fshare/client/range_uploader.hpp"
#include "fshare/protocol.hpp"

namespace fshare::client
{

    namespace
    {

        std::optional<std::string> environment(const char *name)
        {
            const char *value = std::getenv(name);
            if (value == nullptr || *value == '\0')
            {
                return std::nullopt;
            }
            return std::string(value);
        }

        bool is_flag(const std::string &arg, std::initializer_list<const char *> names)
        {
            for (const auto *name : names)
            {
                if (arg == name)
                {
                    return true;
                }
            }
            return false;
        }

        std::size_t parse_chunk_size(const std::string &text)
        {
            std::size_t chunk_size = 0;
            const auto *last = text.data() + text.size();
            const auto result = std::from_chars(text.data(), last, chunk_size);
            if (text.empty() || result.ec != std::errc{} || result.ptr != last || chunk_size == 0)
            {
                throw std::runtime_error("--chunk-size requires a positive number of bytes");
            }
            return chunk_size;
        }

    } // namespace

    const char *usage()
    {
        return "Usage: fshare [options] upload <file> [remote-dir]\n"
               "       fshare [options] download <url-or-id>\n"
               "\n"
               "Options:\n"
               "  -u, --username <email>   Account e-mail (default $FSHARE_USER_EMAIL)\n"
               "  -p, --password <pass>    Account password (default $FSHARE_PASSWORD)\n"
               "  -H, --header <h: v>      Extra request header, repeatable\n"
               "  -L, --location           Follow the issued location and transfer the data\n"
               "  -o, --output <file>      Write the download to a file instead of stdout\n"
               "  -O, --remote-name        Name the download after the remote file\n"
               "      --chunk-size <bytes> Upload chunk size (default 16 MiB)\n"
               "      --app-key <key>      API application key (default $FSHARE_APP_KEY)\n"
               "      --api-url <url>      API base URL\n"
               "      --log <file>         Append logs to a file\n"
               "  -v, --verbose            Debug logging\n"
               "  -h, --help               Show this help\n";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        config.username = environment("FSHARE_USER_EMAIL");
        config.password = environment("FSHARE_PASSWORD");
        config.app_key = environment("FSHARE_APP_KEY").value_or("");
        config.api_url = protocol::kDefaultApiUrl;
        config.chunk_size = kDefaultUploadChunkSize;

        std::vector<std::string> positional;
        int index = 1;
        while (index < argc)
        {
            std::string arg = argv[index++];
            std::optional<std::string> inline_value;
            if (arg.starts_with("--"))
            {
                const auto equals = arg.find('=');
                if (equals != std::string::npos)
                {
                    inline_value = arg.substr(equals + 1);
                    arg.resize(equals);
                }
            }

            const auto value = [&]() -> std::string
            {
                if (inline_value)
                {
                    return *inline_value;
                }
                if (index >= argc)
                {
                    throw std::runtime_error(arg + " requires a value");
                }
                return argv[index++];
            };

            if (is_flag(arg, {"-u", "--username", "--user"}))
            {
                config.username = value();
            }
            else if (is_flag(arg, {"-p", "--password", "--pass"}))
            {
                config.password = value();
            }
            else if (is_flag(arg, {"-H", "--header"}))
            {
                config.headers.push_back(value());
            }
            else if (is_flag(arg, {"-L", "--location"}))
            {
                config.follow_location = true;
            }
            else if (is_flag(arg, {"-o", "--output"}))
            {
                config.output = std::filesystem::path(value());
            }
            else if (is_flag(arg, {"-O", "--remote-name", "--remoteName"}))
            {
                config.remote_name = true;
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = parse_chunk_size(value());
            }
            else if (arg == "--app-key")
            {
                config.app_key = value();
            }
            else if (arg == "--api-url")
            {
                config.api_url = value();
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(value());
            }
            else if (is_flag(arg, {"-v", "--verbose"}))
            {
                config.verbose = true;
            }
            else if (is_flag(arg, {"-h", "--help"}))
            {
                config.show_help = true;
            }
            else if (arg.size() > 1 && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (config.show_help)
        {
            return config;
        }
        if (positional.empty())
        {
            throw std::runtime_error("Missing command (upload or download)");
        }
        config.command = positional.front();
        config.arguments.assign(positional.begin() + 1, positional.end());

        if (config.command == "upload")
        {
            if (config.arguments.empty())
            {
                throw std::runtime_error("Missing input file");
            }
            if (config.arguments.size() > 2)
            {
                throw std::runtime_error("upload takes <file> [remote-dir]");
            }
        }
        else if (config.command == "download")
        {
            if (config.arguments.size() != 1)
            {
                throw std::runtime_error("download takes exactly one <url-or-id>");
            }
        }
        else
        {
            throw std::runtime_error("Unknown command: " + config.command);
        }
        return config;
    }

} // namespace fshare::client
