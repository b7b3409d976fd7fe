#include "fshare/client/commands.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "fshare/byte_source.hpp"
#include "fshare/error_codes.hpp"
#include "fshare/url.hpp"

namespace fshare::client
{

    namespace
    {

        HttpHeaders build_headers(const ClientConfig &config)
        {
            HttpHeaders headers;
            for (const auto &line : config.headers)
            {
                headers.add_line(line);
            }
            if (config.username && config.password)
            {
                headers.set("Authorization", Client::credentials_header(*config.username, *config.password));
            }
            return headers;
        }

        std::ofstream open_output(const std::filesystem::path &path)
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw Error(ErrorCode::FileIo, "Could not open " + path.string() + " for writing");
            }
            return out;
        }

        std::filesystem::path remote_file_name(const std::string &location)
        {
            const auto url = Url::parse(location);
            const auto name = std::filesystem::path(url ? percent_decode(url->filename()) : std::string()).filename();
            if (name.empty())
            {
                throw Error(ErrorCode::InvalidResponse, "Location has no file name: " + location);
            }
            return name;
        }

    } // namespace

    int run_download(Client &client, const ClientConfig &config, RedirectMode redirect, std::ostream &out,
                     std::ostream &err)
    {
        // The output file is only created once the service has issued a location.
        std::ofstream file;
        std::optional<std::filesystem::path> created;
        std::ostream *target = &out;

        DownloadOptions options;
        options.redirect = redirect;
        options.on_location = [&](const std::string &location)
        {
            std::optional<std::filesystem::path> path;
            if (config.remote_name)
            {
                path = remote_file_name(location);
            }
            else if (config.output)
            {
                path = *config.output;
            }
            if (!path)
            {
                return;
            }
            file = open_output(*path);
            created = *path;
            target = &file;
            spdlog::info("Saving to {}", path->string());
        };
        options.sink = [&](std::span<const std::byte> bytes)
        {
            target->write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!*target)
            {
                throw Error(ErrorCode::FileIo, "Failed to write downloaded data");
            }
        };

        const auto response = client.download(config.arguments.front(), options);
        if (redirect == RedirectMode::Manual && response.location())
        {
            out << *response.location() << std::endl;
            return EXIT_SUCCESS;
        }
        if (!response.ok())
        {
            if (created)
            {
                file.close();
                std::error_code ec;
                std::filesystem::remove(*created, ec);
            }
            err << "Download failed" << std::endl;
            spdlog::error("download ended with {} {}", response.status, response.reason);
            return EXIT_FAILURE;
        }
        target->flush();
        return EXIT_SUCCESS;
    }

    int run_upload(Client &client, const ClientConfig &config, RedirectMode redirect, std::ostream &out,
                   std::ostream &err)
    {
        const std::filesystem::path input = config.arguments.at(0);
        const std::string remote_dir = config.arguments.size() > 1 ? config.arguments.at(1) : "/";

        std::ifstream in(input, std::ios::binary);
        if (!in.is_open() || !std::filesystem::is_regular_file(input))
        {
            throw Error(ErrorCode::FileIo, "Could not open " + input.string() + " for reading");
        }
        StreamByteSource source(in);

        std::string remote_path = remote_dir;
        if (remote_path.empty() || remote_path.back() != '/')
        {
            remote_path.push_back('/');
        }
        remote_path += input.filename().string();

        UploadOptions options;
        options.size = std::filesystem::file_size(input);
        options.source = &source;
        options.redirect = redirect;
        options.chunk_size = config.chunk_size;

        const auto response = client.upload(remote_path, options);
        if (redirect == RedirectMode::Manual && response.location())
        {
            out << *response.location() << std::endl;
            return EXIT_SUCCESS;
        }
        if (!response.ok())
        {
            err << "Upload failed" << std::endl;
            spdlog::error("upload of {} ended with {} {}", input.string(), response.status, response.reason);
            return EXIT_FAILURE;
        }

        const auto body = response.text();
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_object() && json.contains("url") && json["url"].is_string())
        {
            out << json["url"].get<std::string>() << std::endl;
        }
        else
        {
            spdlog::warn("Upload finished but the response carries no url field");
            out << body << std::endl;
        }
        return EXIT_SUCCESS;
    }

    int run_command(const ClientConfig &config, HttpTransport &transport, std::ostream &out, std::ostream &err)
    {
        Client client(
            ClientOptions{
                .headers = build_headers(config),
                .api_url = config.api_url,
                .app_key = config.app_key,
            },
            transport);

        const auto login = client.login();
        if (!login.ok())
        {
            err << "Login failed" << std::endl;
            return EXIT_FAILURE;
        }

        const auto redirect = config.follow_location ? RedirectMode::Follow : RedirectMode::Manual;
        if (config.command == "download")
        {
            return run_download(client, config, redirect, out, err);
        }
        return run_upload(client, config, redirect, out, err);
    }

} // namespace fshare::client
