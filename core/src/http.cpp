#include "fshare/http.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>

namespace fshare
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        struct ReasonMapping
        {
            int status;
            std::string_view reason;
        };

        constexpr std::array<ReasonMapping, 17> kReasons{{
            {100, "Continue"},
            {200, "OK"},
            {201, "Created"},
            {204, "No Content"},
            {206, "Partial Content"},
            {301, "Moved Permanently"},
            {302, "Found"},
            {303, "See Other"},
            {307, "Temporary Redirect"},
            {308, "Permanent Redirect"},
            {400, "Bad Request"},
            {401, "Unauthorized"},
            {403, "Forbidden"},
            {404, "Not Found"},
            {416, "Range Not Satisfiable"},
            {500, "Internal Server Error"},
            {503, "Service Unavailable"},
        }};

    } // namespace

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept
    {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

    HttpHeaders::HttpHeaders(std::initializer_list<Field> fields)
    {
        for (const auto &field : fields)
        {
            add(field.first, field.second);
        }
    }

    void HttpHeaders::set(const std::string &name, std::string value)
    {
        remove(name);
        fields_.emplace_back(name, std::move(value));
    }

    void HttpHeaders::add(const std::string &name, std::string value)
    {
        fields_.emplace_back(name, std::move(value));
    }

    void HttpHeaders::remove(std::string_view name)
    {
        std::erase_if(fields_, [&](const Field &field)
                      { return iequals(field.first, name); });
    }

    bool HttpHeaders::has(std::string_view name) const
    {
        return std::any_of(fields_.begin(), fields_.end(), [&](const Field &field)
                           { return iequals(field.first, name); });
    }

    std::optional<std::string> HttpHeaders::get(std::string_view name) const
    {
        for (const auto &field : fields_)
        {
            if (iequals(field.first, name))
            {
                return field.second;
            }
        }
        return std::nullopt;
    }

    void HttpHeaders::add_line(std::string_view line)
    {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos)
        {
            return;
        }
        const auto name = trim(line.substr(0, colon));
        if (name.empty())
        {
            return;
        }
        add(std::string(name), std::string(trim(line.substr(colon + 1))));
    }

    std::string HttpResponse::text() const
    {
        return std::string(reinterpret_cast<const char *>(body.data()), body.size());
    }

    std::vector<std::byte> to_bytes(std::string_view text)
    {
        std::vector<std::byte> bytes(text.size());
        if (!text.empty())
        {
            std::memcpy(bytes.data(), text.data(), text.size());
        }
        return bytes;
    }

    std::string_view default_reason(int status) noexcept
    {
        for (const auto &mapping : kReasons)
        {
            if (mapping.status == status)
            {
                return mapping.reason;
            }
        }
        return "";
    }

    HttpResponse make_redirect_response(const std::string &location, int status)
    {
        HttpResponse response;
        response.status = status;
        response.reason = std::string(default_reason(status));
        response.headers.set("Location", location);
        return response;
    }

} // namespace fshare
