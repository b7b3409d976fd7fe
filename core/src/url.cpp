#include "fshare/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <vector>

namespace fshare
{

    namespace
    {

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            for (auto &ch : result)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return result;
        }

        std::uint16_t scheme_port(std::string_view scheme) noexcept
        {
            return scheme == "https" ? 443 : 80;
        }

        int hex_value(char ch) noexcept
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

        std::vector<std::string_view> split(std::string_view text, char delimiter)
        {
            std::vector<std::string_view> parts;
            std::size_t begin = 0;
            while (true)
            {
                const auto pos = text.find(delimiter, begin);
                if (pos == std::string_view::npos)
                {
                    parts.push_back(text.substr(begin));
                    break;
                }
                parts.push_back(text.substr(begin, pos - begin));
                begin = pos + 1;
            }
            return parts;
        }

        std::string decode_form_component(std::string_view text)
        {
            std::string plus_decoded(text);
            std::replace(plus_decoded.begin(), plus_decoded.end(), '+', ' ');
            return percent_decode(plus_decoded);
        }

        bool has_scheme(std::string_view reference)
        {
            const auto pos = reference.find("://");
            if (pos == std::string_view::npos || pos == 0)
            {
                return false;
            }
            return reference.find_first_of("/?#") > pos;
        }

    } // namespace

    std::optional<Url> Url::parse(std::string_view text)
    {
        const auto scheme_end = text.find("://");
        if (scheme_end == std::string_view::npos)
        {
            return std::nullopt;
        }

        Url url;
        url.scheme = to_lower(text.substr(0, scheme_end));
        if (url.scheme != "http" && url.scheme != "https")
        {
            return std::nullopt;
        }

        auto rest = text.substr(scheme_end + 3);
        const auto fragment = rest.find('#');
        if (fragment != std::string_view::npos)
        {
            rest = rest.substr(0, fragment);
        }

        const auto authority_end = rest.find_first_of("/?");
        auto authority = rest.substr(0, authority_end);
        rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

        const auto at = authority.rfind('@');
        if (at != std::string_view::npos)
        {
            authority.remove_prefix(at + 1);
        }

        std::string_view port_text;
        if (!authority.empty() && authority.front() == '[')
        {
            const auto close = authority.find(']');
            if (close == std::string_view::npos)
            {
                return std::nullopt;
            }
            url.host = std::string(authority.substr(1, close - 1));
            const auto tail = authority.substr(close + 1);
            if (!tail.empty())
            {
                if (tail.front() != ':')
                {
                    return std::nullopt;
                }
                port_text = tail.substr(1);
            }
        }
        else
        {
            const auto colon = authority.find(':');
            url.host = to_lower(authority.substr(0, colon));
            if (colon != std::string_view::npos)
            {
                port_text = authority.substr(colon + 1);
            }
        }
        if (url.host.empty())
        {
            return std::nullopt;
        }

        url.port = scheme_port(url.scheme);
        if (!port_text.empty())
        {
            unsigned int port = 0;
            const auto *last = port_text.data() + port_text.size();
            const auto result = std::from_chars(port_text.data(), last, port);
            if (result.ec != std::errc{} || result.ptr != last || port == 0 || port > 65535)
            {
                return std::nullopt;
            }
            url.port = static_cast<std::uint16_t>(port);
        }

        const auto question = rest.find('?');
        const auto path = rest.substr(0, question);
        url.path = path.empty() ? std::string("/") : remove_dot_segments(path);
        if (question != std::string_view::npos)
        {
            url.query = std::string(rest.substr(question + 1));
        }
        return url;
    }

    std::optional<Url> Url::resolve(std::string_view reference, const Url &base)
    {
        if (has_scheme(reference))
        {
            return parse(reference);
        }
        if (reference.substr(0, 2) == "//")
        {
            return parse(base.scheme + ":" + std::string(reference));
        }

        const auto fragment = reference.find('#');
        if (fragment != std::string_view::npos)
        {
            reference = reference.substr(0, fragment);
        }

        Url url = base;
        if (reference.empty())
        {
            return url;
        }

        const auto question = reference.find('?');
        const auto path = reference.substr(0, question);
        url.query = question == std::string_view::npos ? std::string() : std::string(reference.substr(question + 1));

        if (path.empty())
        {
            return url;
        }
        if (path.front() == '/')
        {
            url.path = remove_dot_segments(path);
        }
        else
        {
            const auto directory = base.path.substr(0, base.path.rfind('/') + 1);
            url.path = remove_dot_segments(directory + std::string(path));
        }
        return url;
    }

    bool Url::default_port() const noexcept
    {
        return port == scheme_port(scheme);
    }

    std::string Url::authority() const
    {
        std::string result = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (!default_port())
        {
            result += ":" + std::to_string(port);
        }
        return result;
    }

    std::string Url::target() const
    {
        return query.empty() ? path : path + "?" + query;
    }

    std::string Url::to_string() const
    {
        return scheme + "://" + authority() + target();
    }

    std::string Url::filename() const
    {
        return path.substr(path.rfind('/') + 1);
    }

    std::optional<std::string> Url::query_param(std::string_view name) const
    {
        if (query.empty())
        {
            return std::nullopt;
        }
        for (const auto part : split(query, '&'))
        {
            const auto equals = part.find('=');
            if (decode_form_component(part.substr(0, equals)) != name)
            {
                continue;
            }
            if (equals == std::string_view::npos)
            {
                return std::string();
            }
            return decode_form_component(part.substr(equals + 1));
        }
        return std::nullopt;
    }

    void Url::remove_query_param(std::string_view name)
    {
        if (query.empty())
        {
            return;
        }
        std::string kept;
        for (const auto part : split(query, '&'))
        {
            if (part.empty() || decode_form_component(part.substr(0, part.find('='))) == name)
            {
                continue;
            }
            if (!kept.empty())
            {
                kept.push_back('&');
            }
            kept.append(part);
        }
        query = std::move(kept);
    }

    std::string percent_decode(std::string_view text)
    {
        std::string result;
        result.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0)
            {
                result.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
                i += 2;
                continue;
            }
            result.push_back(text[i]);
        }
        return result;
    }

    std::string remove_dot_segments(std::string_view path)
    {
        if (path.empty() || path.front() != '/')
        {
            return std::string(path);
        }

        const auto segments = split(path.substr(1), '/');
        std::vector<std::string_view> output;
        bool trailing_slash = false;
        for (std::size_t i = 0; i < segments.size(); ++i)
        {
            const auto segment = segments[i];
            const bool last = i + 1 == segments.size();
            if (segment == ".")
            {
                trailing_slash = trailing_slash || last;
                continue;
            }
            if (segment == "..")
            {
                if (!output.empty())
                {
                    output.pop_back();
                }
                trailing_slash = trailing_slash || last;
                continue;
            }
            output.push_back(segment);
        }

        std::string result = "/";
        for (std::size_t i = 0; i < output.size(); ++i)
        {
            if (i > 0)
            {
                result.push_back('/');
            }
            result.append(output[i]);
        }
        if (trailing_slash && result.back() != '/')
        {
            result.push_back('/');
        }
        return result;
    }

} // namespace fshare
