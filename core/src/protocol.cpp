#include "fshare/protocol.hpp"

#include <stdexcept>

namespace fshare::protocol
{

    namespace
    {

        // The service sends null for absent values, which json::value() rejects.
        std::string string_or_empty(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return {};
            }
            if (it->is_string())
            {
                return it->get<std::string>();
            }
            return it->dump();
        }

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return std::nullopt;
            }
            return it->is_string() ? it->get<std::string>() : it->dump();
        }

    } // namespace

    void to_json(nlohmann::json &json, const LoginRequest &request)
    {
        json = {
            {"app_key", request.app_key},
            {"user_email", request.user_email},
            {"password", request.password},
        };
    }

    void from_json(const nlohmann::json &json, LoginRequest &request)
    {
        request.app_key = string_or_empty(json, "app_key");
        request.user_email = string_or_empty(json, "user_email");
        request.password = string_or_empty(json, "password");
    }

    void to_json(nlohmann::json &json, const LoginResponse &response)
    {
        json = {
            {"code", response.code},
            {"msg", response.msg},
            {"token", response.token},
            {"session_id", response.session_id},
        };
    }

    void from_json(const nlohmann::json &json, LoginResponse &response)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Login response is not a JSON object");
        }
        const auto code = json.find("code");
        if (code != json.end() && code->is_number_integer())
        {
            response.code = code->get<int>();
        }
        else if (code != json.end() && code->is_string())
        {
            response.code = std::stoi(code->get<std::string>());
        }
        else
        {
            response.code = 0;
        }
        response.msg = string_or_empty(json, "msg");
        response.token = string_or_empty(json, "token");
        response.session_id = string_or_empty(json, "session_id");
    }

    void to_json(nlohmann::json &json, const UploadSessionRequest &request)
    {
        json = {
            {"name", request.name},
            {"size", std::to_string(request.size)},
            {"path", request.path},
            {"token", request.token},
            {"secured", request.secured ? 1 : 0},
        };
    }

    void from_json(const nlohmann::json &json, UploadSessionRequest &request)
    {
        request.name = json.at("name").get<std::string>();
        const auto &size = json.at("size");
        request.size = size.is_string() ? std::stoull(size.get<std::string>()) : size.get<std::uint64_t>();
        request.path = json.value("path", std::string{"/"});
        request.token = json.value("token", std::string{});
        request.secured = json.value("secured", 1) != 0;
    }

    void to_json(nlohmann::json &json, const DownloadSessionRequest &request)
    {
        json = {
            {"url", request.url},
            {"token", request.token},
            {"password", nullptr},
        };
        if (request.password)
        {
            json["password"] = *request.password;
        }
    }

    void from_json(const nlohmann::json &json, DownloadSessionRequest &request)
    {
        request.url = json.at("url").get<std::string>();
        request.token = json.value("token", std::string{});
        request.password = optional_string(json, "password");
    }

    void to_json(nlohmann::json &json, const SessionResponse &response)
    {
        json = nlohmann::json::object();
        if (response.location)
        {
            json["location"] = *response.location;
        }
    }

    void from_json(const nlohmann::json &json, SessionResponse &response)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Session response is not a JSON object");
        }
        response.location = optional_string(json, "location");
        if (response.location && response.location->empty())
        {
            response.location.reset();
        }
    }

} // namespace fshare::protocol
