#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fshare::encoding
{

    std::string encode_base64(std::string_view data);

    // std::nullopt on characters outside the standard alphabet or bad padding.
    std::optional<std::string> decode_base64(std::string_view input);

} // namespace fshare::encoding
