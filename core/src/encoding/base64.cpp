#include "fshare/encoding/base64.hpp"

#include <array>
#include <cstdint>
#include <cctype>

namespace fshare::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(-1);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            table[static_cast<unsigned char>('=')] = -2;
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::string_view data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::uint32_t buffer = 0;
        int bits_collected = 0;
        for (const char ch : data)
        {
            buffer = (buffer << 8u) | static_cast<unsigned char>(ch);
            bits_collected += 8;
            while (bits_collected >= 6)
            {
                bits_collected -= 6;
                output.push_back(kAlphabet[(buffer >> bits_collected) & 0x3Fu]);
            }
        }
        if (bits_collected > 0)
        {
            buffer <<= (6 - bits_collected);
            output.push_back(kAlphabet[buffer & 0x3Fu]);
        }
        while (output.size() % 4 != 0)
        {
            output.push_back('=');
        }
        return output;
    }

    std::optional<std::string> decode_base64(std::string_view input)
    {
        std::string output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int bits_collected = 0;
        std::size_t symbols = 0;
        std::size_t padding = 0;
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isspace(c))
            {
                continue;
            }
            const int value = kDecodeTable[c];
            if (value == -1)
            {
                return std::nullopt;
            }
            if (value == -2)
            {
                ++padding;
                continue;
            }
            if (padding > 0)
            {
                // Data after padding.
                return std::nullopt;
            }
            ++symbols;
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits_collected += 6;
            if (bits_collected >= 8)
            {
                bits_collected -= 8;
                output.push_back(static_cast<char>((accumulator >> bits_collected) & 0xFFu));
            }
        }

        if (symbols % 4 == 1 || padding > 2 || (padding > 0 && (symbols + padding) % 4 != 0))
        {
            return std::nullopt;
        }
        return output;
    }

} // namespace fshare::encoding
