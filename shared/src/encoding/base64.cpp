#include "chunkup/encoding/base64.hpp"

#include <sodium.h>

namespace chunkup::encoding
{

    namespace
    {
        constexpr int kVariant = sodium_base64_VARIANT_ORIGINAL;
        constexpr const char *kIgnored = " \t\r\n";

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        const auto encoded_size = sodium_base64_encoded_len(data.size(), kVariant);
        std::string encoded(encoded_size, '\0');
        sodium_bin2base64(encoded.data(), encoded.size(), reinterpret_cast<const unsigned char *>(data.data()),
                          data.size(), kVariant);
        // encoded_size counts the terminating NUL.
        encoded.resize(encoded_size - 1);
        return encoded;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        std::vector<std::byte> decoded(input.size() / 4 * 3 + 3);
        std::size_t decoded_size = 0;
        const char *end = nullptr;
        const int status = sodium_base642bin(reinterpret_cast<unsigned char *>(decoded.data()), decoded.size(),
                                             input.data(), input.size(), kIgnored, &decoded_size, &end, kVariant);
        if (status != 0 || end != input.data() + input.size())
        {
            return std::nullopt;
        }
        decoded.resize(decoded_size);
        return decoded;
    }

} // namespace chunkup::encoding
