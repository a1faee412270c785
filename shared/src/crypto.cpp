#include "chunkup/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>
#include <sodium.h>

namespace chunkup::crypto
{

    namespace
    {

        struct HashFunctionMapping
        {
            HashFunction function;
            std::string_view label;
        };

        constexpr std::array<HashFunctionMapping, 5> kHashFunctionMappings{{
            {HashFunction::Md5, "MD5"},
            {HashFunction::Sha1, "SHA1"},
            {HashFunction::Sha256, "SHA256"},
            {HashFunction::Sha512, "SHA512"},
            {HashFunction::Blake2b, "BLAKE2B"},
        }};

        using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

        const EVP_MD *evp_digest_for(HashFunction function)
        {
            switch (function)
            {
            case HashFunction::Md5:
                return EVP_md5();
            case HashFunction::Sha1:
                return EVP_sha1();
            default:
                return nullptr;
            }
        }

        bool is_hex_digit(char ch) noexcept
        {
            return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
        }

    } // namespace

    std::string_view to_string(HashFunction function) noexcept
    {
        for (const auto &mapping : kHashFunctionMappings)
        {
            if (mapping.function == function)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<HashFunction> hash_function_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kHashFunctionMappings)
        {
            if (mapping.label == value)
            {
                return mapping.function;
            }
        }
        return std::nullopt;
    }

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    struct Hasher::State
    {
        HashFunction function;
        crypto_hash_sha256_state sha256{};
        crypto_hash_sha512_state sha512{};
        crypto_generichash_state blake2b{};
        EvpMdCtxPtr evp{nullptr, EVP_MD_CTX_free};
        bool finished{false};
    };

    Hasher::Hasher(HashFunction function) : state_(std::make_unique<State>())
    {
        ensure_initialized_once();
        state_->function = function;
        switch (function)
        {
        case HashFunction::Md5:
        case HashFunction::Sha1:
            state_->evp.reset(EVP_MD_CTX_new());
            if (!state_->evp || EVP_DigestInit_ex(state_->evp.get(), evp_digest_for(function), nullptr) != 1)
            {
                throw std::runtime_error("EVP_DigestInit_ex failed");
            }
            break;
        case HashFunction::Sha256:
            if (crypto_hash_sha256_init(&state_->sha256) != 0)
            {
                throw std::runtime_error("crypto_hash_sha256_init failed");
            }
            break;
        case HashFunction::Sha512:
            if (crypto_hash_sha512_init(&state_->sha512) != 0)
            {
                throw std::runtime_error("crypto_hash_sha512_init failed");
            }
            break;
        case HashFunction::Blake2b:
            if (crypto_generichash_init(&state_->blake2b, nullptr, 0, crypto_generichash_BYTES) != 0)
            {
                throw std::runtime_error("crypto_generichash_init failed");
            }
            break;
        }
    }

    Hasher::~Hasher() = default;

    void Hasher::update(std::span<const std::byte> data)
    {
        if (state_->finished)
        {
            throw std::logic_error("Hasher already finalized");
        }
        if (data.empty())
        {
            return;
        }
        const auto *bytes = reinterpret_cast<const unsigned char *>(data.data());
        int status = 0;
        switch (state_->function)
        {
        case HashFunction::Md5:
        case HashFunction::Sha1:
            status = EVP_DigestUpdate(state_->evp.get(), bytes, data.size()) == 1 ? 0 : -1;
            break;
        case HashFunction::Sha256:
            status = crypto_hash_sha256_update(&state_->sha256, bytes, data.size());
            break;
        case HashFunction::Sha512:
            status = crypto_hash_sha512_update(&state_->sha512, bytes, data.size());
            break;
        case HashFunction::Blake2b:
            status = crypto_generichash_update(&state_->blake2b, bytes, data.size());
            break;
        }
        if (status != 0)
        {
            throw std::runtime_error("Digest update failed for " + std::string(to_string(state_->function)));
        }
    }

    std::string Hasher::final_hex()
    {
        if (state_->finished)
        {
            throw std::logic_error("Hasher already finalized");
        }
        state_->finished = true;

        std::vector<unsigned char> digest;
        int status = 0;
        switch (state_->function)
        {
        case HashFunction::Md5:
        case HashFunction::Sha1:
        {
            digest.resize(EVP_MAX_MD_SIZE);
            unsigned int length = 0;
            status = EVP_DigestFinal_ex(state_->evp.get(), digest.data(), &length) == 1 ? 0 : -1;
            digest.resize(length);
            break;
        }
        case HashFunction::Sha256:
            digest.resize(crypto_hash_sha256_BYTES);
            status = crypto_hash_sha256_final(&state_->sha256, digest.data());
            break;
        case HashFunction::Sha512:
            digest.resize(crypto_hash_sha512_BYTES);
            status = crypto_hash_sha512_final(&state_->sha512, digest.data());
            break;
        case HashFunction::Blake2b:
            digest.resize(crypto_generichash_BYTES);
            status = crypto_generichash_final(&state_->blake2b, digest.data(), digest.size());
            break;
        }
        if (status != 0)
        {
            throw std::runtime_error("Digest finalization failed for " + std::string(to_string(state_->function)));
        }
        return to_hex(digest);
    }

    std::string hash_bytes(HashFunction function, std::span<const std::byte> data)
    {
        Hasher hasher(function);
        hasher.update(data);
        return hasher.final_hex();
    }

    std::string hash_text(HashFunction function, std::string_view text)
    {
        return hash_bytes(function, std::as_bytes(std::span(text.data(), text.size())));
    }

    std::string hash_stream(HashFunction function, std::istream &input)
    {
        Hasher hasher(function);
        std::vector<char> buffer(64 * 1024);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hasher.update(std::as_bytes(std::span(buffer.data(), read_count)));
            }
        }
        return hasher.final_hex();
    }

    std::string hash_file(HashFunction function, const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(function, file);
    }

    std::string random_hex(std::size_t byte_count)
    {
        ensure_initialized_once();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return to_hex(bytes);
    }

    std::string generate_session_id()
    {
        ensure_initialized_once();
        std::array<unsigned char, 16> bytes{};
        randombytes_buf(bytes.data(), bytes.size());
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        const auto hex = to_hex(bytes);
        std::string id;
        id.reserve(36);
        id.append(hex, 0, 8).push_back('-');
        id.append(hex, 8, 4).push_back('-');
        id.append(hex, 12, 4).push_back('-');
        id.append(hex, 16, 4).push_back('-');
        id.append(hex, 20, 12);
        return id;
    }

    bool is_session_id(std::string_view value) noexcept
    {
        if (value.size() != 36)
        {
            return false;
        }
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            if (i == 8 || i == 13 || i == 18 || i == 23)
            {
                if (value[i] != '-')
                {
                    return false;
                }
            }
            else if (!is_hex_digit(value[i]))
            {
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> canonical_session_id(std::string_view value)
    {
        if (!is_session_id(value))
        {
            return std::nullopt;
        }
        std::string id(value);
        for (auto &ch : id)
        {
            if (ch >= 'A' && ch <= 'F')
            {
                ch = static_cast<char>(ch - 'A' + 'a');
            }
        }
        return id;
    }

} // namespace chunkup::crypto
