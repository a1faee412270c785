/**
 * ChunkUp - Digest and identifier helpers built on libsodium (SHA-2, BLAKE2b, randomness)
 * and OpenSSL EVP (MD5, SHA-1).
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace chunkup::crypto
{

    enum class HashFunction : std::uint8_t
    {
        Md5,
        Sha1,
        Sha256,
        Sha512,
        Blake2b
    };

    std::string_view to_string(HashFunction function) noexcept;
    std::optional<HashFunction> hash_function_from_string(std::string_view value) noexcept;

    void ensure_sodium_init();

    // Incremental digest producing lowercase hex. One instance per digest.
    class Hasher
    {
    public:
        explicit Hasher(HashFunction function);
        ~Hasher();

        Hasher(const Hasher &) = delete;
        Hasher &operator=(const Hasher &) = delete;

        void update(std::span<const std::byte> data);
        std::string final_hex();

    private:
        struct State;
        std::unique_ptr<State> state_;
    };

    std::string hash_bytes(HashFunction function, std::span<const std::byte> data);

    std::string hash_text(HashFunction function, std::string_view text);

    std::string hash_stream(HashFunction function, std::istream &input);

    std::string hash_file(HashFunction function, const std::filesystem::path &path);

    std::string random_hex(std::size_t byte_count);

    // Random UUID v4 in canonical lowercase form.
    std::string generate_session_id();

    // Accepts hex digits in either case.
    bool is_session_id(std::string_view value) noexcept;

    // Lowercased id, or nullopt when value is not a session id.
    std::optional<std::string> canonical_session_id(std::string_view value);

} // namespace chunkup::crypto
