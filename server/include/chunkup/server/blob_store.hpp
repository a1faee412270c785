#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>

#include "chunkup/error_codes.hpp"

namespace chunkup::server
{

    class StorageError : public std::runtime_error
    {
    public:
        StorageError(chunkup::ErrorCode code, std::string message);

        chunkup::ErrorCode code() const noexcept { return code_; }

    private:
        chunkup::ErrorCode code_;
    };

    // Append-only byte storage addressed by relative keys. Implementations throw StorageError.
    // A write that returns normally is durable.
    class BlobStore
    {
    public:
        virtual ~BlobStore() = default;

        // Stores initial_content under key, or under a free variant of key if it is taken.
        // Returns the reference actually used.
        virtual std::string create(const std::string &key, std::span<const std::byte> initial_content) = 0;

        virtual void append(const std::string &ref, std::span<const std::byte> data) = 0;

        virtual void remove(const std::string &ref) = 0;

        virtual bool exists(const std::string &ref) const = 0;

        virtual std::uint64_t size(const std::string &ref) const = 0;

        virtual void truncate(const std::string &ref, std::uint64_t size) = 0;
    };

    class FileBlobStore final : public BlobStore
    {
    public:
        explicit FileBlobStore(std::filesystem::path root);

        std::filesystem::path root() const;

        std::filesystem::path resolve(const std::string &ref) const;

        std::string create(const std::string &key, std::span<const std::byte> initial_content) override;
        void append(const std::string &ref, std::span<const std::byte> data) override;
        void remove(const std::string &ref) override;
        bool exists(const std::string &ref) const override;
        std::uint64_t size(const std::string &ref) const override;
        void truncate(const std::string &ref, std::uint64_t size) override;

    private:
        std::filesystem::path root_;

        std::string relative_ref(const std::filesystem::path &path) const;
    };

} // namespace chunkup::server
