#include "chunkup/server/blob_store.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "chunkup/crypto.hpp"

namespace chunkup::server
{

    StorageError::StorageError(chunkup::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        constexpr int kMaxNameAttempts = 16;
        constexpr std::size_t kSuffixLength = 7;

        class FileDescriptor
        {
        public:
            explicit FileDescriptor(int fd) : fd_(fd) {}
            ~FileDescriptor()
            {
                if (fd_ >= 0)
                {
                    ::close(fd_);
                }
            }

            FileDescriptor(const FileDescriptor &) = delete;
            FileDescriptor &operator=(const FileDescriptor &) = delete;

            int get() const noexcept { return fd_; }
            bool valid() const noexcept { return fd_ >= 0; }

            // Reports close() failures, which can carry deferred write errors.
            int close() noexcept
            {
                const int result = ::close(fd_);
                fd_ = -1;
                return result;
            }

        private:
            int fd_;
        };

        std::string errno_message(int error)
        {
            return std::system_category().message(error);
        }

        void write_all(const FileDescriptor &fd, std::span<const std::byte> data, const std::string &ref,
                       chunkup::ErrorCode code)
        {
            const auto *cursor = reinterpret_cast<const char *>(data.data());
            std::size_t remaining = data.size();
            while (remaining > 0)
            {
                const auto written = ::write(fd.get(), cursor, remaining);
                if (written < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    throw StorageError(code, "Failed to write blob " + ref + ": " + errno_message(errno));
                }
                cursor += written;
                remaining -= static_cast<std::size_t>(written);
            }
        }

        void sync_and_close(FileDescriptor &fd, const std::string &ref, chunkup::ErrorCode code)
        {
            if (::fsync(fd.get()) != 0)
            {
                throw StorageError(code, "Failed to sync blob " + ref + ": " + errno_message(errno));
            }
            if (fd.close() != 0)
            {
                throw StorageError(code, "Failed to close blob " + ref + ": " + errno_message(errno));
            }
        }

        std::filesystem::path with_suffix(const std::filesystem::path &path)
        {
            const auto suffix = crypto::random_hex((kSuffixLength + 1) / 2).substr(0, kSuffixLength);
            auto name = path.stem().string() + "_" + suffix + path.extension().string();
            return path.parent_path() / name;
        }

    } // namespace

    FileBlobStore::FileBlobStore(std::filesystem::path root) : root_(std::move(root))
    {
        std::filesystem::create_directories(root_);
    }

    std::filesystem::path FileBlobStore::root() const
    {
        return root_;
    }

    std::filesystem::path FileBlobStore::resolve(const std::string &ref) const
    {
        std::filesystem::path relative = ref;
        if (!ref.empty() && relative.is_absolute())
        {
            relative = relative.lexically_relative("/");
        }

        std::filesystem::path sanitized = root_;
        bool has_component = false;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw StorageError(chunkup::ErrorCode::InvalidPayload, "Path traversal detected in blob key");
            }
            sanitized /= part;
            has_component = true;
        }
        if (!has_component)
        {
            throw StorageError(chunkup::ErrorCode::InvalidPayload, "Empty blob key");
        }
        return sanitized;
    }

    std::string FileBlobStore::create(const std::string &key, std::span<const std::byte> initial_content)
    {
        auto path = resolve(key);
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            throw StorageError(chunkup::ErrorCode::StorageFailure,
                               "Failed to create blob directory " + path.parent_path().string() + ": " + ec.message());
        }

        for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt)
        {
            FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
            if (!fd.valid())
            {
                if (errno == EEXIST)
                {
                    path = with_suffix(resolve(key));
                    continue;
                }
                throw StorageError(chunkup::ErrorCode::StorageFailure,
                                   "Failed to create blob " + key + ": " + errno_message(errno));
            }

            const auto ref = relative_ref(path);
            try
            {
                write_all(fd, initial_content, ref, chunkup::ErrorCode::StorageFailure);
                sync_and_close(fd, ref, chunkup::ErrorCode::StorageFailure);
            }
            catch (const StorageError &)
            {
                std::filesystem::remove(path, ec);
                throw;
            }
            return ref;
        }
        throw StorageError(chunkup::ErrorCode::StorageFailure, "No free blob name available for " + key);
    }

    void FileBlobStore::append(const std::string &ref, std::span<const std::byte> data)
    {
        const auto path = resolve(ref);
        FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC));
        if (!fd.valid())
        {
            throw StorageError(chunkup::ErrorCode::StorageWriteFailed,
                               "Failed to open blob " + ref + ": " + errno_message(errno));
        }
        write_all(fd, data, ref, chunkup::ErrorCode::StorageWriteFailed);
        sync_and_close(fd, ref, chunkup::ErrorCode::StorageWriteFailed);
    }

    void FileBlobStore::remove(const std::string &ref)
    {
        const auto path = resolve(ref);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            throw StorageError(chunkup::ErrorCode::StorageFailure, "Failed to delete blob " + ref + ": " + ec.message());
        }
    }

    bool FileBlobStore::exists(const std::string &ref) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(resolve(ref), ec);
    }

    std::uint64_t FileBlobStore::size(const std::string &ref) const
    {
        std::error_code ec;
        const auto result = std::filesystem::file_size(resolve(ref), ec);
        if (ec)
        {
            throw StorageError(chunkup::ErrorCode::StorageFailure, "Failed to stat blob " + ref + ": " + ec.message());
        }
        return static_cast<std::uint64_t>(result);
    }

    void FileBlobStore::truncate(const std::string &ref, std::uint64_t size)
    {
        const auto path = resolve(ref);
        FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CLOEXEC));
        if (!fd.valid())
        {
            throw StorageError(chunkup::ErrorCode::StorageFailure,
                               "Failed to open blob " + ref + ": " + errno_message(errno));
        }
        if (::ftruncate(fd.get(), static_cast<off_t>(size)) != 0)
        {
            throw StorageError(chunkup::ErrorCode::StorageFailure,
                               "Failed to truncate blob " + ref + ": " + errno_message(errno));
        }
        sync_and_close(fd, ref, chunkup::ErrorCode::StorageFailure);
    }

    std::string FileBlobStore::relative_ref(const std::filesystem::path &path) const
    {
        return path.lexically_relative(root_).generic_string();
    }

} // namespace chunkup::server
