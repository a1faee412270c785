#include "chunkup/server/session_repository.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkup/server/blob_store.hpp"

namespace chunkup::server
{

    namespace
    {
        constexpr auto kSessionsDir = ".chunkup/sessions";
        constexpr auto kDocumentExtension = ".json";
        constexpr auto kTempExtension = ".json.tmp";

        void fsync_path(const std::filesystem::path &path, int flags)
        {
            const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
            if (fd < 0)
            {
                throw StorageError(chunkup::ErrorCode::InternalError,
                                   "Failed to open " + path.string() + ": " + std::system_category().message(errno));
            }
            const int status = ::fsync(fd);
            const int error = errno;
            ::close(fd);
            if (status != 0)
            {
                throw StorageError(chunkup::ErrorCode::InternalError,
                                   "Failed to sync " + path.string() + ": " + std::system_category().message(error));
            }
        }

    } // namespace

    FileSessionRepository::FileSessionRepository(const std::filesystem::path &storage_root)
        : sessions_dir_(storage_root / kSessionsDir)
    {
        std::filesystem::create_directories(sessions_dir_);
        load_existing();
    }

    std::optional<UploadSession> FileSessionRepository::get(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(id);
        if (it != sessions_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    UploadSession FileSessionRepository::create(const UploadSession &session)
    {
        std::lock_guard lock(mutex_);
        if (sessions_.contains(session.id))
        {
            throw StorageError(chunkup::ErrorCode::InternalError, "Session already exists: " + session.id);
        }
        persist_locked(session);
        sessions_.emplace(session.id, session);
        return session;
    }

    void FileSessionRepository::save(const UploadSession &session)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session.id);
        if (it == sessions_.end())
        {
            throw StorageError(chunkup::ErrorCode::NotFound, "Unknown session: " + session.id);
        }
        persist_locked(session);
        it->second = session;
    }

    std::vector<UploadSession> FileSessionRepository::list() const
    {
        std::lock_guard lock(mutex_);
        std::vector<UploadSession> result;
        result.reserve(sessions_.size());
        for (const auto &[id, session] : sessions_)
        {
            result.push_back(session);
        }
        return result;
    }

    std::filesystem::path FileSessionRepository::directory() const
    {
        return sessions_dir_;
    }

    std::filesystem::path FileSessionRepository::document_path(const std::string &id) const
    {
        return sessions_dir_ / (id + kDocumentExtension);
    }

    void FileSessionRepository::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(sessions_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != kDocumentExtension)
            {
                continue;
            }
            std::ifstream in(entry.path());
            if (!in.is_open())
            {
                spdlog::warn("Skipping unreadable session document {}", entry.path().string());
                continue;
            }
            try
            {
                nlohmann::json json;
                in >> json;
                auto session = json.get<UploadSession>();
                sessions_[session.id] = std::move(session);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Skipping malformed session document {}: {}", entry.path().string(), ex.what());
            }
        }
        spdlog::debug("Loaded {} upload sessions from {}", sessions_.size(), sessions_dir_.string());
    }

    void FileSessionRepository::persist_locked(const UploadSession &session) const
    {
        const auto path = document_path(session.id);
        auto temp_path = path;
        temp_path.replace_extension(kTempExtension);

        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw StorageError(chunkup::ErrorCode::InternalError,
                                   "Failed to open session document " + temp_path.string());
            }
            out << nlohmann::json(session).dump(2);
            out.flush();
            if (!out)
            {
                throw StorageError(chunkup::ErrorCode::InternalError,
                                   "Failed to write session document " + temp_path.string());
            }
        }
        fsync_path(temp_path, O_RDONLY);

        std::error_code ec;
        std::filesystem::rename(temp_path, path, ec);
        if (ec)
        {
            throw StorageError(chunkup::ErrorCode::InternalError,
                               "Failed to replace session document " + path.string() + ": " + ec.message());
        }
        fsync_path(sessions_dir_, O_RDONLY | O_DIRECTORY);
    }

} // namespace chunkup::server
