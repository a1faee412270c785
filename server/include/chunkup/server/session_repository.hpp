#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkup/server/upload_session.hpp"

namespace chunkup::server
{

    // Durable store of session documents. Failures are reported as StorageError.
    class SessionRepository
    {
    public:
        virtual ~SessionRepository() = default;

        virtual std::optional<UploadSession> get(const std::string &id) const = 0;

        // Rejects ids that already exist.
        virtual UploadSession create(const UploadSession &session) = 0;

        // Replaces every field of the stored document in one atomic step.
        virtual void save(const UploadSession &session) = 0;

        virtual std::vector<UploadSession> list() const = 0;
    };

    // One JSON document per session below <root>/.chunkup/sessions.
    class FileSessionRepository final : public SessionRepository
    {
    public:
        explicit FileSessionRepository(const std::filesystem::path &storage_root);

        std::optional<UploadSession> get(const std::string &id) const override;
        UploadSession create(const UploadSession &session) override;
        void save(const UploadSession &session) override;
        std::vector<UploadSession> list() const override;

        std::filesystem::path directory() const;

    private:
        std::filesystem::path sessions_dir_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadSession> sessions_;

        std::filesystem::path document_path(const std::string &id) const;

        void load_existing();
        void persist_locked(const UploadSession &session) const;
    };

} // namespace chunkup::server
