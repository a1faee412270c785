/**
 * ChunkUp - Upload session engine.
 *
 * Sole mutator of upload sessions. Every operation on a session id runs under that id's
 * lock from SessionLocks, so at most one append, resume or expiry step is in flight per
 * session while different sessions proceed independently.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chunkup/server/blob_store.hpp"
#include "chunkup/server/config.hpp"
#include "chunkup/server/retry_policy.hpp"
#include "chunkup/server/session_locks.hpp"
#include "chunkup/server/session_repository.hpp"
#include "chunkup/server/upload_error.hpp"
#include "chunkup/server/upload_session.hpp"

namespace chunkup::server
{

    struct StartRequest
    {
        std::optional<std::string> session_id;
        std::optional<std::uint64_t> offset;
        std::optional<std::string> file_name;
        std::optional<std::uint64_t> file_size;
        std::optional<std::string> hash_function;
        std::optional<std::string> owner;
    };

    struct AppendRequest
    {
        std::string session_id;
        std::uint64_t offset{};
        std::vector<std::byte> data;
        std::string chunk_hash;
        std::optional<std::string> final_hash;
    };

    class SessionEngine
    {
    public:
        SessionEngine(const UploadConfig &config, BlobStore &blobs, SessionRepository &repository);

        // Creates a session, or looks one up when session_id is given. A lookup without an
        // offset has no side effects; with one it refreshes the session and reconciles its blob.
        Outcome<UploadSession> start_or_resume(const StartRequest &request);

        Outcome<UploadSession> append_chunk(const AppendRequest &request);

        Outcome<UploadSession> find(const std::string &session_id) const;

        // Fails every non-terminal session untouched for longer than max_idle. Returns the count.
        std::size_t expire_idle(std::chrono::seconds max_idle);

        const UploadConfig &config() const noexcept { return config_; }

    private:
        const UploadConfig &config_;
        BlobStore &blobs_;
        SessionRepository &repository_;
        RetryPolicy retry_policy_;
        SessionLocks locks_;

        Outcome<UploadSession> resume(const StartRequest &request);
        Outcome<UploadSession> create(const StartRequest &request);
        Outcome<UploadSession> append_locked(const std::string &id, const AppendRequest &request);

        Outcome<UploadSession> transient_failure(UploadSession session, chunkup::ErrorCode code,
                                                 const std::string &detail, const std::string &message);
        Outcome<UploadSession> fail(UploadSession session, chunkup::ErrorCode code, std::string message);
        void mark_failed(UploadSession &session, const std::string &message);

        // Trims bytes past the committed offset. Returns why the blob is unusable, if it is.
        std::optional<std::string> reconcile_blob(const UploadSession &session);
        std::optional<std::string> release_blob(UploadSession &session) const;
        void remove_blob(const std::string &session_id, const std::string &ref);
    };

} // namespace chunkup::server
