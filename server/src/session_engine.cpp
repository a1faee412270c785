#include "chunkup/server/session_engine.hpp"

#include <span>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "chunkup/crypto.hpp"
#include "chunkup/hash_chain.hpp"
#include "chunkup/server/file_naming.hpp"
#include "chunkup/server/size_guard.hpp"
#include "chunkup/size_format.hpp"

namespace chunkup::server
{

    namespace
    {
        constexpr auto kInvalidSessionId = "Invalid session id";
        constexpr auto kMissingChunkHash = "Chunk hash is required";
        constexpr auto kUnknownSession = "File does not exist";
        constexpr auto kNotResumable = "File does not exist or not in a valid state";
        constexpr auto kOffsetMismatch = "Offset does not match";
        constexpr auto kFieldRequired = "This field is required";
        constexpr auto kInvalidHashFunction = "Invalid hash function";
        constexpr auto kMaximumExceeded = "File size exceeded the maximum allowed size";
        constexpr auto kChunkCorrupted = "Sent chunk is corrupted. Please retry uploading the chunk.";
        constexpr auto kStoreFailed = "Failed to store the chunk. Please retry uploading the chunk.";
        constexpr auto kFileCorrupted = "File is corrupted";
        constexpr auto kOriginalExceeded = "File size exceeded the original file size";
        constexpr auto kPersistFailed = "Failed to persist the upload session";
        constexpr auto kExpired = "Upload expired after a period of inactivity";
        constexpr auto kBlobMissing = "Stored file is missing";
        constexpr auto kBlobTruncated = "Stored file is shorter than the uploaded size";

    } // namespace

    SessionEngine::SessionEngine(const UploadConfig &config, BlobStore &blobs, SessionRepository &repository)
        : config_(config), blobs_(blobs), repository_(repository), retry_policy_(config.retry_budget) {}

    Outcome<UploadSession> SessionEngine::start_or_resume(const StartRequest &request)
    {
        try
        {
            if (request.session_id)
            {
                return resume(request);
            }
            return create(request);
        }
        catch (const StorageError &ex)
        {
            spdlog::error("Start request failed in storage: {}", ex.what());
            return make_error(ex.code(), ex.what());
        }
    }

    Outcome<UploadSession> SessionEngine::resume(const StartRequest &request)
    {
        const auto canonical = crypto::canonical_session_id(*request.session_id);
        if (!canonical)
        {
            return make_error(chunkup::ErrorCode::InvalidPayload, kInvalidSessionId);
        }
        const auto &id = *canonical;

        auto guard = locks_.acquire(id);
        auto loaded = repository_.get(id);
        if (!loaded || (loaded->owner && loaded->owner != request.owner))
        {
            return make_error(chunkup::ErrorCode::NotFound, kUnknownSession);
        }
        if (!request.offset)
        {
            return std::move(*loaded);
        }

        auto session = std::move(*loaded);
        if (*request.offset != session.offset)
        {
            return make_error(chunkup::ErrorCode::OffsetMismatch, kOffsetMismatch);
        }
        if (is_terminal(session.status))
        {
            return session;
        }
        if (const auto lost = reconcile_blob(session))
        {
            return fail(std::move(session), chunkup::ErrorCode::BlobLost, *lost);
        }
        session.updated_at = Clock::now();
        repository_.save(session);
        spdlog::info("Resumed upload {} at offset {}", session.id, session.offset);
        return session;
    }

    Outcome<UploadSession> SessionEngine::create(const StartRequest &request)
    {
        std::string missing;
        for (const auto &[field, present] : {std::pair{"file_name", request.file_name.has_value()},
                                             std::pair{"file_size", request.file_size.has_value()}})
        {
            if (!present)
            {
                missing += missing.empty() ? "" : "; ";
                missing += std::string(field) + ": " + kFieldRequired;
            }
        }
        if (!missing.empty())
        {
            return make_error(chunkup::ErrorCode::InvalidPayload, missing);
        }

        auto function = config_.hash_function;
        if (request.hash_function)
        {
            const auto parsed = crypto::hash_function_from_string(*request.hash_function);
            if (!parsed)
            {
                return make_error(chunkup::ErrorCode::InvalidPayload, kInvalidHashFunction);
            }
            function = *parsed;
        }

        std::string file_name;
        try
        {
            file_name = validate_file_name(*request.file_name);
        }
        catch (const std::invalid_argument &ex)
        {
            return make_error(chunkup::ErrorCode::InvalidPayload, ex.what());
        }

        if (config_.max_file_size && *request.file_size > *config_.max_file_size)
        {
            return make_error(chunkup::ErrorCode::FileTooLarge,
                              "File size is greater than the maximum allowed file size, " +
                                  human_readable_size(*config_.max_file_size) + ".");
        }

        const auto now = Clock::now();
        UploadSession session;
        session.id = crypto::generate_session_id();
        session.owner = request.owner;
        session.original_file_name = std::move(file_name);
        session.original_file_size = *request.file_size;
        session.max_file_size = config_.max_file_size;
        session.chunk_size = config_.chunk_size;
        session.hash_function = function;
        session.retry_budget = retry_policy_.initial_budget();
        session.created_at = now;
        session.updated_at = now;

        auto created = repository_.create(session);
        spdlog::info("Created upload {} for '{}' ({}, {})", created.id, created.original_file_name,
                     human_readable_size(created.original_file_size), crypto::to_string(created.hash_function));
        return created;
    }

    Outcome<UploadSession> SessionEngine::append_chunk(const AppendRequest &request)
    {
        const auto id = crypto::canonical_session_id(request.session_id);
        if (!id)
        {
            return make_error(chunkup::ErrorCode::InvalidPayload, kInvalidSessionId);
        }
        if (request.chunk_hash.empty())
        {
            return make_error(chunkup::ErrorCode::InvalidPayload, kMissingChunkHash);
        }

        auto guard = locks_.acquire(*id);
        try
        {
            return append_locked(*id, request);
        }
        catch (const StorageError &ex)
        {
            spdlog::error("Upload {} append failed in storage: {}", *id, ex.what());
            return make_error(ex.code(), ex.what());
        }
    }

    Outcome<UploadSession> SessionEngine::append_locked(const std::string &id, const AppendRequest &request)
    {
        auto loaded = repository_.get(id);
        if (!loaded)
        {
            return make_error(chunkup::ErrorCode::NotFound, kNotResumable);
        }
        if (is_terminal(loaded->status))
        {
            return make_error(chunkup::ErrorCode::InvalidState, kNotResumable);
        }
        auto session = std::move(*loaded);
        if (request.offset != session.offset)
        {
            return make_error(chunkup::ErrorCode::OffsetMismatch, kOffsetMismatch);
        }

        const std::span<const std::byte> chunk(request.data);
        if (size_guard::exceeds_maximum(session.current_file_size, chunk.size(), session.max_file_size))
        {
            return fail(std::move(session), chunkup::ErrorCode::FileTooLarge, kMaximumExceeded);
        }

        const HashChain chain(session.hash_function, session.running_digest);
        const auto verified = chain.verify(chunk, request.chunk_hash);
        if (!verified)
        {
            return transient_failure(std::move(session), chunkup::ErrorCode::ChunkCorrupted, kChunkCorrupted,
                                     kChunkCorrupted);
        }

        const auto previous_size = session.current_file_size;
        const bool first_chunk = !session.blob_path.has_value();
        std::string blob_ref;
        if (first_chunk)
        {
            const auto key = make_blob_key(session.id, session.owner, session.original_file_name,
                                           config_.preserve_file_name, Clock::now());
            try
            {
                blob_ref = blobs_.create(key, chunk);
            }
            catch (const StorageError &ex)
            {
                spdlog::error("Upload {} could not create blob {}: {}", session.id, key, ex.what());
                return make_error(chunkup::ErrorCode::StorageFailure, ex.what());
            }
            session.blob_path = blob_ref;
            if (session.status == SessionStatus::Initial)
            {
                session.status = SessionStatus::Uploading;
            }
        }
        else
        {
            blob_ref = *session.blob_path;
            try
            {
                blobs_.append(blob_ref, chunk);
            }
            catch (const StorageError &ex)
            {
                spdlog::warn("Upload {} failed to append {} bytes: {}", session.id, chunk.size(), ex.what());
                try
                {
                    blobs_.truncate(blob_ref, previous_size);
                }
                catch (const StorageError &truncate_error)
                {
                    spdlog::error("Upload {} could not trim partial write: {}", session.id, truncate_error.what());
                }
                return transient_failure(std::move(session), chunkup::ErrorCode::StorageWriteFailed, ex.what(),
                                         kStoreFailed);
            }
        }

        retry_policy_.on_success(session);
        session.offset += chunk.size();
        session.current_file_size = session.offset;
        session.running_digest = verified->running_digest;
        const auto now = Clock::now();
        session.updated_at = now;

        std::optional<chunkup::ErrorCode> failure;
        switch (size_guard::classify(session.current_file_size, session.original_file_size))
        {
        case size_guard::Progress::Complete:
            if (request.final_hash && digests_equal(*session.running_digest, *request.final_hash))
            {
                session.status = SessionStatus::Successful;
            }
            else
            {
                session.status = SessionStatus::Failed;
                session.error_message = kFileCorrupted;
                failure = chunkup::ErrorCode::FinalHashMismatch;
            }
            session.completed_at = now;
            break;
        case size_guard::Progress::Overrun:
            session.status = SessionStatus::Failed;
            session.error_message = kOriginalExceeded;
            session.completed_at = now;
            failure = chunkup::ErrorCode::SizeOverrun;
            break;
        case size_guard::Progress::Partial:
            break;
        }

        const auto doomed_blob = failure ? release_blob(session) : std::nullopt;
        try
        {
            repository_.save(session);
        }
        catch (const StorageError &ex)
        {
            spdlog::error("Upload {} could not be saved, rolling back chunk: {}", session.id, ex.what());
            try
            {
                if (first_chunk)
                {
                    blobs_.remove(blob_ref);
                }
                else
                {
                    blobs_.truncate(blob_ref, previous_size);
                }
            }
            catch (const StorageError &rollback_error)
            {
                spdlog::error("Upload {} rollback of blob {} failed: {}", session.id, blob_ref, rollback_error.what());
            }
            return make_error(chunkup::ErrorCode::InternalError, kPersistFailed);
        }

        if (failure)
        {
            spdlog::warn("Upload {} failed: {}", session.id, *session.error_message);
            if (doomed_blob)
            {
                remove_blob(session.id, *doomed_blob);
            }
            return make_error(*failure, *session.error_message);
        }

        if (session.status == SessionStatus::Successful)
        {
            spdlog::info("Upload {} completed ({})", session.id, human_readable_size(session.current_file_size));
        }
        else
        {
            spdlog::debug("Upload {} at {} of {} bytes", session.id, session.current_file_size,
                          session.original_file_size);
        }
        return session;
    }

    Outcome<UploadSession> SessionEngine::find(const std::string &session_id) const
    {
        const auto id = crypto::canonical_session_id(session_id);
        if (!id)
        {
            return make_error(chunkup::ErrorCode::InvalidPayload, kInvalidSessionId);
        }
        try
        {
            auto session = repository_.get(*id);
            if (!session)
            {
                return make_error(chunkup::ErrorCode::NotFound, kUnknownSession);
            }
            return std::move(*session);
        }
        catch (const StorageError &ex)
        {
            spdlog::error("Lookup of upload {} failed: {}", session_id, ex.what());
            return make_error(ex.code(), ex.what());
        }
    }

    std::size_t SessionEngine::expire_idle(std::chrono::seconds max_idle)
    {
        const auto cutoff = Clock::now() - max_idle;
        std::size_t expired = 0;
        for (const auto &candidate : repository_.list())
        {
            if (is_terminal(candidate.status) || candidate.updated_at >= cutoff)
            {
                continue;
            }

            auto guard = locks_.acquire(candidate.id);
            try
            {
                auto current = repository_.get(candidate.id);
                if (!current || is_terminal(current->status) || current->updated_at >= cutoff)
                {
                    continue;
                }
                mark_failed(*current, kExpired);
                ++expired;
            }
            catch (const StorageError &ex)
            {
                spdlog::error("Could not expire upload {}: {}", candidate.id, ex.what());
            }
        }
        if (expired > 0)
        {
            spdlog::info("Expired {} idle uploads", expired);
        }
        return expired;
    }

    Outcome<UploadSession> SessionEngine::transient_failure(UploadSession session, chunkup::ErrorCode code,
                                                            const std::string &detail, const std::string &message)
    {
        if (retry_policy_.on_transient_failure(session) == RetryDecision::Retry)
        {
            session.updated_at = Clock::now();
            repository_.save(session);
            spdlog::warn("Upload {} rejected chunk at offset {} ({}), {} retries left", session.id, session.offset,
                         chunkup::to_string(code), session.retry_budget);
            return make_error(code, message, session.retry_budget);
        }
        return fail(std::move(session), chunkup::ErrorCode::RetriesExhausted, detail);
    }

    Outcome<UploadSession> SessionEngine::fail(UploadSession session, chunkup::ErrorCode code, std::string message)
    {
        mark_failed(session, message);
        return make_error(code, std::move(message));
    }

    void SessionEngine::mark_failed(UploadSession &session, const std::string &message)
    {
        const auto now = Clock::now();
        session.status = SessionStatus::Failed;
        session.error_message = message;
        session.completed_at = now;
        session.updated_at = now;

        const auto doomed_blob = release_blob(session);
        repository_.save(session);
        spdlog::warn("Upload {} failed: {}", session.id, message);
        if (doomed_blob)
        {
            remove_blob(session.id, *doomed_blob);
        }
    }

    std::optional<std::string> SessionEngine::reconcile_blob(const UploadSession &session)
    {
        if (!session.blob_path)
        {
            return std::nullopt;
        }
        if (!blobs_.exists(*session.blob_path))
        {
            spdlog::error("Upload {} lost its blob {}", session.id, *session.blob_path);
            return std::string(kBlobMissing);
        }
        const auto stored = blobs_.size(*session.blob_path);
        if (stored < session.current_file_size)
        {
            spdlog::error("Upload {} blob is shorter than the committed offset ({} < {})", session.id, stored,
                          session.current_file_size);
            return std::string(kBlobTruncated);
        }
        if (stored > session.current_file_size)
        {
            spdlog::warn("Upload {} blob holds {} bytes beyond the committed offset, trimming", session.id,
                         stored - session.current_file_size);
            blobs_.truncate(*session.blob_path, session.current_file_size);
        }
        return std::nullopt;
    }

    std::optional<std::string> SessionEngine::release_blob(UploadSession &session) const
    {
        if (config_.preserve_failed_uploads || !session.blob_path)
        {
            return std::nullopt;
        }
        return std::exchange(session.blob_path, std::nullopt);
    }

    void SessionEngine::remove_blob(const std::string &session_id, const std::string &ref)
    {
        try
        {
            if (blobs_.exists(ref))
            {
                blobs_.remove(ref);
            }
        }
        catch (const StorageError &ex)
        {
            spdlog::warn("Upload {} left blob {} behind: {}", session_id, ref, ex.what());
        }
    }

} // namespace chunkup::server
