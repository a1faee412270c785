#include <atomic>
#include <cassert>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "chunkup/crypto.hpp"
#include "chunkup/hash_chain.hpp"
#include "chunkup/server/blob_store.hpp"
#include "chunkup/server/config.hpp"
#include "chunkup/server/session_engine.hpp"
#include "chunkup/server/session_repository.hpp"

using namespace chunkup;
using namespace chunkup::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::vector<std::byte> bytes_of(std::string_view text)
    {
        const auto view = std::as_bytes(std::span(text.data(), text.size()));
        return {view.begin(), view.end()};
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::filesystem::path fresh_root(const std::string &name)
    {
        auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        return root;
    }

    std::size_t count_blobs(const std::filesystem::path &root)
    {
        const auto uploads = root / "uploads";
        if (!std::filesystem::exists(uploads))
        {
            return 0;
        }
        std::size_t count = 0;
        for (const auto &entry : std::filesystem::recursive_directory_iterator(uploads))
        {
            count += entry.is_regular_file() ? 1 : 0;
        }
        return count;
    }

    // Passes through to a FileBlobStore unless told to fail.
    class FaultyBlobStore final : public BlobStore
    {
    public:
        explicit FaultyBlobStore(FileBlobStore &inner) : inner_(inner) {}

        bool fail_create = false;
        bool fail_append = false;

        std::string create(const std::string &key, std::span<const std::byte> initial_content) override
        {
            if (fail_create)
            {
                throw StorageError(ErrorCode::StorageFailure, "disk full");
            }
            return inner_.create(key, initial_content);
        }

        // Leaves half of the chunk behind before failing, like a short write.
        void append(const std::string &ref, std::span<const std::byte> data) override
        {
            if (fail_append)
            {
                inner_.append(ref, data.first(data.size() / 2));
                throw StorageError(ErrorCode::StorageWriteFailed, "I/O error");
            }
            inner_.append(ref, data);
        }

        void remove(const std::string &ref) override { inner_.remove(ref); }
        bool exists(const std::string &ref) const override { return inner_.exists(ref); }
        std::uint64_t size(const std::string &ref) const override { return inner_.size(ref); }
        void truncate(const std::string &ref, std::uint64_t size) override { inner_.truncate(ref, size); }

    private:
        FileBlobStore &inner_;
    };

    class FaultyRepository final : public SessionRepository
    {
    public:
        explicit FaultyRepository(FileSessionRepository &inner) : inner_(inner) {}

        bool fail_save = false;

        std::optional<UploadSession> get(const std::string &id) const override { return inner_.get(id); }
        UploadSession create(const UploadSession &session) override { return inner_.create(session); }
        std::vector<UploadSession> list() const override { return inner_.list(); }

        void save(const UploadSession &session) override
        {
            if (fail_save)
            {
                throw StorageError(ErrorCode::InternalError, "read-only file system");
            }
            inner_.save(session);
        }

    private:
        FileSessionRepository &inner_;
    };

    struct Fixture
    {
        explicit Fixture(const std::string &name, UploadConfig upload = {})
            : root(fresh_root(name)),
              config(upload),
              files(root),
              stored(root),
              blobs(files),
              repository(stored),
              engine(config, blobs, repository) {}

        ~Fixture() { cleanup_path(root); }

        Fixture(const Fixture &) = delete;
        Fixture &operator=(const Fixture &) = delete;

        UploadSession start(std::uint64_t file_size, std::optional<std::string> owner = std::nullopt)
        {
            auto outcome = engine.start_or_resume(StartRequest{
                .file_name = std::string("movie.mov"),
                .file_size = file_size,
                .owner = std::move(owner),
            });
            assert(outcome.ok());
            return std::move(outcome).value();
        }

        AppendRequest chunk(const UploadSession &session, std::uint64_t offset, std::string_view text,
                            std::optional<std::string> final_hash = std::nullopt) const
        {
            return AppendRequest{
                .session_id = session.id,
                .offset = offset,
                .data = bytes_of(text),
                .chunk_hash = crypto::hash_text(session.hash_function, text),
                .final_hash = std::move(final_hash),
            };
        }

        std::filesystem::path blob_file(const UploadSession &session) const
        {
            assert(session.blob_path);
            return files.resolve(*session.blob_path);
        }

        std::filesystem::path root;
        UploadConfig config;
        FileBlobStore files;
        FileSessionRepository stored;
        FaultyBlobStore blobs;
        FaultyRepository repository;
        SessionEngine engine;
    };

    std::string expected_final(crypto::HashFunction function, std::string_view first, std::string_view second)
    {
        return HashChain::fold(function, crypto::hash_text(function, first), crypto::hash_text(function, second));
    }

    void test_two_chunk_upload()
    {
        Fixture fx("chunkup_engine_success");
        const auto session = fx.start(10);
        assert(session.status == SessionStatus::Initial);
        assert(session.chunk_size == fx.config.chunk_size);
        assert(session.retry_budget == 2);
        assert(!session.blob_path);

        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());
        assert(first.value().status == SessionStatus::Uploading);
        assert(first.value().offset == 6);
        assert(first.value().current_file_size == 6);
        assert(first.value().running_digest == crypto::hash_text(session.hash_function, "hello "));
        assert(read_file(fx.blob_file(first.value())) == "hello ");

        const auto final_hash = expected_final(session.hash_function, "hello ", "worl");
        auto second = fx.engine.append_chunk(fx.chunk(session, 6, "worl", final_hash));
        assert(second.ok());
        const auto &done = second.value();
        assert(done.status == SessionStatus::Successful);
        assert(done.offset == 10);
        assert(done.running_digest == final_hash);
        assert(done.completed_at.has_value());
        assert(read_file(fx.blob_file(done)) == "hello worl");
        assert(fx.stored.get(session.id)->status == SessionStatus::Successful);

        const auto after = fx.engine.append_chunk(fx.chunk(session, 10, "x"));
        assert(!after.ok());
        assert(after.error().code == ErrorCode::InvalidState);

        const auto snapshot = make_snapshot(done);
        assert(snapshot.status == "SUCCESSFUL");
        assert(snapshot.hr_original_file_size == "10.00 B");
    }

    void test_single_empty_chunk()
    {
        Fixture fx("chunkup_engine_empty");
        const auto session = fx.start(0);
        const auto final_hash = crypto::hash_text(session.hash_function, "");
        auto outcome = fx.engine.append_chunk(fx.chunk(session, 0, "", final_hash));
        assert(outcome.ok());
        assert(outcome.value().status == SessionStatus::Successful);
        assert(std::filesystem::file_size(fx.blob_file(outcome.value())) == 0);
    }

    void test_size_overrun()
    {
        Fixture fx("chunkup_engine_overrun");
        const auto session = fx.start(10);
        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());
        const auto blob = fx.blob_file(first.value());

        const auto overrun = fx.engine.append_chunk(fx.chunk(session, 6, "world"));
        assert(!overrun.ok());
        assert(overrun.error().code == ErrorCode::SizeOverrun);
        assert(!overrun.error().retryable());

        const auto stored = fx.stored.get(session.id);
        assert(stored->status == SessionStatus::Failed);
        assert(stored->error_message == "File size exceeded the original file size");
        assert(!stored->blob_path);
        assert(!std::filesystem::exists(blob));
    }

    void test_max_file_size()
    {
        UploadConfig upload;
        upload.max_file_size = 5;
        Fixture fx("chunkup_engine_max_size", upload);

        const auto too_big = fx.engine.start_or_resume(StartRequest{
            .file_name = std::string("big.bin"),
            .file_size = 6,
        });
        assert(!too_big.ok());
        assert(too_big.error().code == ErrorCode::FileTooLarge);
        assert(too_big.error().message == "File size is greater than the maximum allowed file size, 5.00 B.");
        assert(fx.stored.list().empty());

        // The declared size fits but the client sends more than the ceiling.
        const auto session = fx.start(4);
        assert(session.max_file_size == 5u);
        const auto outcome = fx.engine.append_chunk(fx.chunk(session, 0, "abcdef"));
        assert(!outcome.ok());
        assert(outcome.error().code == ErrorCode::FileTooLarge);

        const auto stored = fx.stored.get(session.id);
        assert(stored->status == SessionStatus::Failed);
        assert(!stored->blob_path);
        assert(count_blobs(fx.root) == 0);
    }

    void test_corrupted_chunk_budget()
    {
        Fixture fx("chunkup_engine_corrupted");
        const auto session = fx.start(10);
        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());
        const auto blob = fx.blob_file(first.value());

        auto bad = fx.chunk(session, 6, "worl");
        bad.chunk_hash = crypto::hash_text(session.hash_function, "word");

        auto rejected = fx.engine.append_chunk(bad);
        assert(!rejected.ok());
        assert(rejected.error().code == ErrorCode::ChunkCorrupted);
        assert(rejected.error().message == "Sent chunk is corrupted. Please retry uploading the chunk.");
        assert(rejected.error().remaining_retries == 1u);

        auto stored = fx.stored.get(session.id);
        assert(stored->status == SessionStatus::Uploading);
        assert(stored->offset == 6);
        assert(stored->retry_budget == 1);
        assert(stored->running_digest == first.value().running_digest);
        assert(read_file(blob) == "hello ");

        rejected = fx.engine.append_chunk(bad);
        assert(rejected.error().code == ErrorCode::ChunkCorrupted);
        assert(rejected.error().remaining_retries == 0u);

        rejected = fx.engine.append_chunk(bad);
        assert(rejected.error().code == ErrorCode::RetriesExhausted);
        assert(!rejected.error().retryable());

        stored = fx.stored.get(session.id);
        assert(stored->status == SessionStatus::Failed);
        assert(stored->error_message.has_value());
        assert(!std::filesystem::exists(blob));

        const auto after = fx.engine.append_chunk(fx.chunk(session, 6, "worl"));
        assert(after.error().code == ErrorCode::InvalidState);
    }

    void test_budget_resets_after_success()
    {
        Fixture fx("chunkup_engine_budget_reset");
        const auto session = fx.start(12);

        auto bad = fx.chunk(session, 0, "abcd");
        bad.chunk_hash = "0000";
        assert(fx.engine.append_chunk(bad).error().remaining_retries == 1u);

        auto good = fx.engine.append_chunk(fx.chunk(session, 0, "abcd"));
        assert(good.ok());
        assert(good.value().retry_budget == 2);

        bad = fx.chunk(session, 4, "efgh");
        bad.chunk_hash = "0000";
        assert(fx.engine.append_chunk(bad).error().remaining_retries == 1u);
        assert(fx.engine.append_chunk(bad).error().remaining_retries == 0u);
        good = fx.engine.append_chunk(fx.chunk(session, 4, "efgh"));
        assert(good.ok());
        assert(good.value().retry_budget == 2);
    }

    void test_final_hash_mismatch()
    {
        Fixture fx("chunkup_engine_final_hash");
        auto session = fx.start(10);
        assert(fx.engine.append_chunk(fx.chunk(session, 0, "hello ")).ok());

        const auto wrong = expected_final(session.hash_function, "hello ", "word");
        const auto outcome = fx.engine.append_chunk(fx.chunk(session, 6, "worl", wrong));
        assert(!outcome.ok());
        assert(outcome.error().code == ErrorCode::FinalHashMismatch);
        assert(outcome.error().message == "File is corrupted");
        assert(fx.stored.get(session.id)->status == SessionStatus::Failed);

        // A completing chunk without a final digest cannot be verified.
        session = fx.start(4);
        const auto missing = fx.engine.append_chunk(fx.chunk(session, 0, "worl"));
        assert(missing.error().code == ErrorCode::FinalHashMismatch);
    }

    void test_uppercase_digests_accepted()
    {
        Fixture fx("chunkup_engine_uppercase");
        const auto session = fx.start(4);
        auto request = fx.chunk(session, 0, "abcd", crypto::hash_text(session.hash_function, "abcd"));
        for (auto *text : {&request.chunk_hash, &*request.final_hash})
        {
            for (auto &c : *text)
            {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
        }
        const auto outcome = fx.engine.append_chunk(request);
        assert(outcome.ok());
        assert(outcome.value().status == SessionStatus::Successful);
    }

    void test_resume()
    {
        Fixture fx("chunkup_engine_resume");
        const auto session = fx.start(10, std::string("alice"));
        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());

        const auto lookup = fx.engine.start_or_resume(StartRequest{
            .session_id = session.id,
            .owner = std::string("alice"),
        });
        assert(lookup.ok());
        assert(lookup.value().offset == 6);
        assert(lookup.value().updated_at == first.value().updated_at);
        const auto again = fx.engine.start_or_resume(StartRequest{
            .session_id = session.id,
            .owner = std::string("alice"),
        });
        assert(again.value().updated_at == lookup.value().updated_at);

        const auto resumed = fx.engine.start_or_resume(StartRequest{
            .session_id = session.id,
            .offset = 6,
            .owner = std::string("alice"),
        });
        assert(resumed.ok());
        assert(resumed.value().offset == 6);
        assert(resumed.value().status == SessionStatus::Uploading);

        const auto mismatch = fx.engine.start_or_resume(StartRequest{
            .session_id = session.id,
            .offset = 3,
            .owner = std::string("alice"),
        });
        assert(mismatch.error().code == ErrorCode::OffsetMismatch);

        const auto stranger = fx.engine.start_or_resume(StartRequest{
            .session_id = session.id,
            .owner = std::string("mallory"),
        });
        assert(stranger.error().code == ErrorCode::NotFound);

        const auto anonymous = fx.engine.start_or_resume(StartRequest{.session_id = session.id});
        assert(anonymous.error().code == ErrorCode::NotFound);

        const auto unknown = fx.engine.start_or_resume(StartRequest{
            .session_id = std::string("0f8fad5b-d9cb-469f-a165-70867728950e"),
        });
        assert(unknown.error().code == ErrorCode::NotFound);

        const auto malformed = fx.engine.start_or_resume(StartRequest{.session_id = std::string("../../x")});
        assert(malformed.error().code == ErrorCode::InvalidPayload);

        const auto found = fx.engine.find(session.id);
        assert(found.ok() && found.value().offset == 6);
        assert(fx.engine.find("0f8fad5b-d9cb-469f-a165-70867728950e").error().code == ErrorCode::NotFound);
    }

    void test_resume_trims_partial_write()
    {
        Fixture fx("chunkup_engine_trim");
        const auto session = fx.start(10);
        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());

        // Bytes that reached the blob but were never committed to the session.
        fx.files.append(*first.value().blob_path, bytes_of("wo"));
        assert(std::filesystem::file_size(fx.blob_file(first.value())) == 8);

        const auto resumed = fx.engine.start_or_resume(StartRequest{.session_id = session.id, .offset = 6});
        assert(resumed.ok());
        assert(read_file(fx.blob_file(first.value())) == "hello ");

        const auto final_hash = expected_final(session.hash_function, "hello ", "worl");
        assert(fx.engine.append_chunk(fx.chunk(session, 6, "worl", final_hash)).ok());
        assert(read_file(fx.blob_file(first.value())) == "hello worl");
    }

    void test_resume_fails_on_short_blob()
    {
        Fixture fx("chunkup_engine_short_blob");
        const auto session = fx.start(10);
        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());

        fx.files.truncate(*first.value().blob_path, 3);

        const auto resumed = fx.engine.start_or_resume(StartRequest{.session_id = session.id, .offset = 6});
        assert(resumed.error().code == ErrorCode::BlobLost);
        assert(is_terminal(resumed.error().code));

        const auto failed = fx.engine.find(session.id);
        assert(failed.value().status == SessionStatus::Failed);
        assert(!failed.value().blob_path);
        assert(count_blobs(fx.root) == 0);

        const auto final_hash = expected_final(session.hash_function, "hello ", "worl");
        const auto rejected = fx.engine.append_chunk(fx.chunk(session, 6, "worl", final_hash));
        assert(rejected.error().code == ErrorCode::InvalidState);
    }

    void test_resume_fails_on_missing_blob()
    {
        Fixture fx("chunkup_engine_missing_blob");
        const auto session = fx.start(10);
        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());

        fx.files.remove(*first.value().blob_path);

        const auto resumed = fx.engine.start_or_resume(StartRequest{.session_id = session.id, .offset = 6});
        assert(resumed.error().code == ErrorCode::BlobLost);
        assert(fx.engine.find(session.id).value().status == SessionStatus::Failed);
    }

    void test_resume_leaves_terminal_session_alone()
    {
        Fixture fx("chunkup_engine_resume_terminal");
        const auto session = fx.start(10);
        assert(fx.engine.append_chunk(fx.chunk(session, 0, "hello ")).ok());
        const auto final_hash = expected_final(session.hash_function, "hello ", "worl");
        const auto done = fx.engine.append_chunk(fx.chunk(session, 6, "worl", final_hash));
        assert(done.value().status == SessionStatus::Successful);

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        const auto resumed = fx.engine.start_or_resume(StartRequest{.session_id = session.id, .offset = 10});
        assert(resumed.ok());
        assert(resumed.value().status == SessionStatus::Successful);
        assert(resumed.value().updated_at == done.value().updated_at);
        assert(fx.engine.find(session.id).value().updated_at == done.value().updated_at);
        assert(read_file(fx.blob_file(done.value())) == "hello worl");
    }

    void test_uppercase_session_id()
    {
        Fixture fx("chunkup_engine_uppercase_id");
        const auto session = fx.start(6);
        std::string shouted = session.id;
        for (auto &ch : shouted)
        {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }

        assert(fx.engine.find(shouted).value().id == session.id);
        auto request = fx.chunk(session, 0, "hello ", crypto::hash_text(session.hash_function, "hello "));
        request.session_id = shouted;
        const auto done = fx.engine.append_chunk(request);
        assert(done.value().status == SessionStatus::Successful);
        assert(done.value().id == session.id);
    }

    void test_start_validation()
    {
        Fixture fx("chunkup_engine_validation");

        const auto missing = fx.engine.start_or_resume(StartRequest{});
        assert(missing.error().code == ErrorCode::InvalidPayload);
        assert(missing.error().message ==
               "file_name: This field is required; file_size: This field is required");

        const auto only_name = fx.engine.start_or_resume(StartRequest{.file_name = std::string("a.txt")});
        assert(only_name.error().message == "file_size: This field is required");

        const auto bad_hash = fx.engine.start_or_resume(StartRequest{
            .file_name = std::string("a.txt"),
            .file_size = 1,
            .hash_function = std::string("sha999"),
        });
        assert(bad_hash.error().code == ErrorCode::InvalidPayload);
        assert(bad_hash.error().message == "Invalid hash function");

        const auto no_extension = fx.engine.start_or_resume(StartRequest{
            .file_name = std::string("README"),
            .file_size = 1,
        });
        assert(no_extension.error().code == ErrorCode::InvalidPayload);

        const auto sha = fx.engine.start_or_resume(StartRequest{
            .file_name = std::string("../My report.pdf"),
            .file_size = 1,
            .hash_function = std::string("SHA256"),
        });
        assert(sha.ok());
        assert(sha.value().hash_function == crypto::HashFunction::Sha256);
        assert(sha.value().original_file_name == "My_report.pdf");
        assert(crypto::is_session_id(sha.value().id));

        assert(fx.stored.list().size() == 1);
    }

    void test_expire_idle()
    {
        Fixture fx("chunkup_engine_expiry");
        const auto long_ago = Clock::now() - std::chrono::hours(2);

        const auto idle = fx.start(10);
        auto uploaded = fx.engine.append_chunk(fx.chunk(idle, 0, "hello "));
        assert(uploaded.ok());
        const auto idle_blob = fx.blob_file(uploaded.value());
        auto aged = uploaded.value();
        aged.updated_at = long_ago;
        fx.stored.save(aged);

        const auto finished = fx.start(4);
        const auto done = fx.engine.append_chunk(
            fx.chunk(finished, 0, "abcd", crypto::hash_text(finished.hash_function, "abcd")));
        assert(done.ok());
        auto old_done = done.value();
        old_done.updated_at = long_ago;
        fx.stored.save(old_done);

        const auto fresh = fx.start(10);

        assert(fx.engine.expire_idle(std::chrono::hours(1)) == 1);

        const auto expired = fx.stored.get(idle.id);
        assert(expired->status == SessionStatus::Failed);
        assert(expired->error_message == "Upload expired after a period of inactivity");
        assert(!std::filesystem::exists(idle_blob));

        assert(fx.stored.get(finished.id)->status == SessionStatus::Successful);
        assert(std::filesystem::exists(fx.blob_file(done.value())));
        assert(fx.stored.get(fresh.id)->status == SessionStatus::Initial);

        assert(fx.engine.expire_idle(std::chrono::hours(1)) == 0);
    }

    void test_preserve_failed_uploads()
    {
        UploadConfig upload;
        upload.preserve_failed_uploads = true;
        Fixture fx("chunkup_engine_preserve", upload);
        const auto session = fx.start(10);
        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());

        assert(fx.engine.append_chunk(fx.chunk(session, 6, "world")).error().code == ErrorCode::SizeOverrun);
        const auto stored = fx.stored.get(session.id);
        assert(stored->status == SessionStatus::Failed);
        assert(stored->blob_path == first.value().blob_path);
        assert(read_file(fx.blob_file(*stored)) == "hello world");
    }

    void test_concurrent_appends()
    {
        Fixture fx("chunkup_engine_concurrent");
        const auto session = fx.start(12);
        const auto request = fx.chunk(session, 0, "abcdef");

        std::atomic<int> accepted{0};
        std::atomic<int> mismatched{0};
        auto worker = [&]
        {
            const auto outcome = fx.engine.append_chunk(request);
            if (outcome.ok())
            {
                ++accepted;
            }
            else if (outcome.error().code == ErrorCode::OffsetMismatch)
            {
                ++mismatched;
            }
        };
        std::thread first(worker);
        std::thread second(worker);
        first.join();
        second.join();

        assert(accepted == 1);
        assert(mismatched == 1);
        const auto stored = fx.stored.get(session.id);
        assert(stored->offset == 6);
        assert(read_file(fx.blob_file(*stored)) == "abcdef");
    }

    void test_append_storage_failure()
    {
        Fixture fx("chunkup_engine_append_failure");
        const auto session = fx.start(10);
        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());
        const auto blob = fx.blob_file(first.value());

        fx.blobs.fail_append = true;
        auto outcome = fx.engine.append_chunk(fx.chunk(session, 6, "worl"));
        assert(outcome.error().code == ErrorCode::StorageWriteFailed);
        assert(outcome.error().message == "Failed to store the chunk. Please retry uploading the chunk.");
        assert(outcome.error().remaining_retries == 1u);
        assert(read_file(blob) == "hello ");
        assert(fx.stored.get(session.id)->offset == 6);

        fx.blobs.fail_append = false;
        const auto final_hash = expected_final(session.hash_function, "hello ", "worl");
        outcome = fx.engine.append_chunk(fx.chunk(session, 6, "worl", final_hash));
        assert(outcome.ok());
        assert(read_file(blob) == "hello worl");

        const auto doomed = fx.start(10);
        assert(fx.engine.append_chunk(fx.chunk(doomed, 0, "hello ")).ok());
        fx.blobs.fail_append = true;
        assert(fx.engine.append_chunk(fx.chunk(doomed, 6, "worl")).error().remaining_retries == 1u);
        assert(fx.engine.append_chunk(fx.chunk(doomed, 6, "worl")).error().remaining_retries == 0u);
        const auto exhausted = fx.engine.append_chunk(fx.chunk(doomed, 6, "worl"));
        assert(exhausted.error().code == ErrorCode::RetriesExhausted);
        assert(exhausted.error().message == "I/O error");
        assert(fx.stored.get(doomed.id)->status == SessionStatus::Failed);
    }

    void test_first_chunk_create_failure()
    {
        Fixture fx("chunkup_engine_create_failure");
        const auto session = fx.start(10);

        fx.blobs.fail_create = true;
        const auto outcome = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(outcome.error().code == ErrorCode::StorageFailure);
        assert(!outcome.error().retryable());

        const auto stored = fx.stored.get(session.id);
        assert(stored->status == SessionStatus::Initial);
        assert(stored->offset == 0);
        assert(stored->retry_budget == 2);
        assert(!stored->blob_path);

        fx.blobs.fail_create = false;
        assert(fx.engine.append_chunk(fx.chunk(session, 0, "hello ")).ok());
    }

    void test_save_failure_rolls_back()
    {
        Fixture fx("chunkup_engine_save_failure");
        const auto session = fx.start(10);

        fx.repository.fail_save = true;
        auto outcome = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(outcome.error().code == ErrorCode::InternalError);
        assert(count_blobs(fx.root) == 0);
        assert(!fx.stored.get(session.id)->blob_path);

        fx.repository.fail_save = false;
        auto first = fx.engine.append_chunk(fx.chunk(session, 0, "hello "));
        assert(first.ok());
        const auto blob = fx.blob_file(first.value());

        fx.repository.fail_save = true;
        outcome = fx.engine.append_chunk(fx.chunk(session, 6, "worl"));
        assert(outcome.error().code == ErrorCode::InternalError);
        assert(read_file(blob) == "hello ");
        assert(fx.stored.get(session.id)->offset == 6);
    }

} // namespace

void run_session_engine_tests()
{
    test_two_chunk_upload();
    test_single_empty_chunk();
    test_size_overrun();
    test_max_file_size();
    test_corrupted_chunk_budget();
    test_budget_resets_after_success();
    test_final_hash_mismatch();
    test_uppercase_digests_accepted();
    test_resume();
    test_resume_trims_partial_write();
    test_resume_fails_on_short_blob();
    test_resume_fails_on_missing_blob();
    test_resume_leaves_terminal_session_alone();
    test_uppercase_session_id();
    test_start_validation();
    test_expire_idle();
    test_preserve_failed_uploads();
    test_concurrent_appends();
    test_append_storage_failure();
    test_first_chunk_create_failure();
    test_save_failure_rolls_back();
    std::cout << "Session engine tests passed\n";
}
