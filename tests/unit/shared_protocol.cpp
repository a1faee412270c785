#include <array>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkup/crypto.hpp"
#include "chunkup/encoding/base64.hpp"
#include "chunkup/error_codes.hpp"
#include "chunkup/framing.hpp"
#include "chunkup/hash_chain.hpp"
#include "chunkup/protocol.hpp"
#include "chunkup/size_format.hpp"

using namespace chunkup;
using namespace chunkup::protocol;

void run_server_component_tests();
void run_session_engine_tests();
void run_client_component_tests();

namespace
{

    std::vector<std::byte> bytes_of(std::string_view text)
    {
        const auto view = std::as_bytes(std::span(text.data(), text.size()));
        return {view.begin(), view.end()};
    }

    void test_request_roundtrip()
    {
        UploadStartRequest start{
            .file_name = "movie.mov",
            .file_size = 4096,
            .hash_function = std::string("SHA256"),
            .owner = std::string("alice"),
        };
        RequestEnvelope envelope{};
        envelope.command = Command::UploadStart;
        envelope.payload = start;
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "UPLOAD_START");
        const auto decoded = json.get<RequestEnvelope>();

        assert(decoded.command == Command::UploadStart);
        assert(decoded.payload == envelope.payload);
        assert(decoded.request_id == envelope.request_id);

        const auto decoded_start = decoded.payload.get<UploadStartRequest>();
        assert(!decoded_start.session_id);
        assert(!decoded_start.offset);
        assert(decoded_start.file_name == start.file_name);
        assert(decoded_start.file_size == start.file_size);
        assert(decoded_start.owner == start.owner);
        assert(!decoded.payload.contains("session_id"));
    }

    void test_unknown_command_rejected()
    {
        const nlohmann::json json = {{"cmd", "DELETE_EVERYTHING"}, {"payload", nlohmann::json::object()}};
        bool caught = false;
        try
        {
            (void)json.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);
        assert(!command_from_string("upload_start"));
        assert(command_from_string("UPLOAD_CHUNK") == Command::UploadChunk);
    }

    void test_response_roundtrip()
    {
        SessionSnapshot snapshot{
            .session_id = "0f8fad5b-d9cb-469f-a165-70867728950e",
            .status = "UPLOADING",
            .hash_function = "MD5",
            .offset = 6,
            .chunk_size = 64'000'000,
            .original_file_size = 10,
            .current_file_size = 6,
            .hr_original_file_size = "10.00 B",
            .hr_current_file_size = "6.00 B",
            .running_digest = std::string("e80b5017098950fc58aad83c8c14978e"),
            .retry_budget = 2,
        };

        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Ok;
        envelope.payload = snapshot;
        envelope.request_id = std::string("req-7");

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "OK");
        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Ok);
        assert(decoded.error == ErrorCode::Ok);
        assert(decoded.payload.get<SessionSnapshot>() == snapshot);
    }

    void test_error_details()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::ChunkCorrupted;
        envelope.message = "Sent chunk is corrupted. Please retry uploading the chunk.";
        envelope.payload = ErrorDetails{.remaining_retries = 1u};

        const auto json = nlohmann::json(envelope);
        assert(json.at("error") == to_int(ErrorCode::ChunkCorrupted));
        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::ChunkCorrupted);
        assert(decoded.payload.get<ErrorDetails>().remaining_retries == 1u);

        envelope.payload = ErrorDetails{};
        const auto terminal = nlohmann::json(envelope).get<ResponseEnvelope>();
        assert(!terminal.payload.get<ErrorDetails>().remaining_retries);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::OffsetMismatch) == "offset_mismatch");
        assert(error_code_from_int(to_int(ErrorCode::RetriesExhausted)) == ErrorCode::RetriesExhausted);
        assert(error_code_from_int(999) == ErrorCode::InternalError);

        assert(is_terminal(ErrorCode::FileTooLarge));
        assert(is_terminal(ErrorCode::SizeOverrun));
        assert(is_terminal(ErrorCode::FinalHashMismatch));
        assert(is_terminal(ErrorCode::RetriesExhausted));
        assert(is_terminal(ErrorCode::Expired));
        assert(is_terminal(ErrorCode::BlobLost));
        assert(to_string(ErrorCode::BlobLost) == "blob_lost");
        assert(!is_terminal(ErrorCode::ChunkCorrupted));
        assert(!is_terminal(ErrorCode::StorageWriteFailed));
        assert(!is_terminal(ErrorCode::StorageFailure));
        assert(!is_terminal(ErrorCode::NotFound));
    }

    void test_framing()
    {
        static_assert(kMaxChunkSize % 3 == 0);
        assert(kMaxChunkSize / 3 * 4 + kEnvelopeHeadroom <= kMaxFrameSize);

        UploadChunkRequest chunk{
            .session_id = "0f8fad5b-d9cb-469f-a165-70867728950e",
            .offset = 2048,
            .data_base64 = "ZGF0YQ==",
            .chunk_hash = "abcd",
            .final_hash = std::string("ef01"),
        };

        RequestEnvelope envelope{};
        envelope.command = Command::UploadChunk;
        envelope.payload = chunk;

        const auto json = nlohmann::json(envelope);
        const auto frame = encode_frame(json);
        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        const auto decoded_envelope = decoded->message.get<RequestEnvelope>();
        assert(decoded_envelope.command == Command::UploadChunk);
        const auto decoded_chunk = decoded_envelope.payload.get<UploadChunkRequest>();
        assert(decoded_chunk.offset == chunk.offset);
        assert(decoded_chunk.data_base64 == chunk.data_base64);
        assert(decoded_chunk.final_hash == chunk.final_hash);

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial.has_value());

        const std::array<std::uint8_t, kFrameHeaderSize> oversized{0xFF, 0xFF, 0xFF, 0xFF};
        bool caught = false;
        try
        {
            (void)decode_frame_length(oversized);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
        assert(decode_frame_length({0x00, 0x00, 0x01, 0x00}) == 256u);
    }

    void test_base64()
    {
        const auto hello = bytes_of("hello");
        assert(encoding::encode_base64(hello) == "aGVsbG8=");

        const auto decoded = encoding::decode_base64("aGVsbG8=");
        assert(decoded.has_value());
        assert(*decoded == hello);

        const auto empty = encoding::decode_base64("");
        assert(empty.has_value() && empty->empty());

        assert(!encoding::decode_base64("aGVs@G8=").has_value());
    }

    void test_crypto_known_digests()
    {
        using crypto::HashFunction;
        assert(crypto::hash_text(HashFunction::Md5, "abc") == "900150983cd24fb0d6963f7d28e17f72");
        assert(crypto::hash_text(HashFunction::Md5, "") == "d41d8cd98f00b204e9800998ecf8427e");
        assert(crypto::hash_text(HashFunction::Sha1, "abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
        assert(crypto::hash_text(HashFunction::Sha256, "abc") ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        assert(crypto::hash_text(HashFunction::Sha512, "abc") ==
               "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
               "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");

        const auto blake = crypto::hash_text(HashFunction::Blake2b, "abc");
        assert(blake.size() == 64);
        assert(blake != crypto::hash_text(HashFunction::Blake2b, "abd"));

        assert(crypto::hash_function_from_string("SHA512") == HashFunction::Sha512);
        assert(crypto::hash_function_from_string("BLAKE2B") == HashFunction::Blake2b);
        assert(!crypto::hash_function_from_string("sha256"));
        assert(!crypto::hash_function_from_string("CRC32"));
        assert(crypto::to_string(HashFunction::Sha1) == "SHA1");
    }

    void test_crypto_sources_agree()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        for (const auto function : {crypto::HashFunction::Md5, crypto::HashFunction::Sha256,
                                    crypto::HashFunction::Blake2b})
        {
            const auto chunk_hash = crypto::hash_bytes(function, chunk);

            std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
            assert(crypto::hash_stream(function, stream) == chunk_hash);

            const auto file_path = std::filesystem::temp_directory_path() / "chunkup_crypto_test.bin";
            {
                std::ofstream file(file_path, std::ios::binary);
                file.write("\xDE\xAD\xBE\xEF", 4);
            }
            assert(crypto::hash_file(function, file_path) == chunk_hash);
            std::filesystem::remove(file_path);
        }

        crypto::Hasher hasher(crypto::HashFunction::Sha1);
        hasher.update(bytes_of("ab"));
        hasher.update(bytes_of("c"));
        assert(hasher.final_hex() == "a9993e364706816aba3e25717850c26c9cd0d89d");
        bool caught = false;
        try
        {
            hasher.update(bytes_of("more"));
        }
        catch (const std::logic_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_session_ids()
    {
        const auto first = crypto::generate_session_id();
        const auto second = crypto::generate_session_id();
        assert(first != second);
        assert(crypto::is_session_id(first));
        assert(first[14] == '4');
        const auto variant = first[19];
        assert(variant == '8' || variant == '9' || variant == 'a' || variant == 'b');

        assert(crypto::is_session_id("0f8fad5b-d9cb-469f-a165-70867728950e"));
        assert(crypto::is_session_id("0F8FAD5B-D9CB-469F-A165-70867728950E"));
        assert(crypto::canonical_session_id("0F8FAD5B-D9CB-469F-A165-70867728950E") ==
               std::optional<std::string>("0f8fad5b-d9cb-469f-a165-70867728950e"));
        assert(!crypto::canonical_session_id("0g8fad5b-d9cb-469f-a165-70867728950e"));
        assert(!crypto::is_session_id("0f8fad5bd9cb469fa16570867728950e"));
        assert(!crypto::is_session_id("../../etc/passwd"));
        assert(!crypto::is_session_id(""));
    }

    void test_hash_chain()
    {
        using crypto::HashFunction;
        const auto chunk_a = bytes_of("hello ");
        const auto chunk_b = bytes_of("world");
        const auto digest_a = crypto::hash_bytes(HashFunction::Md5, chunk_a);
        const auto digest_b = crypto::hash_bytes(HashFunction::Md5, chunk_b);

        HashChain chain(HashFunction::Md5);
        assert(!chain.running_digest());

        const auto first = chain.verify(chunk_a, digest_a);
        assert(first.has_value());
        assert(first->chunk_digest == digest_a);
        assert(first->running_digest == digest_a);
        assert(!chain.running_digest());

        chain.commit(first->running_digest);
        const auto second = chain.verify(chunk_b, digest_b);
        assert(second.has_value());
        assert(second->running_digest == crypto::hash_text(HashFunction::Md5, digest_a + digest_b));
        assert(second->running_digest != crypto::hash_text(HashFunction::Md5, "hello world"));

        assert(!chain.verify(chunk_b, digest_a).has_value());
        assert(chain.running_digest() == digest_a);

        std::string upper = digest_b;
        for (auto &c : upper)
        {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        assert(chain.verify(chunk_b, upper).has_value());

        HashChain accumulating(HashFunction::Md5, std::string{});
        assert(!accumulating.running_digest());
        assert(accumulating.append(chunk_a) == digest_a);
        accumulating.append(chunk_b);
        assert(accumulating.running_digest() == second->running_digest);
        assert(HashChain::fold(HashFunction::Md5, digest_a, digest_b) == second->running_digest);
        assert(HashChain::fold(HashFunction::Md5, std::nullopt, digest_b) == digest_b);

        assert(digests_equal("ABCdef", "abcDEF"));
        assert(!digests_equal("abc", "abcd"));
    }

    void test_human_readable_size()
    {
        assert(human_readable_size(0) == "0.00 B");
        assert(human_readable_size(1023) == "1023.00 B");
        assert(human_readable_size(1536) == "1.50 KB");
        assert(human_readable_size(1024ULL * 1024ULL) == "1.00 MB");
        assert(human_readable_size(64'000'000) == "61.04 MB");
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_unknown_command_rejected();
        test_response_roundtrip();
        test_error_details();
        test_error_codes();
        test_framing();
        test_base64();
        test_crypto_known_digests();
        test_crypto_sources_agree();
        test_session_ids();
        test_hash_chain();
        test_human_readable_size();
        run_server_component_tests();
        run_session_engine_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All unit tests passed\n";
    return 0;
}
