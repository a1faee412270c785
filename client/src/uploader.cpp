#include "chunkup/client/uploader.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <iostream>
#include <span>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "chunkup/encoding/base64.hpp"
#include "chunkup/error_codes.hpp"
#include "chunkup/framing.hpp"

namespace chunkup::client
{

    namespace
    {
        constexpr auto kSuccessful = "SUCCESSFUL";
        constexpr auto kFailed = "FAILED";

        TransferStateStore open_state_store(const ClientConfig &config)
        {
            if (config.state_path)
            {
                return TransferStateStore(*config.state_path);
            }
            return TransferStateStore();
        }

    } // namespace

    Uploader::Uploader(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          state_store_(open_state_store(config_)),
          socket_(io_context_) {}

    int Uploader::run()
    {
        try
        {
            connect();
            return upload(config_.file) ? 0 : 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.error("fatal", "{}", ex.what());
            return 1;
        }
    }

    void Uploader::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.info("connect", "connected to {}", endpoint());
    }

    bool Uploader::upload(const std::filesystem::path &local_path)
    {
        const auto absolute_local = std::filesystem::absolute(local_path);
        if (!std::filesystem::exists(absolute_local))
        {
            std::cout << "ERROR: file_not_found" << std::endl;
            std::cout << "Local file does not exist." << std::endl;
            state_store_.remove(endpoint(), absolute_local);
            return false;
        }
        if (!std::filesystem::is_regular_file(absolute_local))
        {
            std::cout << "ERROR: invalid_target" << std::endl;
            std::cout << "Local path is not a file." << std::endl;
            return false;
        }
        const auto file_size = std::filesystem::file_size(absolute_local);

        std::optional<ActiveUpload> active;
        if (auto entry = state_store_.find(endpoint(), absolute_local))
        {
            if (!config_.fresh && entry->file_size == file_size)
            {
                active = try_resume(*entry, absolute_local);
            }
            if (!active)
            {
                state_store_.remove(endpoint(), absolute_local);
            }
        }
        if (!active)
        {
            active = start_new(absolute_local, file_size);
            if (!active)
            {
                return false;
            }
        }

        if (!send_chunks(absolute_local, *active))
        {
            return false;
        }
        state_store_.remove(endpoint(), absolute_local);
        std::cout << "OK " << active->snapshot.session_id << std::endl;
        logger_.info("complete", "{} size={}", active->snapshot.session_id, active->snapshot.current_file_size);
        return true;
    }

    std::optional<Uploader::ActiveUpload> Uploader::try_resume(const TransferStateStore::Entry &entry,
                                                               const std::filesystem::path &local_path)
    {
        const auto status = rpc(protocol::Command::UploadStatus, protocol::UploadStatusRequest{entry.session_id});
        if (status.kind == protocol::ResponseKind::Error)
        {
            std::cout << "Previous upload " << entry.session_id << " is no longer available, starting over"
                      << std::endl;
            return std::nullopt;
        }

        auto snapshot = status.payload.get<protocol::SessionSnapshot>();
        if (snapshot.status == kFailed)
        {
            std::cout << "Previous upload failed (" << snapshot.error_message.value_or("unknown error")
                      << "), starting over" << std::endl;
            return std::nullopt;
        }
        if (snapshot.status == kSuccessful)
        {
            return ActiveUpload{std::move(snapshot), ChunkPlan{}};
        }

        const auto function = crypto::hash_function_from_string(entry.hash_function);
        if (!function)
        {
            return std::nullopt;
        }
        auto plan = plan_file(local_path, *function, entry.chunk_size);
        if (plan.file_size != snapshot.original_file_size || !plan.matches(snapshot.offset, snapshot.running_digest))
        {
            std::cout << "Local file changed since the interrupted upload, starting over" << std::endl;
            logger_.warn("resume", "digest mismatch for {} at offset {}", entry.session_id, snapshot.offset);
            return std::nullopt;
        }

        protocol::UploadStartRequest request{
            .session_id = entry.session_id,
            .offset = snapshot.offset,
            .owner = config_.owner,
        };
        const auto resumed = rpc(protocol::Command::UploadStart, request);
        if (resumed.kind == protocol::ResponseKind::Error)
        {
            print_error(resumed);
            return std::nullopt;
        }
        snapshot = resumed.payload.get<protocol::SessionSnapshot>();
        std::cout << "Resuming upload from byte " << snapshot.offset << std::endl;
        return ActiveUpload{std::move(snapshot), std::move(plan)};
    }

    std::optional<Uploader::ActiveUpload> Uploader::start_new(const std::filesystem::path &local_path,
                                                              std::uint64_t file_size)
    {
        protocol::UploadStartRequest request{
            .file_name = local_path.filename().string(),
            .file_size = file_size,
            .owner = config_.owner,
        };
        if (config_.hash_function)
        {
            request.hash_function = std::string(crypto::to_string(*config_.hash_function));
        }

        const auto response = rpc(protocol::Command::UploadStart, request);
        if (response.kind == protocol::ResponseKind::Error)
        {
            print_error(response);
            return std::nullopt;
        }
        auto snapshot = response.payload.get<protocol::SessionSnapshot>();

        const auto function = crypto::hash_function_from_string(snapshot.hash_function);
        if (!function)
        {
            throw std::runtime_error("Server selected an unknown hash function: " + snapshot.hash_function);
        }
        const auto chunk_size = config_.chunk_size.value_or(snapshot.chunk_size);
        if (chunk_size == 0 || chunk_size > protocol::kMaxChunkSize)
        {
            throw std::runtime_error("Unusable chunk size " + std::to_string(chunk_size));
        }

        auto plan = plan_file(local_path, *function, chunk_size);
        if (plan.file_size != file_size)
        {
            throw std::runtime_error("Local file changed while hashing");
        }

        state_store_.upsert(TransferStateStore::Entry{
            .endpoint = endpoint(),
            .local_path = local_path,
            .session_id = snapshot.session_id,
            .file_size = file_size,
            .chunk_size = chunk_size,
            .hash_function = snapshot.hash_function,
        });
        logger_.info("start", "{} file={} chunks={} hash={}", snapshot.session_id, local_path.string(),
                     plan.chunk_count(), snapshot.hash_function);
        return ActiveUpload{std::move(snapshot), std::move(plan)};
    }

    bool Uploader::send_chunks(const std::filesystem::path &local_path, ActiveUpload &upload)
    {
        auto &snapshot = upload.snapshot;
        const auto &plan = upload.plan;
        if (snapshot.status == kSuccessful)
        {
            return true;
        }

        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open())
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Could not open local file for reading." << std::endl;
            return false;
        }

        std::vector<char> buffer(static_cast<std::size_t>(plan.chunk_size));
        while (snapshot.status != kSuccessful)
        {
            const auto offset = snapshot.offset;
            const auto index = static_cast<std::size_t>(offset / plan.chunk_size);
            if (index >= plan.chunk_count())
            {
                std::cout << std::endl << "ERROR: upload_incomplete" << std::endl;
                std::cout << "Server holds every byte but did not complete the upload." << std::endl;
                return false;
            }

            const auto expected = static_cast<std::size_t>(std::min(plan.chunk_size, plan.file_size - offset));
            in.clear();
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(buffer.data(), static_cast<std::streamsize>(expected));
            if (static_cast<std::size_t>(in.gcount()) != expected)
            {
                throw std::runtime_error("Local file changed during upload");
            }
            const auto bytes = std::as_bytes(std::span(buffer.data(), expected));

            protocol::UploadChunkRequest chunk{
                .session_id = snapshot.session_id,
                .offset = offset,
                .data_base64 = chunkup::encoding::encode_base64(bytes),
                .chunk_hash = plan.chunk_digests[index],
            };
            if (index + 1 == plan.chunk_count())
            {
                chunk.final_hash = plan.final_digest();
            }

            const auto response = rpc(protocol::Command::UploadChunk, chunk);
            if (response.kind == protocol::ResponseKind::Error)
            {
                const auto details = response.payload.get<protocol::ErrorDetails>();
                if (details.remaining_retries)
                {
                    logger_.warn("chunk", "{} offset={} retries_left={}", snapshot.session_id, offset,
                                 *details.remaining_retries);
                    std::cout << std::endl
                              << "Chunk at byte " << offset << " rejected (" << response.message << "), retrying, "
                              << *details.remaining_retries << " retries left" << std::endl;
                    continue;
                }
                std::cout << std::endl;
                print_error(response);
                if (chunkup::is_terminal(response.error))
                {
                    state_store_.remove(endpoint(), local_path);
                }
                return false;
            }

            snapshot = response.payload.get<protocol::SessionSnapshot>();
            std::cout << "\rUploaded " << snapshot.offset << " / " << snapshot.original_file_size << " bytes ("
                      << snapshot.hr_current_file_size << ")" << std::flush;
        }
        std::cout << std::endl;
        return true;
    }

    ChunkPlan Uploader::plan_file(const std::filesystem::path &local_path, crypto::HashFunction function,
                                  std::uint64_t chunk_size) const
    {
        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open local file for hashing: " + local_path.string());
        }
        return plan_chunks(in, function, chunk_size);
    }

    void Uploader::print_error(const protocol::ResponseEnvelope &response) const
    {
        std::cout << "ERROR: " << chunkup::to_string(response.error) << std::endl;
        if (!response.message.empty())
        {
            std::cout << response.message << std::endl;
        }
    }

    protocol::ResponseEnvelope Uploader::rpc(protocol::Command command, const nlohmann::json &payload)
    {
        protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        const auto frame = protocol::encode_frame(nlohmann::json(envelope));
        asio::write(socket_, asio::buffer(frame));

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = protocol::decode_frame_length(header);
        std::vector<char> buffer(size);
        asio::read(socket_, asio::buffer(buffer.data(), buffer.size()));

        nlohmann::json json_response;
        try
        {
            json_response = nlohmann::json::parse(std::string(buffer.begin(), buffer.end()));
        }
        catch (const std::exception &ex)
        {
            logger_.error("rpc", "unparsable response size={}: {}", size, ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
        auto response = json_response.get<protocol::ResponseEnvelope>();
        if (response.kind == protocol::ResponseKind::Error)
        {
            logger_.warn("rpc", "{} -> {}: {}", protocol::to_string(command), chunkup::to_string(response.error),
                         response.message);
        }
        else
        {
            logger_.info("rpc", "{} -> OK", protocol::to_string(command));
        }
        return response;
    }

    std::string Uploader::endpoint() const
    {
        return config_.host + ":" + std::to_string(config_.port);
    }

    std::string Uploader::next_request_id()
    {
        std::ostringstream oss;
        oss << "req-" << (++request_counter_);
        return oss.str();
    }

} // namespace chunkup::client
