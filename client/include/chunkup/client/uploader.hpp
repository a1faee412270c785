#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkup/client/chunk_plan.hpp"
#include "chunkup/client/config.hpp"
#include "chunkup/client/logger.hpp"
#include "chunkup/client/transfer_state_store.hpp"
#include "chunkup/protocol.hpp"

namespace chunkup::client
{

    class Uploader
    {
    public:
        Uploader(ClientConfig config, Logger logger);

        int run();

    private:
        struct ActiveUpload
        {
            protocol::SessionSnapshot snapshot;
            ChunkPlan plan;
        };

        void connect();
        bool upload(const std::filesystem::path &local_path);
        std::optional<ActiveUpload> try_resume(const TransferStateStore::Entry &entry,
                                               const std::filesystem::path &local_path);
        std::optional<ActiveUpload> start_new(const std::filesystem::path &local_path, std::uint64_t file_size);
        bool send_chunks(const std::filesystem::path &local_path, ActiveUpload &upload);

        ChunkPlan plan_file(const std::filesystem::path &local_path, crypto::HashFunction function,
                            std::uint64_t chunk_size) const;

        protocol::ResponseEnvelope rpc(protocol::Command command,
                                       const nlohmann::json &payload = nlohmann::json::object());
        void print_error(const protocol::ResponseEnvelope &response) const;
        std::string endpoint() const;
        std::string next_request_id();

        ClientConfig config_;
        Logger logger_;
        TransferStateStore state_store_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::uint64_t request_counter_{0};
    };

} // namespace chunkup::client
