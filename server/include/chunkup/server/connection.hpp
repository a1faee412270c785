#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chunkup/error_codes.hpp"
#include "chunkup/framing.hpp"
#include "chunkup/protocol.hpp"
#include "chunkup/server/session_engine.hpp"

namespace chunkup::server
{

    struct ServerServices
    {
        SessionEngine &engine;
    };

    // One client socket. Reads framed requests, dispatches them to the engine and
    // writes framed responses until the peer disconnects. Every request gets exactly one
    // response and the next frame is read only after that response is written, so at most
    // one operation is outstanding per connection.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const chunkup::protocol::ResponseEnvelope &envelope);
        void send_ok(const protocol::SessionSnapshot &snapshot, const std::optional<std::string> &request_id);
        void send_error(chunkup::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt,
                        std::optional<std::uint32_t> remaining_retries = std::nullopt);

        // Command handlers
        void handle_upload_start(const chunkup::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const chunkup::protocol::RequestEnvelope &envelope);
        void handle_upload_status(const chunkup::protocol::RequestEnvelope &envelope);
        void handle_ping(const chunkup::protocol::RequestEnvelope &envelope);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        bool closed_{false};

        std::array<std::uint8_t, chunkup::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
    };

} // namespace chunkup::server
