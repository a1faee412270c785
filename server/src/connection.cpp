#include "chunkup/server/connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "chunkup/framing.hpp"

namespace chunkup::server
{

    Connection::Connection(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services) {}

    void Connection::start()
    {
        spdlog::info("Client connected from {}", remote_endpoint());
        read_frame_header();
    }

    void Connection::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", remote_endpoint());
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Connection::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = chunkup::protocol::decode_frame_length(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("Dropping {}: {}", remote_endpoint(), ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Connection::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const std::string payload(reinterpret_cast<const char *>(buffer_.data()), buffer_.size());
                                 const auto json = nlohmann::json::parse(payload);
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(chunkup::ErrorCode::InvalidPayload, ex.what());
                             }
                         });
    }

    void Connection::process_message(const nlohmann::json &json)
    {
        chunkup::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<chunkup::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(chunkup::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", remote_endpoint(), chunkup::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case chunkup::protocol::Command::UploadStart:
            handle_upload_start(envelope);
            break;
        case chunkup::protocol::Command::UploadChunk:
            handle_upload_chunk(envelope);
            break;
        case chunkup::protocol::Command::UploadStatus:
            handle_upload_status(envelope);
            break;
        case chunkup::protocol::Command::Ping:
            handle_ping(envelope);
            break;
        default:
            send_error(chunkup::ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Connection::send_response(const chunkup::protocol::ResponseEnvelope &envelope)
    {
        try
        {
            const auto json = nlohmann::json(envelope);
            auto frame = std::make_shared<std::vector<std::uint8_t>>(chunkup::protocol::encode_frame(json));
            auto self = shared_from_this();
            asio::async_write(socket_, asio::buffer(*frame),
                              [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                              {
                                  if (ec)
                                  {
                                      stop();
                                      return;
                                  }
                                  read_frame_header();
                              });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to send response to {}: {}", remote_endpoint(), ex.what());
            stop();
        }
    }

    void Connection::send_ok(const protocol::SessionSnapshot &snapshot, const std::optional<std::string> &request_id)
    {
        chunkup::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkup::protocol::ResponseKind::Ok;
        envelope.payload = snapshot;
        envelope.request_id = request_id;
        send_response(envelope);
    }

    void Connection::send_error(chunkup::ErrorCode code, std::string message, std::optional<std::string> request_id,
                                std::optional<std::uint32_t> remaining_retries)
    {
        chunkup::protocol::ResponseEnvelope envelope;
        envelope.kind = chunkup::protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.payload = chunkup::protocol::ErrorDetails{remaining_retries};
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        try
        {
            return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }
        catch (const std::exception &)
        {
            return "unknown";
        }
    }

} // namespace chunkup::server
