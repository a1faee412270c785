#include "chunkup/server/connection.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkup/encoding/base64.hpp"

namespace chunkup::server
{

    void Connection::handle_upload_start(const chunkup::protocol::RequestEnvelope &envelope)
    {
        chunkup::protocol::UploadStartRequest request;
        try
        {
            request = envelope.payload.get<chunkup::protocol::UploadStartRequest>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkup::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
            return;
        }

        try
        {
            auto outcome = services_.engine.start_or_resume(StartRequest{
                .session_id = request.session_id,
                .offset = request.offset,
                .file_name = request.file_name,
                .file_size = request.file_size,
                .hash_function = request.hash_function,
                .owner = request.owner,
            });
            if (!outcome)
            {
                const auto &error = outcome.error();
                send_error(error.code, error.message, envelope.request_id, error.remaining_retries);
                return;
            }
            send_ok(make_snapshot(outcome.value()), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("UPLOAD_START failed for {}: {}", remote_endpoint(), ex.what());
            send_error(chunkup::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::handle_upload_chunk(const chunkup::protocol::RequestEnvelope &envelope)
    {
        chunkup::protocol::UploadChunkRequest request;
        try
        {
            request = envelope.payload.get<chunkup::protocol::UploadChunkRequest>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkup::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
            return;
        }

        auto data = chunkup::encoding::decode_base64(request.data_base64);
        if (!data)
        {
            send_error(chunkup::ErrorCode::InvalidPayload, "Invalid chunk data", envelope.request_id);
            return;
        }

        try
        {
            auto outcome = services_.engine.append_chunk(AppendRequest{
                .session_id = std::move(request.session_id),
                .offset = request.offset,
                .data = std::move(*data),
                .chunk_hash = std::move(request.chunk_hash),
                .final_hash = std::move(request.final_hash),
            });
            if (!outcome)
            {
                const auto &error = outcome.error();
                send_error(error.code, error.message, envelope.request_id, error.remaining_retries);
                return;
            }
            send_ok(make_snapshot(outcome.value()), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("UPLOAD_CHUNK failed for {}: {}", remote_endpoint(), ex.what());
            send_error(chunkup::ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Connection::handle_upload_status(const chunkup::protocol::RequestEnvelope &envelope)
    {
        chunkup::protocol::UploadStatusRequest request;
        try
        {
            request = envelope.payload.get<chunkup::protocol::UploadStatusRequest>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(chunkup::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
            return;
        }

        const auto outcome = services_.engine.find(request.session_id);
        if (!outcome)
        {
            send_error(outcome.error().code, outcome.error().message, envelope.request_id);
            return;
        }
        send_ok(make_snapshot(outcome.value()), envelope.request_id);
    }

    void Connection::handle_ping(const chunkup::protocol::RequestEnvelope &envelope)
    {
        chunkup::protocol::ResponseEnvelope response;
        response.payload = {{"pong", true}};
        response.request_id = envelope.request_id;
        send_response(response);
    }

} // namespace chunkup::server
