#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

#include "chunkup/server/blob_store.hpp"
#include "chunkup/server/config.hpp"
#include "chunkup/server/session_engine.hpp"
#include "chunkup/server/session_repository.hpp"

namespace chunkup::server
{

    // Owns the storage stack and the engine, accepts connections and sweeps idle uploads.
    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void open_acceptor();
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_sweep();
        void sweep_idle_uploads();
        void shutdown(int signal_number);

        std::chrono::seconds sweep_interval() const;

        ServerConfig config_;
        std::size_t worker_count_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer sweep_timer_;

        FileBlobStore blob_store_;
        FileSessionRepository repository_;
        SessionEngine engine_;

        std::atomic<std::uint64_t> accepted_{0};
        std::vector<std::thread> workers_;
    };

} // namespace chunkup::server
