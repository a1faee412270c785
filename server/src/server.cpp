#include "chunkup/server/server.hpp"

#include <asio/ip/address.hpp>

#include <algorithm>
#include <csignal>

#include <spdlog/spdlog.h>

#include "chunkup/server/connection.hpp"
#include "chunkup/size_format.hpp"

namespace chunkup::server
{

    namespace
    {
        constexpr std::chrono::seconds kMaxSweepInterval{std::chrono::minutes{10}};
        constexpr std::chrono::seconds kMinSweepInterval{1};

        std::size_t worker_threads_for(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            return std::max(2u, std::thread::hardware_concurrency());
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          worker_count_(worker_threads_for(config_.worker_threads)),
          io_context_(static_cast<int>(worker_count_)),
          acceptor_(io_context_),
          signals_(io_context_, SIGINT, SIGTERM),
          sweep_timer_(io_context_),
          blob_store_(config_.root),
          repository_(config_.root),
          engine_(config_.upload, blob_store_, repository_)
    {
        open_acceptor();

        const auto &upload = config_.upload;
        spdlog::info("Storing uploads below {}", std::filesystem::absolute(config_.root).string());
        spdlog::info("Chunks of {} hashed with {}, {} retries per chunk, max file size {}",
                     human_readable_size(upload.chunk_size), crypto::to_string(upload.hash_function),
                     upload.retry_budget,
                     upload.max_file_size ? human_readable_size(*upload.max_file_size) : std::string("unlimited"));
        spdlog::info("Idle uploads expire after {}s", config_.idle_timeout.count());

        signals_.async_wait([this](const std::error_code &ec, int signal_number)
                            {
                                if (!ec)
                                {
                                    shutdown(signal_number);
                                }
                            });
    }

    void Server::open_acceptor()
    {
        const asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.address), config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        spdlog::info("Listening on {}:{}", config_.address, config_.port);
    }

    void Server::run()
    {
        sweep_idle_uploads();
        schedule_sweep();
        accept_next();

        workers_.reserve(worker_count_ - 1);
        for (std::size_t i = 1; i < worker_count_; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Serving with {} threads", worker_count_);
        io_context_.run();

        for (auto &worker : workers_)
        {
            worker.join();
        }
        workers_.clear();
        spdlog::info("Server stopped after {} connections", accepted_.load());
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open())
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept failed: {}", ec.message());
        }
        else
        {
            ++accepted_;
            std::make_shared<Connection>(std::move(socket), ServerServices{engine_})->start();
        }
        accept_next();
    }

    std::chrono::seconds Server::sweep_interval() const
    {
        return std::clamp(config_.idle_timeout / 4, kMinSweepInterval, kMaxSweepInterval);
    }

    void Server::schedule_sweep()
    {
        sweep_timer_.expires_after(sweep_interval());
        sweep_timer_.async_wait([this](const std::error_code &ec)
                                {
                                    if (ec)
                                    {
                                        return;
                                    }
                                    sweep_idle_uploads();
                                    schedule_sweep();
                                });
    }

    void Server::sweep_idle_uploads()
    {
        const auto expired = engine_.expire_idle(config_.idle_timeout);
        if (expired > 0)
        {
            spdlog::info("Idle sweep failed {} abandoned uploads", expired);
        }
    }

    void Server::shutdown(int signal_number)
    {
        spdlog::info("Received signal {}, shutting down", signal_number);
        std::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        io_context_.stop();
    }

} // namespace chunkup::server
