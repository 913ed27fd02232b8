#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "dropdeck/server/atomic_writer.hpp"
#include "dropdeck/server/broadcaster.hpp"
#include "dropdeck/server/chunk_store.hpp"
#include "dropdeck/server/config.hpp"
#include "dropdeck/server/filesystem.hpp"
#include "dropdeck/server/transfer_index.hpp"
#include "dropdeck/server/transfer_service.hpp"

namespace dropdeck::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;

        // Declared ahead of io_context_: sessions still owned by pending handlers unsubscribe
        // from broadcaster_ when the context is destroyed.
        Filesystem filesystem_;
        AtomicWriter writer_;
        ChunkStore chunk_store_;
        TransferIndex transfer_index_;
        Broadcaster broadcaster_;
        TransferService transfer_service_;

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        std::vector<std::thread> workers_;
    };

} // namespace dropdeck::server
