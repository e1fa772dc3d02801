#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include "receiver.hpp"
#include "state_store.hpp"

namespace lanxfer {

// Socket plumbing around Receiver: one acceptor, at most one live peer,
// and a periodic tick driving the receiver's timeouts. Everything runs on
// the io_context; start() and stop() may be called from any thread.
class TransferServer {
public:
    using tcp = asio::ip::tcp;

    TransferServer(asio::io_context& io, const ServerConfig& cfg, StateStore& store);
    ~TransferServer();

    void start();
    void stop();
    void clear_completed_file();

private:
    struct Conn : public PeerLink, public std::enable_shared_from_this<Conn> {
        tcp::socket sock;
        std::vector<uint8_t> read_buf;
        std::deque<std::string> write_q;
        bool closed{false};

        explicit Conn(tcp::socket s) : sock(std::move(s)), read_buf(64*1024) {}
        void send_line(const std::string& json) override;
        // Pending writes are flushed before the socket is shut down.
        void close() override;
        void do_write();
        void shutdown();
    };

    void do_start();
    void do_stop();
    void do_accept();
    void do_read(std::shared_ptr<Conn> c);
    void arm_tick();

    asio::io_context& io_;
    ServerConfig cfg_;
    Receiver receiver_;
    tcp::acceptor acceptor_;
    asio::steady_timer tick_;
    bool running_{false};
};

} // namespace lanxfer
