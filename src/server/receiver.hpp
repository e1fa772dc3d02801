#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "messages.hpp"
#include "protocol.hpp"
#include "reassembler.hpp"
#include "state_store.hpp"

namespace lanxfer {

struct ServerConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{0}; // 0 picks an ephemeral port
    ReassemblerConfig transfer;
    // A zero duration disables the corresponding timeout.
    std::chrono::milliseconds handshake_timeout{30 * 1000};
    std::chrono::milliseconds idle_timeout{2 * 60 * 1000};
    std::chrono::milliseconds transfer_timeout{10 * 60 * 1000};
    std::chrono::milliseconds progress_interval{250};
    // Upper bound on bytes buffered while waiting for a message to complete.
    // Raised as needed so the largest acceptable chunk always fits.
    size_t max_buffered_bytes{8 * 1024 * 1024};
};

// The receiver's view of the connected peer. Implemented over a socket by
// TransferServer and by a recorder in tests.
class PeerLink {
public:
    virtual ~PeerLink() = default;
    // json is one document without the trailing newline.
    virtual void send_line(const std::string& json) = 0;
    virtual void close() = 0;
};

// Connection/transfer state machine. Knows nothing about sockets: the
// transport feeds it events and bytes, it answers through PeerLink and
// publishes every transition to the StateStore. Not thread-safe; all calls
// must come from the same thread.
class Receiver {
public:
    using clock = std::chrono::steady_clock;

    Receiver(const ServerConfig& cfg, StateStore& store);

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    void start();
    void bound(uint16_t port);
    void bind_failed(const std::string& message);
    // false when the receiver is not ready for a peer; the caller closes it.
    bool peer_connected(std::shared_ptr<PeerLink> link);
    // Bytes from any link other than the current peer are dropped.
    void on_bytes(const PeerLink* link, const uint8_t* data, size_t n);
    void peer_closed(const PeerLink* link);
    void on_tick(clock::time_point now);
    void stop();
    void clear_completed_file();

    ServerStatus status() const { return status_; }
    bool has_peer() const { return link_ != nullptr; }
    const Reassembler& reassembler() const { return reassembler_; }
    uint64_t skipped_bytes() const { return skipped_bytes_; }
    size_t buffer_limit() const { return buffer_limit_; }

private:
    void dispatch(const ParsedMessage& m);
    void handle_json(const std::string& text);
    void handle_handshake(const HandshakeMsg& m);
    void handle_file_start(const FileStartMsg& m);
    void handle_chunk(const std::string& transfer_id, uint32_t chunk_index,
                      const uint8_t* data, size_t len);
    void handle_file_end(const FileEndMsg& m);
    void handle_ping(const PingMsg& m);

    void finish_transfer(const std::string& transfer_id, uint32_t chunks, uint64_t bytes,
                         const std::string& path, const TransferError& err);
    void drop_peer(ServerStatus next, const char* reason,
                   const std::optional<LastError>& error = std::nullopt);
    void publish_progress(bool force);
    void send(const std::string& json);

    ServerConfig cfg_;
    StateStore& store_;
    Reassembler reassembler_;
    ServerStatus status_{ServerStatus::Idle};
    std::shared_ptr<PeerLink> link_;
    std::vector<uint8_t> inbuf_;
    size_t buffer_limit_;
    uint64_t skipped_bytes_{0};

    clock::time_point connected_at_;
    clock::time_point last_activity_;
    clock::time_point transfer_started_;
    clock::time_point last_progress_;
    bool progress_pending_{false};
};

} // namespace lanxfer
