#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "reassembler.hpp"

namespace lanxfer {

enum class ServerStatus {
    Idle,
    Starting,
    Listening,
    Handshaking,
    Connected,
    ReceivingFile,
    Error
};
const char* to_string(ServerStatus s);

struct ClientInfo {
    std::string device_name;
    std::string platform;
    std::string version;
    std::string app_version;
};

enum class ErrorKind { ProtocolMismatch, Transfer, Bind, Io };
const char* to_string(ErrorKind k);

struct LastError {
    ErrorKind kind{ErrorKind::Io};
    std::string message;
};

struct ServerState {
    ServerStatus status{ServerStatus::Idle};
    uint16_t port{0}; // 0 while not listening
    std::optional<ClientInfo> connected_client;
    std::optional<TransferProgress> file_transfer;
    std::optional<LastError> last_error;
    std::optional<std::string> completed_file_path;
};

// Holds the current ServerState as an immutable snapshot. Writers replace
// the snapshot wholesale; readers on any thread get a shared_ptr that never
// changes under them.
class StateStore {
public:
    using Snapshot = std::shared_ptr<const ServerState>;
    using Listener = std::function<void(const Snapshot&)>;
    using Unsubscribe = std::function<void()>;

    StateStore();

    Snapshot get_snapshot() const;
    // The returned callable removes the listener; calling it twice is harmless.
    Unsubscribe subscribe(Listener l);

    // Copies the state, applies fn, publishes and notifies every listener.
    void update(const std::function<void(ServerState&)>& fn);

    size_t listener_count() const;

private:
    struct Shared {
        std::mutex mtx;
        std::map<uint64_t, Listener> listeners;
        uint64_t next_id{1};
    };

    mutable std::mutex mtx_;
    Snapshot snapshot_;
    std::shared_ptr<Shared> shared_;
};

} // namespace lanxfer
