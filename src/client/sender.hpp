#pragma once
#include <asio.hpp>
#include <string>
#include "messages.hpp"
#include "protocol.hpp"

namespace lanxfer {

struct SenderConfig {
    std::string server_host; uint16_t server_port{};
    std::string file_path;
    uint32_t chunk_size{kDefaultChunkSize};
    std::string device_name{"lanxfer-send"};
    std::string platform{"linux"};
    std::string app_version{"1.0.0"};
    std::string mime_type{"application/zip"};
    // When set, chunks travel as base64 file_chunk JSON lines instead of frames.
    bool json_chunks{false};
};

// Outcome of one send, as reported by the receiver's file_complete.
struct SendResult {
    bool success{false};
    std::string file_path;
    std::string error;
    std::string error_code;
};

// Blocking reference sender: handshake, file_start, chunks, file_end, then
// waits for file_complete. Connection and protocol problems are returned
// through SendResult with an empty error_code.
class Sender {
public:
    using tcp = asio::ip::tcp;

    explicit Sender(const SenderConfig& cfg);
    SendResult run();

private:
    bool connect(std::string& err);
    bool write_all(const void* data, size_t len, std::string& err);
    // Next JSON reply of the given type; other replies are logged and skipped.
    bool read_reply(const char* type, std::string& line, std::string& err);

    SenderConfig cfg_;
    asio::io_context io_;
    tcp::socket sock_;
    asio::streambuf in_;
};

} // namespace lanxfer
