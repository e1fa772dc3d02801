#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace lanxfer {

// Incoming control messages (sender -> receiver).

struct HandshakeMsg {
    std::string device_name;
    std::string version;
    std::string platform;
    std::string app_version;
};

struct FileStartMsg {
    std::string transfer_id;
    std::string file_name;
    uint64_t file_size{0};
    std::string mime_type;
    std::string checksum;
    uint32_t total_chunks{0};
    uint32_t chunk_size{0};
};

// Legacy JSON chunk mode: data travels base64 encoded inside the line.
struct FileChunkMsg {
    std::string transfer_id;
    uint32_t chunk_index{0};
    std::vector<uint8_t> data;
};

struct FileEndMsg {
    std::string transfer_id;
};

struct PingMsg {
    bool has_payload{false};
    std::string payload;
};

struct UnknownMsg {
    std::string type;
};

using ControlMessage =
    std::variant<HandshakeMsg, FileStartMsg, FileChunkMsg, FileEndMsg, PingMsg, UnknownMsg>;

enum class DecodeStatus {
    Ok,
    ParseError,    // not JSON
    NotObject,     // JSON, but not an object
    InvalidFields  // known type with missing or mistyped fields
};

DecodeStatus decode_control(const std::string& text, ControlMessage& out, std::string& detail);

const char* message_type(const ControlMessage& m);

// Outgoing control messages (receiver -> sender). Each returns one JSON
// document without the line terminator.

std::string make_handshake_ack(bool accepted, const std::string& message = "");
std::string make_pong(const PingMsg& ping);
std::string make_file_start_ack(const std::string& transfer_id, bool accepted,
                                const std::string& message = "");

struct FileCompleteReport {
    std::string transfer_id;
    bool success{false};
    std::string file_path;
    std::string error;
    std::string error_code;
    uint32_t received_chunks{0};
    uint64_t received_bytes{0};
};
std::string make_file_complete(const FileCompleteReport& r);
std::string make_error(const std::string& error, const std::string& error_code);

// Sender side encoders.
std::string make_handshake(const HandshakeMsg& m);
std::string make_file_start(const FileStartMsg& m);
std::string make_file_chunk(const std::string& transfer_id, uint32_t chunk_index,
                            const uint8_t* data, size_t len);
std::string make_file_end(const std::string& transfer_id);
std::string make_ping(const std::string& payload);

} // namespace lanxfer
