#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace lanxfer {

// Binary chunk frames start with 'C' 'S'; control messages are JSON lines.
constexpr uint8_t kMagic0 = 0x43;
constexpr uint8_t kMagic1 = 0x53;
constexpr uint8_t kJsonStart = 0x7B;     // '{'
constexpr uint8_t kLineTerminator = 0x0A; // '\n'

enum FrameType : uint8_t {
    FT_FILE_CHUNK = 0x01
};

// magic(2) + total_len(4)
constexpr size_t kFramePrefixSize = 6;
// type(1) + tid_len(2) + chunk_index(4), not counting the transfer id itself
constexpr size_t kChunkFixedBodySize = 7;

constexpr const char* kProtocolVersion = "1";
constexpr uint32_t kDefaultChunkSize = 512 * 1024;

enum class MessageKind : uint8_t {
    Incomplete = 0,
    Skip,
    Json,
    BinaryChunk
};

const char* to_string(MessageKind k);

// Result of peeling one message off the front of a receive buffer.
// consumed is 0 only for Incomplete.
struct ParsedMessage {
    MessageKind kind{MessageKind::Incomplete};
    size_t consumed{0};
    std::string json;
    std::string transfer_id;
    uint32_t chunk_index{0};
    std::vector<uint8_t> data;
};

ParsedMessage parse_next(const uint8_t* buf, size_t len);
ParsedMessage parse_binary_frame(const uint8_t* buf, size_t len);
ParsedMessage parse_json_line(const uint8_t* buf, size_t len);

std::vector<uint8_t> encode_chunk_frame(const std::string& transfer_id, uint32_t chunk_index,
                                        const uint8_t* data, size_t len);
std::vector<uint8_t> encode_json_line(const std::string& json);

inline uint16_t read_u16_be(const uint8_t* p) {
    return (uint16_t)(((uint16_t)p[0] << 8) | p[1]);
}
inline uint32_t read_u32_be(const uint8_t* p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | p[3];
}
inline void put_u16_be(uint8_t* p, uint16_t v) {
    p[0] = (uint8_t)(v >> 8);
    p[1] = (uint8_t)v;
}
inline void put_u32_be(uint8_t* p, uint32_t v) {
    p[0] = (uint8_t)(v >> 24);
    p[1] = (uint8_t)(v >> 16);
    p[2] = (uint8_t)(v >> 8);
    p[3] = (uint8_t)v;
}

} // namespace lanxfer
