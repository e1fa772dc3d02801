#include "protocol.hpp"
#include "logging.hpp"
#include <cctype>
#include <cstring>
#include <stdexcept>

namespace lanxfer {

static const char *kTag = "parser";

const char *to_string(MessageKind k) {
  switch (k) {
  case MessageKind::Incomplete:
    return "incomplete";
  case MessageKind::Skip:
    return "skip";
  case MessageKind::Json:
    return "json";
  default:
    return "binary_chunk";
  }
}

static ParsedMessage make_skip(size_t n) {
  ParsedMessage m;
  m.kind = MessageKind::Skip;
  m.consumed = n;
  return m;
}

ParsedMessage parse_binary_frame(const uint8_t *buf, size_t len) {
  if (len < kFramePrefixSize)
    return ParsedMessage{};
  if (buf[0] != kMagic0 || buf[1] != kMagic1) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "bad magic 0x%02x 0x%02x, skipping byte", buf[0],
                           buf[1]);
    return make_skip(1);
  }

  uint32_t total_len = read_u32_be(buf + 2);
  // 64-bit so a hostile length cannot wrap on 32-bit size_t
  uint64_t frame_len = (uint64_t)kFramePrefixSize + total_len;
  if ((uint64_t)len < frame_len)
    return ParsedMessage{};

  // Everything below may only look inside [0, frame_len).
  if (total_len < kChunkFixedBodySize) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "frame too short for header (total_len=%u)",
                           total_len);
    return make_skip((size_t)frame_len);
  }

  uint8_t type = buf[6];
  if (type != FT_FILE_CHUNK) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "unknown frame type 0x%02x, skipping %llu bytes",
                           type, (unsigned long long)frame_len);
    return make_skip((size_t)frame_len);
  }

  uint16_t tid_len = read_u16_be(buf + 7);
  uint64_t header_len = kFramePrefixSize + kChunkFixedBodySize + tid_len;
  if (frame_len < header_len) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "frame too short for transfer id (tid_len=%u "
                           "frame_len=%llu)",
                           (unsigned)tid_len, (unsigned long long)frame_len);
    return make_skip((size_t)frame_len);
  }

  ParsedMessage m;
  m.kind = MessageKind::BinaryChunk;
  m.consumed = (size_t)frame_len;
  m.transfer_id.assign((const char *)buf + 9, tid_len);
  m.chunk_index = read_u32_be(buf + 9 + tid_len);
  m.data.assign(buf + header_len, buf + frame_len);
  return m;
}

ParsedMessage parse_json_line(const uint8_t *buf, size_t len) {
  const void *nl = std::memchr(buf, kLineTerminator, len);
  if (!nl)
    return ParsedMessage{};
  size_t nl_idx = (size_t)((const uint8_t *)nl - buf);

  size_t b = 0, e = nl_idx;
  while (b < e && std::isspace(buf[b]))
    b++;
  while (e > b && std::isspace(buf[e - 1]))
    e--;
  if (b == e)
    return make_skip(nl_idx + 1); // blank line, heartbeat

  ParsedMessage m;
  m.kind = MessageKind::Json;
  m.consumed = nl_idx + 1;
  m.json.assign((const char *)buf + b, e - b);
  return m;
}

ParsedMessage parse_next(const uint8_t *buf, size_t len) {
  if (len == 0)
    return ParsedMessage{};
  if (buf[0] == kMagic0) {
    if (len == 1)
      return ParsedMessage{}; // could be the first half of the magic
    if (buf[1] == kMagic1)
      return parse_binary_frame(buf, len);
  }
  if (buf[0] == kJsonStart)
    return parse_json_line(buf, len);

  Logger::instance().log(LogLevel::DEBUG, kTag,
                         "unknown leading byte 0x%02x (buffered=%zu), "
                         "resynchronizing",
                         buf[0], len);
  return make_skip(1);
}

std::vector<uint8_t> encode_chunk_frame(const std::string &transfer_id,
                                        uint32_t chunk_index,
                                        const uint8_t *data, size_t len) {
  if (transfer_id.size() > 0xFFFF)
    throw std::length_error("transfer id longer than 65535 bytes");
  uint64_t total = kChunkFixedBodySize + transfer_id.size() + (uint64_t)len;
  if (total > 0xFFFFFFFFull)
    throw std::length_error("chunk frame exceeds 4 GiB");

  std::vector<uint8_t> out(kFramePrefixSize + (size_t)total);
  uint8_t *p = out.data();
  p[0] = kMagic0;
  p[1] = kMagic1;
  put_u32_be(p + 2, (uint32_t)total);
  p[6] = FT_FILE_CHUNK;
  put_u16_be(p + 7, (uint16_t)transfer_id.size());
  if (!transfer_id.empty())
    std::memcpy(p + 9, transfer_id.data(), transfer_id.size());
  put_u32_be(p + 9 + transfer_id.size(), chunk_index);
  if (len)
    std::memcpy(p + 13 + transfer_id.size(), data, len);
  return out;
}

std::vector<uint8_t> encode_json_line(const std::string &json) {
  std::vector<uint8_t> out(json.begin(), json.end());
  out.push_back(kLineTerminator);
  return out;
}

} // namespace lanxfer
