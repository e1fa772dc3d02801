#include "messages.hpp"
#include "checksum.hpp"
#include <nlohmann/json.hpp>

namespace lanxfer {

using json = nlohmann::json;

namespace {

bool get_string(const json &j, const char *key, std::string &out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string())
    return false;
  out = it->get<std::string>();
  return true;
}

bool get_u64(const json &j, const char *key, uint64_t &out) {
  auto it = j.find(key);
  if (it == j.end())
    return false;
  if (it->is_number_unsigned()) {
    out = it->get<uint64_t>();
    return true;
  }
  if (it->is_number_integer() && it->get<int64_t>() >= 0) {
    out = (uint64_t)it->get<int64_t>();
    return true;
  }
  return false;
}

bool get_u32(const json &j, const char *key, uint32_t &out) {
  uint64_t v = 0;
  if (!get_u64(j, key, v) || v > 0xFFFFFFFFull)
    return false;
  out = (uint32_t)v;
  return true;
}

DecodeStatus decode_handshake(const json &j, HandshakeMsg &m,
                              std::string &detail) {
  if (!get_string(j, "version", m.version)) {
    detail = "handshake requires string 'version'";
    return DecodeStatus::InvalidFields;
  }
  auto pit = j.find("platform");
  if (pit == j.end()) {
    detail = "handshake requires 'platform'";
    return DecodeStatus::InvalidFields;
  }
  if (pit->is_string())
    m.platform = pit->get<std::string>();
  if (!get_string(j, "deviceName", m.device_name) || m.device_name.empty())
    m.device_name = "Unknown Device";
  get_string(j, "appVersion", m.app_version);
  return DecodeStatus::Ok;
}

DecodeStatus decode_file_start(const json &j, FileStartMsg &m,
                               std::string &detail) {
  if (!get_string(j, "transferId", m.transfer_id) ||
      !get_string(j, "fileName", m.file_name) ||
      !get_u64(j, "fileSize", m.file_size) ||
      !get_string(j, "mimeType", m.mime_type) ||
      !get_string(j, "checksum", m.checksum) ||
      !get_u32(j, "totalChunks", m.total_chunks) ||
      !get_u32(j, "chunkSize", m.chunk_size)) {
    detail = "file_start requires transferId, fileName, fileSize, mimeType, "
             "checksum, totalChunks, chunkSize";
    return DecodeStatus::InvalidFields;
  }
  return DecodeStatus::Ok;
}

DecodeStatus decode_file_chunk(const json &j, FileChunkMsg &m,
                               std::string &detail) {
  std::string b64;
  if (!get_string(j, "transferId", m.transfer_id) ||
      !get_u32(j, "chunkIndex", m.chunk_index) ||
      !get_string(j, "data", b64)) {
    detail = "file_chunk requires transferId, chunkIndex, data";
    return DecodeStatus::InvalidFields;
  }
  if (!base64_decode(b64, m.data)) {
    detail = "file_chunk data is not valid base64";
    return DecodeStatus::InvalidFields;
  }
  return DecodeStatus::Ok;
}

} // namespace

DecodeStatus decode_control(const std::string &text, ControlMessage &out,
                            std::string &detail) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    detail = "invalid JSON";
    return DecodeStatus::ParseError;
  }
  if (!j.is_object()) {
    detail = "expected object";
    return DecodeStatus::NotObject;
  }

  std::string type;
  get_string(j, "type", type);

  if (type == "handshake") {
    HandshakeMsg m;
    auto st = decode_handshake(j, m, detail);
    if (st == DecodeStatus::Ok)
      out = std::move(m);
    return st;
  }
  if (type == "file_start") {
    FileStartMsg m;
    auto st = decode_file_start(j, m, detail);
    if (st == DecodeStatus::Ok)
      out = std::move(m);
    return st;
  }
  if (type == "file_chunk") {
    FileChunkMsg m;
    auto st = decode_file_chunk(j, m, detail);
    if (st == DecodeStatus::Ok)
      out = std::move(m);
    return st;
  }
  if (type == "file_end") {
    FileEndMsg m;
    if (!get_string(j, "transferId", m.transfer_id)) {
      detail = "file_end requires transferId";
      return DecodeStatus::InvalidFields;
    }
    out = std::move(m);
    return DecodeStatus::Ok;
  }
  if (type == "ping") {
    PingMsg m;
    m.has_payload = get_string(j, "payload", m.payload);
    out = std::move(m);
    return DecodeStatus::Ok;
  }
  out = UnknownMsg{type};
  return DecodeStatus::Ok;
}

const char *message_type(const ControlMessage &m) {
  switch (m.index()) {
  case 0:
    return "handshake";
  case 1:
    return "file_start";
  case 2:
    return "file_chunk";
  case 3:
    return "file_end";
  case 4:
    return "ping";
  default:
    return "unknown";
  }
}

std::string make_handshake_ack(bool accepted, const std::string &message) {
  json j = {{"type", "handshake_ack"}, {"accepted", accepted}};
  if (!message.empty())
    j["message"] = message;
  return j.dump();
}

std::string make_pong(const PingMsg &ping) {
  json j = {{"type", "pong"}, {"received", true}};
  if (ping.has_payload)
    j["payload"] = ping.payload;
  return j.dump();
}

std::string make_file_start_ack(const std::string &transfer_id, bool accepted,
                                const std::string &message) {
  json j = {{"type", "file_start_ack"},
            {"transferId", transfer_id},
            {"accepted", accepted}};
  if (!message.empty())
    j["message"] = message;
  return j.dump();
}

std::string make_file_complete(const FileCompleteReport &r) {
  json j = {{"type", "file_complete"},
            {"transferId", r.transfer_id},
            {"success", r.success},
            {"receivedChunks", r.received_chunks},
            {"receivedBytes", r.received_bytes}};
  if (!r.file_path.empty())
    j["filePath"] = r.file_path;
  if (!r.error.empty())
    j["error"] = r.error;
  if (!r.error_code.empty())
    j["errorCode"] = r.error_code;
  return j.dump();
}

std::string make_error(const std::string &error,
                       const std::string &error_code) {
  json j = {{"type", "error"}, {"error", error}};
  if (!error_code.empty())
    j["errorCode"] = error_code;
  return j.dump();
}

std::string make_handshake(const HandshakeMsg &m) {
  json j = {{"type", "handshake"},
            {"deviceName", m.device_name},
            {"version", m.version},
            {"platform", m.platform}};
  if (!m.app_version.empty())
    j["appVersion"] = m.app_version;
  return j.dump();
}

std::string make_file_start(const FileStartMsg &m) {
  json j = {{"type", "file_start"},      {"transferId", m.transfer_id},
            {"fileName", m.file_name},   {"fileSize", m.file_size},
            {"mimeType", m.mime_type},   {"checksum", m.checksum},
            {"totalChunks", m.total_chunks}, {"chunkSize", m.chunk_size}};
  return j.dump();
}

std::string make_file_chunk(const std::string &transfer_id,
                            uint32_t chunk_index, const uint8_t *data,
                            size_t len) {
  json j = {{"type", "file_chunk"},
            {"transferId", transfer_id},
            {"chunkIndex", chunk_index},
            {"data", base64_encode(data, len)}};
  return j.dump();
}

std::string make_file_end(const std::string &transfer_id) {
  json j = {{"type", "file_end"}, {"transferId", transfer_id}};
  return j.dump();
}

std::string make_ping(const std::string &payload) {
  json j = {{"type", "ping"}};
  if (!payload.empty())
    j["payload"] = payload;
  return j.dump();
}

} // namespace lanxfer
