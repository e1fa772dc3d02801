#include "sender.hpp"
#include "checksum.hpp"
#include "logging.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sodium.h>

namespace lanxfer {

using json = nlohmann::json;

static const char *kTag = "send";

static std::string new_transfer_id() {
  uint8_t raw[8];
  randombytes_buf(raw, sizeof(raw));
  char hex[sizeof(raw) * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), raw, sizeof(raw));
  return std::string("tx-") + hex;
}

static std::string str_field(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string())
    return std::string();
  return it->get<std::string>();
}

Sender::Sender(const SenderConfig &cfg) : cfg_(cfg), sock_(io_) {}

bool Sender::connect(std::string &err) {
  std::error_code ec;
  tcp::resolver res(io_);
  auto results =
      res.resolve(cfg_.server_host, std::to_string(cfg_.server_port), ec);
  if (!ec)
    asio::connect(sock_, results, ec);
  if (ec) {
    err = "connect to " + cfg_.server_host + ":" +
          std::to_string(cfg_.server_port) + " failed: " + ec.message();
    return false;
  }
  sock_.set_option(tcp::no_delay(true), ec);
  Logger::instance().log(LogLevel::INFO, kTag, "connected to %s:%u",
                         cfg_.server_host.c_str(), (unsigned)cfg_.server_port);
  return true;
}

bool Sender::write_all(const void *data, size_t len, std::string &err) {
  std::error_code ec;
  asio::write(sock_, asio::buffer(data, len), ec);
  if (ec) {
    err = "write failed: " + ec.message();
    return false;
  }
  return true;
}

bool Sender::read_reply(const char *type, std::string &line, std::string &err) {
  for (;;) {
    std::error_code ec;
    size_t n = asio::read_until(sock_, in_, '\n', ec);
    if (ec) {
      err = ec == asio::error::eof ? "connection closed by receiver"
                                   : "read failed: " + ec.message();
      return false;
    }
    std::string text(asio::buffers_begin(in_.data()),
                     asio::buffers_begin(in_.data()) + n - 1);
    in_.consume(n);
    if (text.empty())
      continue;
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      Logger::instance().log(LogLevel::WARN, kTag, "unparsable reply: %s",
                             text.c_str());
      continue;
    }
    std::string t = str_field(j, "type");
    if (t == type) {
      line = text;
      return true;
    }
    if (t == "error") {
      Logger::instance().log(LogLevel::WARN, kTag, "receiver error: %s (%s)",
                             str_field(j, "error").c_str(),
                             str_field(j, "errorCode").c_str());
    } else {
      Logger::instance().log(LogLevel::DEBUG, kTag, "skipping reply %s",
                             t.c_str());
    }
  }
}

SendResult Sender::run() {
  SendResult r;
  namespace fs = std::filesystem;

  std::error_code fec;
  uint64_t size = fs::file_size(cfg_.file_path, fec);
  if (fec) {
    r.error = "cannot stat " + cfg_.file_path + ": " + fec.message();
    return r;
  }
  if (size == 0) {
    r.error = "refusing to send an empty file";
    return r;
  }
  if (cfg_.chunk_size == 0) {
    r.error = "chunk size must be positive";
    return r;
  }

  FileStartMsg start;
  start.transfer_id = new_transfer_id();
  start.file_name = fs::path(cfg_.file_path).filename().string();
  start.file_size = size;
  start.mime_type = cfg_.mime_type;
  start.chunk_size = cfg_.chunk_size;
  uint64_t chunks = (size + cfg_.chunk_size - 1) / cfg_.chunk_size;
  if (chunks > UINT32_MAX) {
    r.error = "file needs too many chunks";
    return r;
  }
  start.total_chunks = (uint32_t)chunks;
  if (!sha256_file(cfg_.file_path, start.checksum)) {
    r.error = "cannot read " + cfg_.file_path;
    return r;
  }

  if (!connect(r.error))
    return r;

  HandshakeMsg hello{cfg_.device_name, kProtocolVersion, cfg_.platform,
                     cfg_.app_version};
  auto line = encode_json_line(make_handshake(hello));
  std::string reply;
  if (!write_all(line.data(), line.size(), r.error) ||
      !read_reply("handshake_ack", reply, r.error))
    return r;
  json ack = json::parse(reply, nullptr, false);
  if (!ack.value("accepted", false)) {
    r.error = "handshake rejected: " + str_field(ack, "message");
    return r;
  }

  line = encode_json_line(make_file_start(start));
  if (!write_all(line.data(), line.size(), r.error) ||
      !read_reply("file_start_ack", reply, r.error))
    return r;
  ack = json::parse(reply, nullptr, false);
  if (!ack.value("accepted", false)) {
    r.error = "file rejected: " + str_field(ack, "message");
    return r;
  }
  Logger::instance().log(LogLevel::INFO, kTag,
                         "sending %s (%llu bytes, %u chunks) as %s",
                         start.file_name.c_str(), (unsigned long long)size,
                         start.total_chunks, start.transfer_id.c_str());

  std::ifstream in(cfg_.file_path, std::ios::binary);
  if (!in) {
    r.error = "cannot open " + cfg_.file_path;
    return r;
  }
  std::vector<uint8_t> buf(cfg_.chunk_size);
  for (uint32_t i = 0; i < start.total_chunks; i++) {
    in.read((char *)buf.data(), buf.size());
    size_t got = (size_t)in.gcount();
    if (got == 0) {
      r.error = "short read on " + cfg_.file_path;
      return r;
    }
    std::vector<uint8_t> out;
    if (cfg_.json_chunks)
      out = encode_json_line(
          make_file_chunk(start.transfer_id, i, buf.data(), got));
    else
      out = encode_chunk_frame(start.transfer_id, i, buf.data(), got);
    if (!write_all(out.data(), out.size(), r.error))
      return r;
    Logger::instance().log(LogLevel::TRACE, kTag, "chunk %u (%zu bytes)", i,
                           got);
  }

  line = encode_json_line(make_file_end(start.transfer_id));
  if (!write_all(line.data(), line.size(), r.error))
    return r;
  if (!read_reply("file_complete", reply, r.error))
    return r;

  json done = json::parse(reply, nullptr, false);
  r.success = done.value("success", false);
  r.file_path = str_field(done, "filePath");
  r.error = str_field(done, "error");
  r.error_code = str_field(done, "errorCode");

  std::error_code ec;
  sock_.shutdown(tcp::socket::shutdown_both, ec);
  sock_.close(ec);
  return r;
}

} // namespace lanxfer
