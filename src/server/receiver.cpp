#include "receiver.hpp"
#include "logging.hpp"
#include <algorithm>

namespace lanxfer {

static const char *kTag = "receiver";

// Largest single message a peer may legitimately send: a full chunk as a
// binary frame with the longest transfer id, or base64 inside a JSON line.
static uint64_t largest_message(uint32_t max_chunk) {
  uint64_t frame =
      kFramePrefixSize + kChunkFixedBodySize + 0xFFFF + (uint64_t)max_chunk;
  uint64_t line = ((uint64_t)max_chunk + 2) / 3 * 4 + 0xFFFF + 256;
  return std::max(frame, line);
}

Receiver::Receiver(const ServerConfig &cfg, StateStore &store)
    : cfg_(cfg), store_(store), reassembler_(cfg.transfer),
      buffer_limit_(cfg.max_buffered_bytes) {
  uint64_t need = largest_message(cfg.transfer.max_chunk_size);
  if (need > buffer_limit_) {
    Logger::instance().log(LogLevel::INFO, kTag,
                           "receive buffer limit raised to %llu bytes for "
                           "%u byte chunks",
                           (unsigned long long)need,
                           cfg.transfer.max_chunk_size);
    buffer_limit_ = (size_t)need;
  }
}

void Receiver::start() {
  if (status_ != ServerStatus::Idle && status_ != ServerStatus::Error) {
    Logger::instance().log(LogLevel::DEBUG, kTag, "start ignored in state %s",
                           to_string(status_));
    return;
  }
  status_ = ServerStatus::Starting;
  store_.update([](ServerState &s) {
    s.status = ServerStatus::Starting;
    s.last_error.reset();
  });
}

void Receiver::bound(uint16_t port) {
  Logger::instance().log(LogLevel::INFO, kTag, "listening on port %u",
                         (unsigned)port);
  status_ = ServerStatus::Listening;
  store_.update([port](ServerState &s) {
    s.status = ServerStatus::Listening;
    s.port = port;
  });
}

void Receiver::bind_failed(const std::string &message) {
  Logger::instance().log(LogLevel::ERROR, kTag, "cannot listen: %s",
                         message.c_str());
  drop_peer(ServerStatus::Error, "listener failed",
            LastError{ErrorKind::Bind, message});
}

bool Receiver::peer_connected(std::shared_ptr<PeerLink> link) {
  if (status_ != ServerStatus::Listening || link_) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "refusing connection in state %s",
                           to_string(status_));
    return false;
  }
  link_ = std::move(link);
  inbuf_.clear();
  connected_at_ = last_activity_ = clock::now();
  status_ = ServerStatus::Handshaking;
  store_.update([](ServerState &s) {
    s.status = ServerStatus::Handshaking;
    s.connected_client.reset();
  });
  return true;
}

void Receiver::on_bytes(const PeerLink *link, const uint8_t *data, size_t n) {
  if (!link_ || link_.get() != link)
    return;
  last_activity_ = clock::now();
  inbuf_.insert(inbuf_.end(), data, data + n);

  size_t off = 0;
  while (link_.get() == link && off < inbuf_.size()) {
    ParsedMessage m = parse_next(inbuf_.data() + off, inbuf_.size() - off);
    if (m.kind == MessageKind::Incomplete)
      break;
    off += m.consumed;
    dispatch(m);
  }
  // a handler dropped the peer and cleared the buffer
  if (link_.get() != link)
    return;
  if (off > 0)
    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off);
  if (inbuf_.size() > buffer_limit_) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "%zu bytes buffered without a complete message",
                           inbuf_.size());
    drop_peer(ServerStatus::Listening, "receive buffer limit exceeded");
  }
}

void Receiver::dispatch(const ParsedMessage &m) {
  switch (m.kind) {
  case MessageKind::Json:
    handle_json(m.json);
    break;
  case MessageKind::BinaryChunk:
    handle_chunk(m.transfer_id, m.chunk_index, m.data.data(), m.data.size());
    break;
  case MessageKind::Skip:
    skipped_bytes_ += m.consumed;
    Logger::instance().log(LogLevel::TRACE, kTag, "%s %zu bytes",
                           to_string(m.kind), m.consumed);
    break;
  default:
    break;
  }
}

void Receiver::handle_json(const std::string &text) {
  ControlMessage msg;
  std::string detail;
  switch (decode_control(text, msg, detail)) {
  case DecodeStatus::ParseError:
    Logger::instance().log(LogLevel::ERROR, kTag,
                           "malformed message (%zu bytes): %.200s",
                           text.size(), text.c_str());
    send(make_error("Invalid JSON message format", "PARSE_ERROR"));
    return;
  case DecodeStatus::NotObject:
    Logger::instance().log(LogLevel::WARN, kTag, "message is not an object");
    send(make_error("Invalid message format: expected object",
                    "INVALID_FORMAT"));
    return;
  case DecodeStatus::InvalidFields:
    Logger::instance().log(LogLevel::WARN, kTag, "invalid message: %s",
                           detail.c_str());
    return;
  case DecodeStatus::Ok:
    break;
  }

  if (auto *h = std::get_if<HandshakeMsg>(&msg))
    handle_handshake(*h);
  else if (auto *fs = std::get_if<FileStartMsg>(&msg))
    handle_file_start(*fs);
  else if (auto *fc = std::get_if<FileChunkMsg>(&msg))
    handle_chunk(fc->transfer_id, fc->chunk_index, fc->data.data(),
                 fc->data.size());
  else if (auto *fe = std::get_if<FileEndMsg>(&msg))
    handle_file_end(*fe);
  else if (auto *p = std::get_if<PingMsg>(&msg))
    handle_ping(*p);
  else if (auto *u = std::get_if<UnknownMsg>(&msg)) {
    if (!u->type.empty())
      Logger::instance().log(LogLevel::WARN, kTag, "unknown message type '%s'",
                             u->type.c_str());
  }
}

void Receiver::handle_handshake(const HandshakeMsg &m) {
  if (status_ != ServerStatus::Handshaking) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "handshake ignored in state %s", to_string(status_));
    return;
  }
  if (m.version != kProtocolVersion) {
    std::string why = std::string("Protocol mismatch: expected ") +
                      kProtocolVersion + ", received " + m.version;
    Logger::instance().log(LogLevel::WARN, kTag, "%s (device %s)", why.c_str(),
                           m.device_name.c_str());
    send(make_handshake_ack(false, why));
    drop_peer(ServerStatus::Error, "incompatible peer",
              LastError{ErrorKind::ProtocolMismatch, why});
    return;
  }

  ClientInfo client{m.device_name, m.platform, m.version, m.app_version};
  Logger::instance().log(LogLevel::INFO, kTag, "peer %s (%s %s) connected",
                         client.device_name.c_str(), client.platform.c_str(),
                         client.app_version.c_str());
  send(make_handshake_ack(true));
  status_ = ServerStatus::Connected;
  store_.update([&client](ServerState &s) {
    s.status = ServerStatus::Connected;
    s.connected_client = client;
  });
}

void Receiver::handle_file_start(const FileStartMsg &m) {
  if (status_ == ServerStatus::ReceivingFile) {
    send(make_file_start_ack(m.transfer_id, false,
                             "Another transfer is in progress"));
    return;
  }
  if (status_ != ServerStatus::Connected) {
    send(make_file_start_ack(m.transfer_id, false, "Not connected"));
    return;
  }

  TransferError err;
  if (!reassembler_.on_file_start(m, err)) {
    send(make_file_start_ack(m.transfer_id, false, err.message));
    if (err.code == TransferErrc::DiskError)
      drop_peer(ServerStatus::Error, "storage failure",
                LastError{ErrorKind::Io, err.message});
    return;
  }
  auto now = clock::now();
  transfer_started_ = last_progress_ = now;
  progress_pending_ = false;
  status_ = ServerStatus::ReceivingFile;
  auto progress = reassembler_.progress(now);
  store_.update([&progress](ServerState &s) {
    s.status = ServerStatus::ReceivingFile;
    s.file_transfer = progress;
  });
  send(make_file_start_ack(m.transfer_id, true));
}

void Receiver::handle_chunk(const std::string &transfer_id,
                            uint32_t chunk_index, const uint8_t *data,
                            size_t len) {
  if (status_ != ServerStatus::ReceivingFile) {
    Logger::instance().log(LogLevel::DEBUG, kTag,
                           "chunk %u of %s dropped in state %s", chunk_index,
                           transfer_id.c_str(), to_string(status_));
    return;
  }

  const TransferSession *s = reassembler_.session();
  uint32_t chunks = s ? (uint32_t)s->received.size() : 0;
  uint64_t bytes = s ? s->bytes_received : 0;

  TransferError err;
  ChunkStatus st =
      reassembler_.on_chunk(transfer_id, chunk_index, data, len, err);
  switch (st) {
  case ChunkStatus::Ignored:
    return;
  case ChunkStatus::Accepted:
  case ChunkStatus::Duplicate:
    publish_progress(false);
    return;
  case ChunkStatus::Failed:
    finish_transfer(transfer_id, chunks, bytes, "", err);
    return;
  case ChunkStatus::Complete:
    break;
  }

  s = reassembler_.session();
  chunks = (uint32_t)s->received.size();
  bytes = s->bytes_received;
  std::string path;
  reassembler_.finalize(path, err);
  finish_transfer(transfer_id, chunks, bytes, path, err);
}

void Receiver::handle_file_end(const FileEndMsg &m) {
  if (status_ != ServerStatus::ReceivingFile)
    return;
  const TransferSession *s = reassembler_.session();
  if (!s || s->transfer_id != m.transfer_id)
    return;
  uint32_t chunks = (uint32_t)s->received.size();
  uint64_t bytes = s->bytes_received;

  TransferError err;
  ChunkStatus st = reassembler_.on_file_end(m.transfer_id, err);
  if (st == ChunkStatus::Failed) {
    finish_transfer(m.transfer_id, chunks, bytes, "", err);
  } else if (st == ChunkStatus::Complete) {
    std::string path;
    reassembler_.finalize(path, err);
    finish_transfer(m.transfer_id, chunks, bytes, path, err);
  }
}

void Receiver::handle_ping(const PingMsg &m) {
  if (status_ != ServerStatus::Connected)
    return;
  send(make_pong(m));
}

void Receiver::finish_transfer(const std::string &transfer_id, uint32_t chunks,
                               uint64_t bytes, const std::string &path,
                               const TransferError &err) {
  bool ok = err.code == TransferErrc::None;
  FileCompleteReport r;
  r.transfer_id = transfer_id;
  r.success = ok;
  r.file_path = path;
  r.error = err.message;
  r.error_code = error_code_name(err.code);
  r.received_chunks = chunks;
  r.received_bytes = bytes;
  send(make_file_complete(r));

  if (ok)
    Logger::instance().log(LogLevel::INFO, kTag, "transfer %s complete: %s",
                           transfer_id.c_str(), path.c_str());
  else
    Logger::instance().log(LogLevel::WARN, kTag, "transfer %s failed: %s",
                           transfer_id.c_str(), err.message.c_str());

  progress_pending_ = false;
  if (err.code == TransferErrc::DiskError) {
    // local storage is broken; stop taking transfers until restarted
    drop_peer(ServerStatus::Error, "storage failure",
              LastError{ErrorKind::Io, err.message});
    return;
  }
  status_ = ServerStatus::Connected;
  store_.update([&](ServerState &s) {
    s.status = ServerStatus::Connected;
    if (ok) {
      s.file_transfer.reset();
      s.completed_file_path = path;
    } else {
      if (s.file_transfer) {
        s.file_transfer->status = TransferStatus::Error;
        s.file_transfer->error = err.message;
      }
      s.last_error = LastError{ErrorKind::Transfer, err.message};
    }
  });
}

void Receiver::drop_peer(ServerStatus next, const char *reason,
                         const std::optional<LastError> &error) {
  reassembler_.abandon();
  auto link = std::move(link_);
  link_.reset();
  inbuf_.clear();
  progress_pending_ = false;
  if (link) {
    Logger::instance().log(LogLevel::INFO, kTag, "dropping peer: %s", reason);
    link->close();
  }
  status_ = next;
  store_.update([next, &error](ServerState &s) {
    s.status = next;
    s.connected_client.reset();
    s.file_transfer.reset();
    if (error) {
      s.last_error = error;
      s.port = 0;
    }
  });
}

void Receiver::peer_closed(const PeerLink *link) {
  if (!link_ || link_.get() != link)
    return;
  drop_peer(ServerStatus::Listening, "connection closed");
}

void Receiver::on_tick(clock::time_point now) {
  using std::chrono::milliseconds;
  if (status_ == ServerStatus::Handshaking &&
      cfg_.handshake_timeout > milliseconds::zero() &&
      now - connected_at_ >= cfg_.handshake_timeout) {
    Logger::instance().log(LogLevel::WARN, kTag, "no handshake within %lld ms",
                           (long long)cfg_.handshake_timeout.count());
    drop_peer(ServerStatus::Listening, "handshake timeout");
    return;
  }
  if (status_ == ServerStatus::ReceivingFile &&
      cfg_.transfer_timeout > milliseconds::zero() &&
      now - transfer_started_ >= cfg_.transfer_timeout) {
    const TransferSession *s = reassembler_.session();
    std::string tid = s ? s->transfer_id : "";
    uint32_t chunks = s ? (uint32_t)s->received.size() : 0;
    uint64_t bytes = s ? s->bytes_received : 0;
    reassembler_.abandon();
    finish_transfer(tid, chunks, bytes, "",
                    TransferError{TransferErrc::Timeout,
                                  "Global transfer timeout exceeded"});
    return;
  }
  if ((status_ == ServerStatus::Connected ||
       status_ == ServerStatus::ReceivingFile) &&
      cfg_.idle_timeout > milliseconds::zero() &&
      now - last_activity_ >= cfg_.idle_timeout) {
    drop_peer(ServerStatus::Listening, "peer inactive");
    return;
  }
  if (progress_pending_ && now - last_progress_ >= cfg_.progress_interval)
    publish_progress(true);
}

void Receiver::stop() {
  reassembler_.abandon();
  auto link = std::move(link_);
  link_.reset();
  inbuf_.clear();
  progress_pending_ = false;
  if (link)
    link->close();
  Logger::instance().log(LogLevel::INFO, kTag, "stopped");
  status_ = ServerStatus::Idle;
  store_.update([](ServerState &s) {
    s.status = ServerStatus::Idle;
    s.port = 0;
    s.connected_client.reset();
    s.file_transfer.reset();
    s.last_error.reset();
  });
}

void Receiver::clear_completed_file() {
  store_.update([](ServerState &s) { s.completed_file_path.reset(); });
}

void Receiver::publish_progress(bool force) {
  auto now = clock::now();
  if (!force && now - last_progress_ < cfg_.progress_interval) {
    progress_pending_ = true;
    return;
  }
  if (!reassembler_.active())
    return;
  auto progress = reassembler_.progress(now);
  last_progress_ = now;
  progress_pending_ = false;
  store_.update([&progress](ServerState &s) { s.file_transfer = progress; });
}

void Receiver::send(const std::string &json) {
  if (!link_) {
    Logger::instance().log(LogLevel::WARN, kTag, "no peer to send to");
    return;
  }
  link_->send_line(json);
}

} // namespace lanxfer
