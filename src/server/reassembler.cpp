#include "reassembler.hpp"
#include "checksum.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace lanxfer {

static const char *kTag = "reassembler";

const char *error_code_name(TransferErrc c) {
  switch (c) {
  case TransferErrc::ChecksumMismatch:
    return "CHECKSUM_MISMATCH";
  case TransferErrc::IncompleteTransfer:
    return "INCOMPLETE_TRANSFER";
  case TransferErrc::DiskError:
    return "DISK_ERROR";
  default:
    return "";
  }
}

const char *to_string(TransferStatus s) {
  switch (s) {
  case TransferStatus::Receiving:
    return "receiving";
  case TransferStatus::Completing:
    return "completing";
  case TransferStatus::Complete:
    return "complete";
  default:
    return "error";
  }
}

Reassembler::Reassembler(const ReassemblerConfig &cfg) : cfg_(cfg) {}

Reassembler::~Reassembler() { abandon(); }

bool Reassembler::validate(const FileStartMsg &msg, TransferError &err) const {
  err.code = TransferErrc::Rejected;
  if (!is_safe_name(msg.transfer_id)) {
    err.message = "Invalid transfer id";
    return false;
  }
  std::string base = fs::path(msg.file_name).filename().string();
  if (base.empty() || base == "." || base == "..") {
    err.message = "Invalid file name";
    return false;
  }
  std::string ext = file_extension(base);
  if (!contains(cfg_.allowed_extensions, ext)) {
    err.message = "File type " + (ext.empty() ? std::string("(none)") : ext) +
                  " not allowed";
    return false;
  }
  if (!contains(cfg_.allowed_mime_types, msg.mime_type)) {
    err.message = "MIME type " + msg.mime_type + " not allowed";
    return false;
  }
  if (msg.chunk_size == 0 || msg.chunk_size > cfg_.max_chunk_size) {
    err.message = "Chunk size " + std::to_string(msg.chunk_size) +
                  " exceeds limit " + std::to_string(cfg_.max_chunk_size);
    return false;
  }
  uint64_t min_size = 0, max_size = 0;
  if (msg.total_chunks > 0) {
    min_size = (uint64_t)(msg.total_chunks - 1) * msg.chunk_size + 1;
    max_size = (uint64_t)msg.total_chunks * msg.chunk_size;
  }
  if (msg.total_chunks == 0 || msg.file_size < min_size ||
      msg.file_size > max_size) {
    err.message = "File size " + std::to_string(msg.file_size) +
                  " inconsistent with " + std::to_string(msg.total_chunks) +
                  " chunks of " + std::to_string(msg.chunk_size) + " bytes";
    return false;
  }
  if (!is_hex_digest(msg.checksum, kSha256HexLen)) {
    err.message = "Invalid checksum format (expected 64 hex characters)";
    return false;
  }
  err = TransferError{};
  return true;
}

bool Reassembler::on_file_start(const FileStartMsg &msg, TransferError &err) {
  if (session_) {
    err.code = TransferErrc::Busy;
    err.message = "Another transfer is in progress";
    return false;
  }
  if (!validate(msg, err)) {
    Logger::instance().log(LogLevel::WARN, kTag, "rejecting %s: %s",
                           msg.transfer_id.c_str(), err.message.c_str());
    return false;
  }

  std::error_code ec;
  fs::create_directories(cfg_.storage_dir, ec);
  if (!ec)
    fs::create_directories(cfg_.temp_dir, ec);
  if (ec) {
    err.code = TransferErrc::DiskError;
    err.message = "Storage unavailable: " + ec.message();
    Logger::instance().log(LogLevel::ERROR, kTag, "%s", err.message.c_str());
    return false;
  }

  auto s = std::make_unique<TransferSession>();
  s->transfer_id = msg.transfer_id;
  s->file_name = fs::path(msg.file_name).filename().string();
  s->expected_checksum = msg.checksum;
  s->expected_size = msg.file_size;
  s->total_chunks = msg.total_chunks;
  s->chunk_size = msg.chunk_size;
  s->temp_path = (fs::path(cfg_.temp_dir) / (msg.transfer_id + ".tmp")).string();
  s->dest_path = (fs::path(cfg_.storage_dir) / s->file_name).string();
  s->start_time = s->last_chunk_time = TransferSession::clock::now();

  fs::remove(s->temp_path, ec);
  s->file.open(s->temp_path, std::ios::in | std::ios::out | std::ios::binary |
                                 std::ios::trunc);
  if (!s->file.is_open()) {
    err.code = TransferErrc::DiskError;
    err.message = "Failed to create temp file";
    Logger::instance().log(LogLevel::ERROR, kTag, "cannot create %s",
                           s->temp_path.c_str());
    return false;
  }

  Logger::instance().log(LogLevel::INFO, kTag,
                         "transfer %s started: %s, %llu bytes in %u chunks "
                         "of %u",
                         s->transfer_id.c_str(), s->file_name.c_str(),
                         (unsigned long long)s->expected_size, s->total_chunks,
                         s->chunk_size);
  session_ = std::move(s);
  err = TransferError{};
  return true;
}

ChunkStatus Reassembler::on_chunk(const std::string &transfer_id,
                                  uint32_t chunk_index, const uint8_t *data,
                                  size_t len, TransferError &err) {
  if (!session_ || session_->transfer_id != transfer_id) {
    Logger::instance().log(LogLevel::DEBUG, kTag,
                           "dropping chunk %u of %s: active transfer is %s",
                           chunk_index, transfer_id.c_str(),
                           session_ ? session_->transfer_id.c_str() : "none");
    return ChunkStatus::Ignored;
  }
  auto &s = *session_;
  if (s.status != TransferStatus::Receiving)
    return ChunkStatus::Ignored;
  if (chunk_index >= s.total_chunks || len > s.chunk_size) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "dropping chunk %u of %s (%zu bytes): out of range",
                           chunk_index, transfer_id.c_str(), len);
    return ChunkStatus::Ignored;
  }

  s.file.seekp((std::streamoff)((uint64_t)chunk_index * s.chunk_size));
  if (len)
    s.file.write((const char *)data, (std::streamsize)len);
  if (!s.file) {
    fail(TransferErrc::DiskError, "Disk write error", err);
    return ChunkStatus::Failed;
  }

  ChunkStatus st = ChunkStatus::Accepted;
  auto it = s.received.find(chunk_index);
  if (it != s.received.end()) {
    s.bytes_received = s.bytes_received - it->second + len;
    it->second = (uint32_t)len;
    st = ChunkStatus::Duplicate;
  } else {
    s.received.emplace(chunk_index, (uint32_t)len);
    s.bytes_received += len;
  }
  s.last_chunk_time = TransferSession::clock::now();

  if (s.received.size() == s.total_chunks)
    return ChunkStatus::Complete;
  return st;
}

bool Reassembler::finalize(std::string &out_path, TransferError &err) {
  if (!session_) {
    err.code = TransferErrc::Rejected;
    err.message = "No active transfer";
    return false;
  }
  auto &s = *session_;
  if (s.received.size() != s.total_chunks) {
    fail(TransferErrc::IncompleteTransfer, "Transfer is not complete", err);
    return false;
  }
  s.status = TransferStatus::Completing;

  s.file.flush();
  bool flushed = (bool)s.file;
  s.file.close();
  if (!flushed) {
    fail(TransferErrc::DiskError, "Disk write error", err);
    return false;
  }

  std::error_code ec;
  fs::resize_file(s.temp_path, s.expected_size, ec);
  if (ec) {
    fail(TransferErrc::DiskError, "Failed to truncate file: " + ec.message(),
         err);
    return false;
  }

  std::string actual;
  if (!sha256_file(s.temp_path, actual)) {
    fail(TransferErrc::DiskError, "Failed to read file for checksum", err);
    return false;
  }
  if (!digest_equal(actual, s.expected_checksum)) {
    fail(TransferErrc::ChecksumMismatch,
         "Checksum mismatch: expected " + to_lower(s.expected_checksum) +
             ", got " + actual,
         err);
    return false;
  }

  fs::remove(s.dest_path, ec);
  fs::rename(s.temp_path, s.dest_path, ec);
  if (ec) {
    // temp and storage may sit on different filesystems
    std::error_code ec2;
    fs::copy_file(s.temp_path, s.dest_path,
                  fs::copy_options::overwrite_existing, ec2);
    if (ec2) {
      fs::remove(s.dest_path, ec2);
      fail(TransferErrc::DiskError, "Failed to move file: " + ec.message(),
           err);
      return false;
    }
    fs::remove(s.temp_path, ec2);
  }

  fs::path abs = fs::absolute(s.dest_path, ec);
  out_path = ec ? s.dest_path : abs.lexically_normal().string();
  s.status = TransferStatus::Complete;
  Logger::instance().log(LogLevel::INFO, kTag, "transfer %s verified -> %s",
                         s.transfer_id.c_str(), out_path.c_str());
  session_.reset();
  err = TransferError{};
  return true;
}

ChunkStatus Reassembler::on_file_end(const std::string &transfer_id,
                                     TransferError &err) {
  if (!session_ || session_->transfer_id != transfer_id ||
      session_->status != TransferStatus::Receiving)
    return ChunkStatus::Ignored;
  auto &s = *session_;
  if (s.received.size() == s.total_chunks)
    return ChunkStatus::Complete;

  std::string missing;
  int listed = 0;
  for (uint32_t i = 0; i < s.total_chunks && listed <= 10; i++) {
    if (s.received.count(i))
      continue;
    if (listed == 10) {
      missing += "...";
      break;
    }
    if (listed)
      missing += ", ";
    missing += std::to_string(i);
    listed++;
  }
  fail(TransferErrc::IncompleteTransfer, "Missing chunks: " + missing, err);
  return ChunkStatus::Failed;
}

void Reassembler::fail(TransferErrc code, const std::string &message,
                       TransferError &err) {
  err.code = code;
  err.message = message;
  Logger::instance().log(LogLevel::WARN, kTag, "transfer %s failed: %s",
                         session_ ? session_->transfer_id.c_str() : "-",
                         message.c_str());
  if (session_)
    session_->status = TransferStatus::Error;
  abandon();
}

void Reassembler::abandon() {
  if (!session_)
    return;
  if (session_->file.is_open())
    session_->file.close();
  std::error_code ec;
  fs::remove(session_->temp_path, ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, kTag, "cannot delete %s: %s",
                           session_->temp_path.c_str(), ec.message().c_str());
  else
    Logger::instance().log(LogLevel::DEBUG, kTag, "discarded %s",
                           session_->temp_path.c_str());
  session_.reset();
}

TransferProgress
Reassembler::progress(TransferSession::clock::time_point now) const {
  TransferProgress p;
  if (!session_)
    return p;
  const auto &s = *session_;
  p.transfer_id = s.transfer_id;
  p.file_name = s.file_name;
  p.file_size = s.expected_size;
  p.bytes_received = s.bytes_received;
  p.chunks_received = (uint32_t)s.received.size();
  p.total_chunks = s.total_chunks;
  p.status = s.status;
  if (s.expected_size > 0) {
    uint64_t shown = std::min(s.bytes_received, s.expected_size);
    p.percentage = (int)((shown * 100 + s.expected_size / 2) / s.expected_size);
  }
  using namespace std::chrono;
  p.elapsed_ms =
      std::max<int64_t>(1, duration_cast<milliseconds>(now - s.start_time).count());
  if (s.bytes_received > 0 && s.bytes_received < s.expected_size) {
    double per_ms = (double)s.bytes_received / (double)p.elapsed_ms;
    p.estimated_remaining_ms =
        (int64_t)((double)(s.expected_size - s.bytes_received) / per_ms + 0.5);
  } else if (s.bytes_received >= s.expected_size) {
    p.estimated_remaining_ms = 0;
  }
  return p;
}

} // namespace lanxfer
