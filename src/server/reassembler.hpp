#pragma once
#include <chrono>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "messages.hpp"
#include "protocol.hpp"

namespace lanxfer {

struct ReassemblerConfig {
    std::string storage_dir{"lanxfer-data"};
    std::string temp_dir{"lanxfer-data/.incoming"};
    uint32_t max_chunk_size{kDefaultChunkSize};
    std::vector<std::string> allowed_extensions{".zip"};
    std::vector<std::string> allowed_mime_types{"application/zip", "application/x-zip-compressed"};
};

enum class TransferErrc {
    None = 0,
    Busy,
    Rejected,
    DiskError,
    ChecksumMismatch,
    IncompleteTransfer,
    Timeout
};

// Wire name used in file_complete.errorCode; empty when there is none.
const char* error_code_name(TransferErrc c);

struct TransferError {
    TransferErrc code{TransferErrc::None};
    std::string message;
};

enum class TransferStatus { Receiving, Completing, Complete, Error };
const char* to_string(TransferStatus s);

struct TransferProgress {
    std::string transfer_id;
    std::string file_name;
    uint64_t file_size{0};
    uint64_t bytes_received{0};
    int percentage{0};
    uint32_t chunks_received{0};
    uint32_t total_chunks{0};
    TransferStatus status{TransferStatus::Receiving};
    std::string error;
    int64_t elapsed_ms{0};
    int64_t estimated_remaining_ms{-1}; // -1 when unknown
};

struct TransferSession {
    using clock = std::chrono::steady_clock;

    std::string transfer_id;
    std::string file_name;
    std::string expected_checksum;
    uint64_t expected_size{0};
    uint32_t total_chunks{0};
    uint32_t chunk_size{0};
    std::map<uint32_t, uint32_t> received; // chunk index -> bytes last written there
    uint64_t bytes_received{0};
    std::string temp_path;
    std::string dest_path;
    clock::time_point start_time;
    clock::time_point last_chunk_time;
    TransferStatus status{TransferStatus::Receiving};
    std::fstream file;
};

enum class ChunkStatus { Accepted, Duplicate, Ignored, Complete, Failed };

// Turns chunks that may arrive in any order into one verified file.
// Holds at most one session. Chunks are written at index * chunk_size, so
// memory use does not depend on the transfer size.
class Reassembler {
public:
    explicit Reassembler(const ReassemblerConfig& cfg);
    ~Reassembler();

    Reassembler(const Reassembler&) = delete;
    Reassembler& operator=(const Reassembler&) = delete;

    bool on_file_start(const FileStartMsg& msg, TransferError& err);
    ChunkStatus on_chunk(const std::string& transfer_id, uint32_t chunk_index,
                         const uint8_t* data, size_t len, TransferError& err);
    // Call once on_chunk reported Complete. The session is gone afterwards.
    bool finalize(std::string& out_path, TransferError& err);
    // file_end: Failed (and abandoned) when chunks are still missing.
    ChunkStatus on_file_end(const std::string& transfer_id, TransferError& err);
    // Deletes the partial file. No-op without a session.
    void abandon();

    bool active() const { return session_ != nullptr; }
    const TransferSession* session() const { return session_.get(); }
    TransferProgress progress(TransferSession::clock::time_point now) const;

private:
    bool validate(const FileStartMsg& msg, TransferError& err) const;
    void fail(TransferErrc code, const std::string& message, TransferError& err);

    ReassemblerConfig cfg_;
    std::unique_ptr<TransferSession> session_;
};

} // namespace lanxfer
