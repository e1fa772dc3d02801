#include "checksum.hpp"
#include "logging.hpp"
#include "sender.hpp"
#include "util.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace lanxfer;

static void usage() {
  std::cerr << "usage: lanxfer_send --server HOST:PORT --file PATH [options]\n"
               "  --chunk-size BYTES   chunk payload size (default 524288)\n"
               "  --device NAME        device name sent in the handshake\n"
               "  --mime TYPE          mime type (default application/zip)\n"
               "  --json-chunks        send chunks as base64 JSON lines\n"
               "  --log-level LEVEL    trace|debug|info|warn|error|off\n";
}

int main(int argc, char **argv) {
  std::string server;
  SenderConfig cfg;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--server")
      server = next(i);
    else if (a == "--file")
      cfg.file_path = next(i);
    else if (a == "--chunk-size") {
      std::string v = next(i);
      try {
        long long n = std::stoll(v);
        if (n <= 0 || n > UINT32_MAX)
          throw std::out_of_range(v);
        cfg.chunk_size = (uint32_t)n;
      } catch (const std::logic_error &) {
        std::cerr << "bad chunk size " << v << "\n";
        return 1;
      }
    } else if (a == "--device")
      cfg.device_name = next(i);
    else if (a == "--mime")
      cfg.mime_type = next(i);
    else if (a == "--json-chunks")
      cfg.json_chunks = true;
    else if (a == "--log-level") {
      LogLevel lvl;
      if (!Logger::parse_level(next(i), lvl)) {
        std::cerr << "bad log level" << std::endl;
        return 1;
      }
      Logger::instance().set_level(lvl);
    } else if (a == "--help" || a == "-h") {
      usage();
      return 0;
    } else {
      std::cerr << "unknown option " << a << "\n";
      usage();
      return 1;
    }
  }

  if (server.empty() || cfg.file_path.empty()) {
    usage();
    return 1;
  }
  if (!parse_host_port(server, cfg.server_host, cfg.server_port)) {
    std::cerr << "bad server" << std::endl;
    return 1;
  }
  if (!crypto_init())
    return 1;

  Sender sender(cfg);
  SendResult r = sender.run();
  if (!r.success) {
    std::cerr << "transfer failed: " << r.error;
    if (!r.error_code.empty())
      std::cerr << " (" << r.error_code << ")";
    std::cerr << std::endl;
    return 1;
  }
  std::cout << r.file_path << std::endl;
  return 0;
}
