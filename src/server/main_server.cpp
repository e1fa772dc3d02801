#include "checksum.hpp"
#include "logging.hpp"
#include "transfer_server.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <functional>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace lanxfer;

static void usage() {
  std::cerr
      << "usage: lanxfer_server [options]\n"
         "  --listen HOST:PORT        bind address (default 0.0.0.0:0)\n"
         "  --storage DIR             where verified files are placed\n"
         "  --temp DIR                partial files (default STORAGE/.incoming)\n"
         "  --max-chunk-size BYTES    largest accepted chunk (default 524288)\n"
         "  --handshake-timeout SEC   0 disables (default 30)\n"
         "  --idle-timeout SEC        0 disables (default 120)\n"
         "  --transfer-timeout SEC    0 disables (default 600)\n"
         "  --log-level LEVEL         trace|debug|info|warn|error|off\n";
}

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:0";
  std::string storage = "lanxfer-data";
  std::string temp;
  ServerConfig cfg;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto next_num = [&](int &i) -> long long {
      std::string v = next(i);
      try {
        long long n = std::stoll(v);
        if (n >= 0)
          return n;
      } catch (const std::logic_error &) {
      }
      std::cerr << "bad value for " << a << ": " << v << "\n";
      std::exit(1);
    };
    if (a == "--listen")
      listen = next(i);
    else if (a == "--storage")
      storage = next(i);
    else if (a == "--temp")
      temp = next(i);
    else if (a == "--max-chunk-size") {
      long long n = next_num(i);
      if (n == 0 || n > UINT32_MAX) {
        std::cerr << "--max-chunk-size must be between 1 and " << UINT32_MAX
                  << "\n";
        return 1;
      }
      cfg.transfer.max_chunk_size = (uint32_t)n;
    } else if (a == "--handshake-timeout")
      cfg.handshake_timeout = std::chrono::seconds(next_num(i));
    else if (a == "--idle-timeout")
      cfg.idle_timeout = std::chrono::seconds(next_num(i));
    else if (a == "--transfer-timeout")
      cfg.transfer_timeout = std::chrono::seconds(next_num(i));
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

  if (!parse_host_port(listen, cfg.listen_host, cfg.listen_port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  cfg.transfer.storage_dir = storage;
  cfg.transfer.temp_dir = temp.empty() ? storage + "/.incoming" : temp;

  if (!crypto_init())
    return 1;

  asio::io_context io;
  StateStore store;
  ServerStatus last = ServerStatus::Idle;
  std::string printed;
  TransferServer *server_ptr = nullptr;
  auto unsubscribe = store.subscribe([&](const StateStore::Snapshot &s) {
    if (s->status != last) {
      Logger::instance().log(LogLevel::INFO, "state", "%s -> %s",
                             to_string(last), to_string(s->status));
      last = s->status;
      if (s->status == ServerStatus::Error && s->last_error) {
        Logger::instance().log(LogLevel::ERROR, "state", "%s: %s",
                               to_string(s->last_error->kind),
                               s->last_error->message.c_str());
        if (s->last_error->kind == ErrorKind::Bind)
          asio::post(io, [&io]() { io.stop(); });
      }
    }
    // hand the verified file to whoever reads stdout, then forget it
    if (!s->completed_file_path) {
      printed.clear();
    } else if (*s->completed_file_path != printed) {
      printed = *s->completed_file_path;
      std::cout << printed << std::endl;
      if (server_ptr)
        server_ptr->clear_completed_file();
    }
  });

  TransferServer server(io, cfg, store);
  server_ptr = &server;
  server.start();

  // SIGHUP restarts the listener after an error
  asio::signal_set hup(io, SIGHUP);
  std::function<void()> wait_hup = [&]() {
    hup.async_wait([&](std::error_code ec, int) {
      if (ec)
        return;
      server.start();
      wait_hup();
    });
  };
  wait_hup();

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code, int) {
    server.stop();
    asio::post(io, [&io]() { io.stop(); });
  });

  io.run();
  unsubscribe();
  return store.get_snapshot()->last_error &&
                 store.get_snapshot()->last_error->kind == ErrorKind::Bind
             ? 1
             : 0;
}
