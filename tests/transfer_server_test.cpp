#include <nlohmann/json.hpp>
#include <thread>
#include "protocol.hpp"
#include "sender.hpp"
#include "test_helpers.hpp"
#include "transfer_server.hpp"

using namespace lanxfer;
using namespace lanxfer::test;
using json = nlohmann::json;
using tcp = asio::ip::tcp;
namespace fs = std::filesystem;

namespace {

template <class Pred>
bool WaitFor(StateStore &store, Pred pred,
             std::chrono::milliseconds limit = std::chrono::seconds(10)) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred(*store.get_snapshot()))
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred(*store.get_snapshot());
}

bool Connect(tcp::socket &sock, uint16_t port) {
  std::error_code ec;
  sock.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
  return !ec;
}

bool WriteLine(tcp::socket &sock, const std::string &text) {
  auto line = encode_json_line(text);
  std::error_code ec;
  asio::write(sock, asio::buffer(line), ec);
  return !ec;
}

json ReadLine(tcp::socket &sock, asio::streambuf &in) {
  std::error_code ec;
  size_t n = asio::read_until(sock, in, '\n', ec);
  if (ec)
    return json();
  std::string text(asio::buffers_begin(in.data()),
                   asio::buffers_begin(in.data()) + n - 1);
  in.consume(n);
  return json::parse(text, nullptr, false);
}

// True once the server has closed its end.
bool ClosedByServer(tcp::socket &sock) {
  uint8_t b;
  std::error_code ec;
  sock.read_some(asio::buffer(&b, 1), ec);
  return (bool)ec;
}

} // namespace

int main() {
  Quiet();
  if (!crypto_init())
    return 1;

  auto root = TempDir("lanxfer_transfer_server");
  ServerConfig cfg;
  cfg.listen_host = "127.0.0.1";
  cfg.listen_port = 0;
  cfg.transfer.storage_dir = (root / "store").string();
  cfg.transfer.temp_dir = (root / "store" / ".incoming").string();

  asio::io_context io;
  auto work = asio::make_work_guard(io);
  StateStore store;
  TransferServer server(io, cfg, store);
  std::thread io_thread([&io]() { io.run(); });
  struct Joiner {
    asio::io_context &io;
    std::thread &t;
    ~Joiner() {
      io.stop();
      if (t.joinable())
        t.join();
    }
  } joiner{io, io_thread};

  server.start();
  CHECK(WaitFor(store, [](const ServerState &s) {
    return s.status == ServerStatus::Listening && s.port != 0;
  }));
  const uint16_t port = store.get_snapshot()->port;

  asio::io_context cio;

  // one peer at a time: a second connection is closed straight away
  {
    tcp::socket a(cio), b(cio);
    CHECK(Connect(a, port));
    CHECK(WaitFor(store, [](const ServerState &s) {
      return s.status == ServerStatus::Handshaking;
    }));
    CHECK(Connect(b, port));
    CHECK(ClosedByServer(b));
    CHECK(store.get_snapshot()->status == ServerStatus::Handshaking);

    asio::streambuf in;
    CHECK(WriteLine(a, make_handshake(HandshakeMsg{"tester", kProtocolVersion,
                                                   "linux", "1.0"})));
    json ack = ReadLine(a, in);
    CHECK(ack.is_object());
    CHECK(ack["type"] == "handshake_ack");
    CHECK(ack["accepted"] == true);
    CHECK(WaitFor(store, [](const ServerState &s) {
      return s.status == ServerStatus::Connected && s.connected_client &&
             s.connected_client->device_name == "tester";
    }));

    // a peer hanging up is a normal end of session
    std::error_code ec;
    a.close(ec);
    CHECK(WaitFor(store, [](const ServerState &s) {
      return s.status == ServerStatus::Listening && !s.connected_client &&
             !s.last_error;
    }));
  }

  // full transfer through the reference sender
  {
    auto src = root / "archive.zip";
    auto data = Pattern(1300 * 1000, 17);
    {
      std::ofstream out(src, std::ios::binary);
      out.write((const char *)data.data(), (std::streamsize)data.size());
    }
    SenderConfig scfg;
    scfg.server_host = "127.0.0.1";
    scfg.server_port = port;
    scfg.file_path = src.string();
    scfg.chunk_size = 256 * 1024;
    Sender sender(scfg);
    SendResult r = sender.run();
    CHECK(r.success);
    CHECK(r.error_code.empty());
    CHECK(fs::equivalent(r.file_path, root / "store" / "archive.zip"));
    CHECK(ReadFile(r.file_path) == data);

    CHECK(WaitFor(store, [](const ServerState &s) {
      return s.status == ServerStatus::Listening && s.completed_file_path;
    }));
    server.clear_completed_file();
    CHECK(WaitFor(store, [](const ServerState &s) {
      return !s.completed_file_path;
    }));
  }

  // incompatible peer puts the server in Error; start() recovers on the
  // same listener
  {
    tcp::socket c(cio);
    asio::streambuf in;
    CHECK(Connect(c, port));
    CHECK(WriteLine(c, make_handshake(HandshakeMsg{"old", "0", "linux", ""})));
    json ack = ReadLine(c, in);
    CHECK(ack.is_object());
    CHECK(ack["accepted"] == false);
    CHECK(ClosedByServer(c));
    CHECK(WaitFor(store, [](const ServerState &s) {
      return s.status == ServerStatus::Error && s.last_error &&
             s.last_error->kind == ErrorKind::ProtocolMismatch;
    }));

    server.start();
    CHECK(WaitFor(store, [port](const ServerState &s) {
      return s.status == ServerStatus::Listening && s.port == port &&
             !s.last_error;
    }));
  }

  // stop() from this thread closes the listener
  {
    tcp::socket d(cio);
    CHECK(Connect(d, port));
    CHECK(WaitFor(store, [](const ServerState &s) {
      return s.status == ServerStatus::Handshaking;
    }));
    server.stop();
    CHECK(WaitFor(store, [](const ServerState &s) {
      return s.status == ServerStatus::Idle && s.port == 0;
    }));
    CHECK(ClosedByServer(d));

    tcp::socket e(cio);
    CHECK(!Connect(e, port));
  }

  std::cout << "transfer_server_test ok\n";
  return 0;
}
