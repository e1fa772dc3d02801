#include "transfer_server.hpp"
#include "logging.hpp"

namespace lanxfer {

static const char *kTag = "server";

TransferServer::TransferServer(asio::io_context &io, const ServerConfig &cfg,
                               StateStore &store)
    : io_(io), cfg_(cfg), receiver_(cfg, store), acceptor_(io),
      tick_(io) {}

TransferServer::~TransferServer() {
  std::error_code ec;
  acceptor_.close(ec);
}

void TransferServer::start() {
  asio::post(io_, [this]() { do_start(); });
}

void TransferServer::stop() {
  asio::post(io_, [this]() { do_stop(); });
}

void TransferServer::clear_completed_file() {
  asio::post(io_, [this]() { receiver_.clear_completed_file(); });
}

void TransferServer::do_start() {
  if (running_ && acceptor_.is_open()) {
    // restart after an error: the listener itself is still fine
    std::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    receiver_.start();
    if (receiver_.status() == ServerStatus::Starting)
      receiver_.bound(ec ? cfg_.listen_port : ep.port());
    return;
  }

  receiver_.start();
  if (receiver_.status() != ServerStatus::Starting)
    return;

  std::error_code ec;
  auto addr = asio::ip::make_address(cfg_.listen_host, ec);
  if (ec) {
    receiver_.bind_failed("bad listen address " + cfg_.listen_host + ": " +
                          ec.message());
    return;
  }
  tcp::endpoint ep(addr, cfg_.listen_port);
  acceptor_.open(ep.protocol(), ec);
  if (!ec)
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(ep, ec);
  if (!ec)
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  uint16_t port = 0;
  if (!ec)
    port = acceptor_.local_endpoint(ec).port();
  if (ec) {
    std::error_code ignored;
    acceptor_.close(ignored);
    receiver_.bind_failed(ec.message());
    return;
  }

  running_ = true;
  receiver_.bound(port);
  do_accept();
  arm_tick();
}

void TransferServer::do_stop() {
  running_ = false;
  tick_.cancel();
  std::error_code ec;
  acceptor_.close(ec);
  receiver_.stop();
}

void TransferServer::do_accept() {
  acceptor_.async_accept([this](std::error_code ec, tcp::socket sock) {
    if (ec) {
      if (ec == asio::error::operation_aborted || !acceptor_.is_open())
        return;
      Logger::instance().log(LogLevel::ERROR, kTag, "accept failed: %s",
                             ec.message().c_str());
      do_accept();
      return;
    }

    std::error_code ec2;
    auto remote = sock.remote_endpoint(ec2);
    sock.set_option(tcp::no_delay(true), ec2);
    auto c = std::make_shared<Conn>(std::move(sock));
    if (receiver_.peer_connected(c)) {
      Logger::instance().log(LogLevel::INFO, kTag, "accepted %s:%u",
                             remote.address().to_string().c_str(),
                             (unsigned)remote.port());
      do_read(c);
    } else {
      // one peer at a time
      c->close();
    }
    do_accept();
  });
}

void TransferServer::do_read(std::shared_ptr<Conn> c) {
  c->sock.async_read_some(
      asio::buffer(c->read_buf), [this, c](std::error_code ec, std::size_t n) {
        if (ec) {
          if (ec == asio::error::eof)
            Logger::instance().log(LogLevel::INFO, kTag, "peer disconnected");
          else if (!c->closed)
            Logger::instance().log(LogLevel::WARN, kTag, "read error: %s",
                                   ec.message().c_str());
          receiver_.peer_closed(c.get());
          c->closed = true;
          c->shutdown();
          return;
        }
        if (c->closed)
          return;
        receiver_.on_bytes(c.get(), c->read_buf.data(), n);
        if (!c->closed)
          do_read(c);
      });
}

void TransferServer::arm_tick() {
  tick_.expires_after(std::chrono::milliseconds(250));
  tick_.async_wait([this](std::error_code ec) {
    if (ec || !running_)
      return;
    receiver_.on_tick(std::chrono::steady_clock::now());
    arm_tick();
  });
}

void TransferServer::Conn::send_line(const std::string &json) {
  if (closed)
    return;
  write_q.push_back(json + "\n");
  if (write_q.size() == 1)
    do_write();
}

void TransferServer::Conn::do_write() {
  if (write_q.empty())
    return;
  auto self = shared_from_this();
  asio::async_write(sock, asio::buffer(write_q.front()),
                    [self](std::error_code ec, std::size_t) {
                      if (ec) {
                        Logger::instance().log(LogLevel::WARN, kTag,
                                               "write error: %s",
                                               ec.message().c_str());
                        self->write_q.clear();
                        self->shutdown();
                        return;
                      }
                      self->write_q.pop_front();
                      if (!self->write_q.empty())
                        self->do_write();
                      else if (self->closed)
                        self->shutdown();
                    });
}

void TransferServer::Conn::close() {
  if (closed)
    return;
  closed = true;
  if (write_q.empty())
    shutdown();
}

void TransferServer::Conn::shutdown() {
  std::error_code ec;
  sock.shutdown(tcp::socket::shutdown_both, ec);
  sock.close(ec);
}

} // namespace lanxfer
