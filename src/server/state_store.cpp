#include "state_store.hpp"
#include <vector>

namespace lanxfer {

const char *to_string(ServerStatus s) {
  switch (s) {
  case ServerStatus::Idle:
    return "idle";
  case ServerStatus::Starting:
    return "starting";
  case ServerStatus::Listening:
    return "listening";
  case ServerStatus::Handshaking:
    return "handshaking";
  case ServerStatus::Connected:
    return "connected";
  case ServerStatus::ReceivingFile:
    return "receiving_file";
  default:
    return "error";
  }
}

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::ProtocolMismatch:
    return "protocol_mismatch";
  case ErrorKind::Transfer:
    return "transfer";
  case ErrorKind::Bind:
    return "bind";
  default:
    return "io";
  }
}

StateStore::StateStore()
    : snapshot_(std::make_shared<const ServerState>()),
      shared_(std::make_shared<Shared>()) {}

StateStore::Snapshot StateStore::get_snapshot() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return snapshot_;
}

StateStore::Unsubscribe StateStore::subscribe(Listener l) {
  uint64_t id;
  {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    id = shared_->next_id++;
    shared_->listeners.emplace(id, std::move(l));
  }
  // weak so an unsubscribe handle may outlive the store
  std::weak_ptr<Shared> weak = shared_;
  return [weak, id]() {
    if (auto sh = weak.lock()) {
      std::lock_guard<std::mutex> lk(sh->mtx);
      sh->listeners.erase(id);
    }
  };
}

void StateStore::update(const std::function<void(ServerState &)> &fn) {
  Snapshot next;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto copy = std::make_shared<ServerState>(*snapshot_);
    fn(*copy);
    snapshot_ = copy;
    next = snapshot_;
  }
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    listeners.reserve(shared_->listeners.size());
    for (auto &kv : shared_->listeners)
      listeners.push_back(kv.second);
  }
  // outside the locks: listeners may call get_snapshot or unsubscribe
  for (auto &l : listeners)
    l(next);
}

size_t StateStore::listener_count() const {
  std::lock_guard<std::mutex> lk(shared_->mtx);
  return shared_->listeners.size();
}

} // namespace lanxfer
