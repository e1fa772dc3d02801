#include <atomic>
#include <thread>
#include "state_store.hpp"
#include "test_helpers.hpp"

using namespace lanxfer;
using namespace lanxfer::test;

namespace {

int InitialSnapshotIsIdle() {
  StateStore store;
  auto s = store.get_snapshot();
  CHECK(s != nullptr);
  CHECK(s->status == ServerStatus::Idle);
  CHECK(s->port == 0);
  CHECK(!s->connected_client);
  CHECK(!s->file_transfer);
  CHECK(!s->last_error);
  CHECK(!s->completed_file_path);
  return 0;
}

int SnapshotsAreImmutable() {
  StateStore store;
  auto before = store.get_snapshot();
  store.update([](ServerState &s) {
    s.status = ServerStatus::Listening;
    s.port = 4321;
  });
  auto after = store.get_snapshot();
  CHECK(before->status == ServerStatus::Idle);
  CHECK(before->port == 0);
  CHECK(after->status == ServerStatus::Listening);
  CHECK(after->port == 4321);
  CHECK(before.get() != after.get());
  return 0;
}

int ListenersSeeEveryUpdate() {
  StateStore store;
  std::vector<ServerStatus> seen;
  auto unsubscribe = store.subscribe(
      [&seen](const StateStore::Snapshot &s) { seen.push_back(s->status); });
  CHECK(store.listener_count() == 1);

  store.update([](ServerState &s) { s.status = ServerStatus::Starting; });
  store.update([](ServerState &s) { s.status = ServerStatus::Listening; });
  CHECK(seen.size() == 2);
  CHECK(seen[0] == ServerStatus::Starting);
  CHECK(seen[1] == ServerStatus::Listening);

  unsubscribe();
  unsubscribe();
  CHECK(store.listener_count() == 0);
  store.update([](ServerState &s) { s.status = ServerStatus::Idle; });
  CHECK(seen.size() == 2);
  return 0;
}

int ListenerMayUnsubscribeItself() {
  StateStore store;
  int calls = 0;
  bool current = false;
  StateStore::Unsubscribe unsubscribe;
  unsubscribe = store.subscribe([&](const StateStore::Snapshot &s) {
    calls++;
    current = store.get_snapshot().get() == s.get();
    unsubscribe();
  });
  store.update([](ServerState &s) { s.port = 1; });
  store.update([](ServerState &s) { s.port = 2; });
  CHECK(calls == 1);
  CHECK(current);
  return 0;
}

int UnsubscribeOutlivesStore() {
  StateStore::Unsubscribe unsubscribe;
  {
    StateStore store;
    unsubscribe = store.subscribe([](const StateStore::Snapshot &) {});
  }
  unsubscribe();
  return 0;
}

int ConcurrentReadersDuringUpdates() {
  StateStore store;
  std::atomic<bool> done{false};
  std::atomic<int> bad{0};
  std::thread reader([&]() {
    while (!done.load()) {
      auto s = store.get_snapshot();
      // port and status are always written together
      if (s->port != 0 && s->status != ServerStatus::Listening)
        bad++;
    }
  });
  for (int i = 1; i <= 2000; i++) {
    store.update([i](ServerState &s) {
      s.status = ServerStatus::Listening;
      s.port = (uint16_t)i;
    });
  }
  done = true;
  reader.join();
  CHECK(bad.load() == 0);
  CHECK(store.get_snapshot()->port == 2000);
  return 0;
}

int StatusNames() {
  CHECK(std::string(to_string(ServerStatus::ReceivingFile)) == "receiving_file");
  CHECK(std::string(to_string(ServerStatus::Handshaking)) == "handshaking");
  CHECK(std::string(to_string(ErrorKind::ProtocolMismatch)) ==
        "protocol_mismatch");
  return 0;
}

} // namespace

int main() {
  Quiet();
  RUN(InitialSnapshotIsIdle);
  RUN(SnapshotsAreImmutable);
  RUN(ListenersSeeEveryUpdate);
  RUN(ListenerMayUnsubscribeItself);
  RUN(UnsubscribeOutlivesStore);
  RUN(ConcurrentReadersDuringUpdates);
  RUN(StatusNames);
  std::cout << "state_store_test ok\n";
  return 0;
}
