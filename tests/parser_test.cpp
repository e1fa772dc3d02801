#include <algorithm>
#include <cstring>
#include <stdexcept>
#include "protocol.hpp"
#include "test_helpers.hpp"

using namespace lanxfer;
using namespace lanxfer::test;

namespace {

// Peels every complete message off buf, leaving the remainder in place.
std::vector<ParsedMessage> Drain(std::vector<uint8_t> &buf) {
  std::vector<ParsedMessage> out;
  size_t off = 0;
  while (off < buf.size()) {
    ParsedMessage m = parse_next(buf.data() + off, buf.size() - off);
    if (m.kind == MessageKind::Incomplete)
      break;
    off += m.consumed;
    out.push_back(std::move(m));
  }
  buf.erase(buf.begin(), buf.begin() + off);
  return out;
}

std::vector<uint8_t> Cat(std::vector<uint8_t> a, const std::vector<uint8_t> &b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}

bool SameMessage(const ParsedMessage &a, const ParsedMessage &b) {
  return a.kind == b.kind && a.consumed == b.consumed && a.json == b.json &&
         a.transfer_id == b.transfer_id && a.chunk_index == b.chunk_index &&
         a.data == b.data;
}

int EmptyBufferIsIncomplete() {
  ParsedMessage m = parse_next(nullptr, 0);
  CHECK(m.kind == MessageKind::Incomplete);
  CHECK(m.consumed == 0);
  return 0;
}

int ChunkFrameFields() {
  std::vector<uint8_t> data = {1, 2, 3};
  auto frame = encode_chunk_frame("t1", 5, data.data(), data.size());
  CHECK(frame.size() == 18);
  CHECK(read_u32_be(frame.data() + 2) == 12);

  ParsedMessage m = parse_next(frame.data(), frame.size());
  CHECK(m.kind == MessageKind::BinaryChunk);
  CHECK(m.consumed == 6 + 12);
  CHECK(m.transfer_id == "t1");
  CHECK(m.chunk_index == 5);
  CHECK(m.data == data);
  return 0;
}

int EveryTruncationIsIncomplete() {
  auto data = Pattern(40, 3);
  auto frame = encode_chunk_frame("abc", 9, data.data(), data.size());
  for (size_t n = 1; n < frame.size(); n++) {
    ParsedMessage m = parse_next(frame.data(), n);
    CHECK(m.kind == MessageKind::Incomplete);
    CHECK(m.consumed == 0);
  }
  auto line = encode_json_line("{\"type\":\"ping\"}");
  for (size_t n = 1; n < line.size(); n++)
    CHECK(parse_next(line.data(), n).kind == MessageKind::Incomplete);
  return 0;
}

int JunkByteResynchronizes() {
  std::vector<uint8_t> data = {9, 9};
  std::vector<uint8_t> buf = {0xFF};
  buf = Cat(buf, encode_chunk_frame("x", 0, data.data(), data.size()));

  auto msgs = Drain(buf);
  CHECK(buf.empty());
  CHECK(msgs.size() == 2);
  CHECK(msgs[0].kind == MessageKind::Skip);
  CHECK(msgs[0].consumed == 1);
  CHECK(msgs[1].kind == MessageKind::BinaryChunk);
  CHECK(msgs[1].transfer_id == "x");
  return 0;
}

int CNotFollowedBySIsSkipped() {
  std::vector<uint8_t> buf = {'C', 'X', '{', '}', '\n'};
  auto msgs = Drain(buf);
  CHECK(msgs.size() == 3);
  CHECK(msgs[0].kind == MessageKind::Skip && msgs[0].consumed == 1);
  CHECK(msgs[1].kind == MessageKind::Skip && msgs[1].consumed == 1);
  CHECK(msgs[2].kind == MessageKind::Json && msgs[2].json == "{}");
  return 0;
}

int LoneMagicByteWaits() {
  uint8_t c = 'C';
  CHECK(parse_next(&c, 1).kind == MessageKind::Incomplete);
  return 0;
}

int UnknownFrameTypeSkipsWholeFrame() {
  std::vector<uint8_t> data = {1, 2, 3, 4};
  auto frame = encode_chunk_frame("tid", 1, data.data(), data.size());
  frame[6] = 0x02;
  ParsedMessage m = parse_next(frame.data(), frame.size());
  CHECK(m.kind == MessageKind::Skip);
  CHECK(m.consumed == frame.size());
  return 0;
}

int ShortDeclaredLengthSkipsFrame() {
  // total length 3 cannot hold the chunk header
  std::vector<uint8_t> buf = {'C', 'S', 0, 0, 0, 3, 0x01, 0, 0};
  ParsedMessage m = parse_next(buf.data(), buf.size());
  CHECK(m.kind == MessageKind::Skip);
  CHECK(m.consumed == 9);

  // transfer id length points past the end of the frame
  std::vector<uint8_t> bad = {'C', 'S', 0, 0, 0, 7, 0x01, 0, 10, 0, 0, 0, 0};
  m = parse_next(bad.data(), bad.size());
  CHECK(m.kind == MessageKind::Skip);
  CHECK(m.consumed == 13);
  return 0;
}

int ZeroLengthChunk() {
  auto frame = encode_chunk_frame("t", 2, nullptr, 0);
  ParsedMessage m = parse_next(frame.data(), frame.size());
  CHECK(m.kind == MessageKind::BinaryChunk);
  CHECK(m.data.empty());
  CHECK(m.consumed == 6 + 7 + 1);
  return 0;
}

int LongTransferId() {
  std::string tid(300, 'a');
  std::vector<uint8_t> data = {7};
  auto frame = encode_chunk_frame(tid, 0xFFFFFFFFu, data.data(), data.size());
  ParsedMessage m = parse_next(frame.data(), frame.size());
  CHECK(m.kind == MessageKind::BinaryChunk);
  CHECK(m.transfer_id == tid);
  CHECK(m.chunk_index == 0xFFFFFFFFu);

  bool threw = false;
  try {
    encode_chunk_frame(std::string(70000, 'b'), 0, data.data(), data.size());
  } catch (const std::length_error &) {
    threw = true;
  }
  CHECK(threw);
  return 0;
}

int JsonLines() {
  std::string text = "{\"type\":\"ping\"}\r\n";
  std::vector<uint8_t> buf(text.begin(), text.end());
  ParsedMessage m = parse_next(buf.data(), buf.size());
  CHECK(m.kind == MessageKind::Json);
  CHECK(m.json == "{\"type\":\"ping\"}");
  CHECK(m.consumed == text.size());

  uint8_t nl = '\n';
  m = parse_next(&nl, 1);
  CHECK(m.kind == MessageKind::Skip);
  CHECK(m.consumed == 1);
  return 0;
}

int MixedStreamIsSplitIndependent() {
  auto d1 = Pattern(100, 1), d2 = Pattern(33, 2);
  std::vector<uint8_t> stream;
  stream = Cat(stream, encode_json_line("{\"type\":\"handshake\"}"));
  stream = Cat(stream, encode_chunk_frame("tx", 0, d1.data(), d1.size()));
  stream.push_back('\n');
  stream.push_back(0x00);
  stream = Cat(stream, encode_chunk_frame("tx", 1, d2.data(), d2.size()));
  stream = Cat(stream, encode_json_line("{\"type\":\"file_end\"}"));

  std::vector<uint8_t> whole = stream;
  auto expected = Drain(whole);
  CHECK(whole.empty());
  CHECK(expected.size() == 6);
  CHECK(expected[0].kind == MessageKind::Json);
  CHECK(expected[1].kind == MessageKind::BinaryChunk);
  CHECK(expected[1].data == d1);
  CHECK(expected[4].chunk_index == 1);
  CHECK(expected[5].json == "{\"type\":\"file_end\"}");

  for (size_t step : {size_t(1), size_t(2), size_t(5), size_t(7), size_t(64)}) {
    std::vector<uint8_t> buf;
    std::vector<ParsedMessage> got;
    for (size_t off = 0; off < stream.size(); off += step) {
      size_t n = std::min(step, stream.size() - off);
      buf.insert(buf.end(), stream.begin() + off, stream.begin() + off + n);
      for (auto &m : Drain(buf))
        got.push_back(std::move(m));
    }
    CHECK(buf.empty());
    CHECK(got.size() == expected.size());
    for (size_t i = 0; i < got.size(); i++)
      CHECK(SameMessage(got[i], expected[i]));
  }
  return 0;
}

} // namespace

int main() {
  Quiet();
  RUN(EmptyBufferIsIncomplete);
  RUN(ChunkFrameFields);
  RUN(EveryTruncationIsIncomplete);
  RUN(JunkByteResynchronizes);
  RUN(CNotFollowedBySIsSkipped);
  RUN(LoneMagicByteWaits);
  RUN(UnknownFrameTypeSkipsWholeFrame);
  RUN(ShortDeclaredLengthSkipsFrame);
  RUN(ZeroLengthChunk);
  RUN(LongTransferId);
  RUN(JsonLines);
  RUN(MixedStreamIsSplitIndependent);
  std::cout << "parser_test ok\n";
  return 0;
}
