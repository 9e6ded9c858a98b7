#include "cr/car/reader.h"
#include "cr/car/writer.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "car_builder.h"
#include "cr/error.h"

namespace {

template <typename Fn>
int CaptureArchiveError(Fn&& fn) {
  try {
    fn();
  } catch (const cr::MalformedArchiveError& err) {
    assert(err.domain == cr::ErrorDomain::Archive);
    return err.code;
  }
  return 0;
}

std::vector<cr::car::Block> ReadAll(const cr::Bytes& car, cr::car::ReaderOptions options = {},
                                    size_t max_chunk = 0) {
  cr::car::MemorySource source{cr::ByteSpan(car), max_chunk};
  cr::car::CarReader reader(source, options);
  reader.ReadHeader();
  std::vector<cr::car::Block> blocks;
  cr::car::Block block;
  while (reader.Next(block)) {
    blocks.push_back(block);
  }
  assert(reader.bytes_consumed() == car.size());
  assert(reader.blocks_read() == blocks.size());
  return blocks;
}

void TestHelloWorldFixture() {
  const auto car = cr::testing::FromHex(cr::testing::kHelloWorldCarHex);
  cr::car::MemorySource source{cr::ByteSpan(car)};
  cr::car::CarReader reader(source, {});
  const auto& header = reader.ReadHeader();
  assert(header.version == 1);
  assert(header.roots.size() == 1);
  assert(header.roots[0].version == 0);
  assert(header.frame.size() == 0x38 + 1);

  cr::car::Block block;
  assert(reader.Next(block));
  assert(block.cid == header.roots[0]);
  assert(block.codec() == cr::car::codec::kDagPb);
  assert(block.payload().size() == 20);
  assert(block.frame.size() == 0x36 + 1);
  assert(!reader.Next(block));
}

void TestChunkedSourceMatchesWholeBuffer() {
  auto file = cr::testing::MakeFlatFile(4, 700);
  auto whole = ReadAll(file.car);
  auto chunked = ReadAll(file.car, {}, 3);
  assert(whole.size() == 5);
  assert(chunked.size() == whole.size());
  for (size_t i = 0; i < whole.size(); ++i) {
    assert(whole[i].frame == chunked[i].frame);
    assert(whole[i].cid == chunked[i].cid);
  }
  assert(whole[0].cid == file.root.cid);
  assert(whole[1].payload().size() == 700);
}

void TestWriterReproducesInput() {
  auto file = cr::testing::MakeFlatFile(3, 128);
  cr::car::MemorySource source{cr::ByteSpan(file.car)};
  cr::car::CarReader reader(source, {});
  cr::car::VectorSink sink;
  cr::car::CarWriter writer(sink);
  writer.WriteHeader(reader.ReadHeader());
  cr::car::Block block;
  while (reader.Next(block)) {
    writer.WriteBlock(block);
  }
  writer.Flush();
  assert(sink.data() == file.car);
  assert(writer.blocks_written() == 4);
  assert(writer.bytes_written() == file.car.size());
}

void TestMalformedHeaders() {
  const cr::Bytes empty;
  assert(CaptureArchiveError([&] { ReadAll(empty); }) == cr::errors::archive::kBadHeader);

  auto car = cr::testing::FromHex(cr::testing::kHelloWorldCarHex);
  cr::Bytes truncated(car.begin(), car.begin() + 20);
  assert(CaptureArchiveError([&] { ReadAll(truncated); }) == cr::errors::archive::kBadHeader);

  auto file = cr::testing::MakeFlatFile(1, 16);
  auto body = cr::car::EncodeCarHeaderBody({file.root.cid}, 2);
  cr::Bytes v2;
  cr::car::AppendVarint(body.size(), v2);
  v2.insert(v2.end(), body.begin(), body.end());
  assert(CaptureArchiveError([&] { ReadAll(v2); }) == cr::errors::archive::kUnsupportedVersion);

  auto no_roots = cr::car::EncodeCarHeaderBody({});
  cr::Bytes rootless;
  cr::car::AppendVarint(no_roots.size(), rootless);
  rootless.insert(rootless.end(), no_roots.begin(), no_roots.end());
  assert(CaptureArchiveError([&] { ReadAll(rootless); }) == cr::errors::archive::kBadHeader);

  cr::car::ReaderOptions tight;
  tight.max_header_size = 8;
  assert(CaptureArchiveError([&] { ReadAll(car, tight); }) == cr::errors::archive::kSectionTooLarge);
}

void TestMalformedSections() {
  auto file = cr::testing::MakeFlatFile(2, 64);

  cr::Bytes cut(file.car.begin(), file.car.end() - 10);
  assert(CaptureArchiveError([&] { ReadAll(cut); }) == cr::errors::archive::kTruncatedSection);

  cr::car::ReaderOptions small;
  small.max_section_size = 32;
  assert(CaptureArchiveError([&] { ReadAll(file.car, small); }) ==
         cr::errors::archive::kSectionTooLarge);

  auto header = cr::testing::HeaderFrame({file.root.cid});
  cr::Bytes bad_cid = header;
  bad_cid.insert(bad_cid.end(), {0x03, 0x02, 0x55, 0x00});
  assert(CaptureArchiveError([&] { ReadAll(bad_cid); }) == cr::errors::archive::kBadCid);

  cr::Bytes overlong = header;
  overlong.insert(overlong.end(), 9, 0xFF);
  assert(CaptureArchiveError([&] { ReadAll(overlong); }) == cr::errors::archive::kBadVarint);

  cr::Bytes dangling_prefix = header;
  dangling_prefix.push_back(0x80);
  assert(CaptureArchiveError([&] { ReadAll(dangling_prefix); }) ==
         cr::errors::archive::kTruncatedSection);
}

void TestZeroLengthSection() {
  auto file = cr::testing::MakeFlatFile(1, 16);
  cr::Bytes padded = file.car;
  padded.push_back(0x00);
  padded.push_back(0xAB);

  cr::car::MemorySource source{cr::ByteSpan(padded)};
  cr::car::CarReader reader(source, {});
  cr::car::Block block;
  size_t count = 0;
  while (reader.Next(block)) {
    ++count;
  }
  assert(count == 2);

  cr::car::ReaderOptions strict;
  strict.zero_length_section_as_eof = false;
  assert(CaptureArchiveError([&] { ReadAll(padded, strict); }) ==
         cr::errors::archive::kMalformedArchive);
}

void TestDigestVerification() {
  cr::car::ReaderOptions verify;
  verify.verify_digests = true;
  auto hello = cr::testing::FromHex(cr::testing::kHelloWorldCarHex);
  assert(ReadAll(hello, verify).size() == 1);
  auto cbor = cr::testing::FromHex(cr::testing::kDagCborCarHex);
  assert(ReadAll(cbor, verify).size() == 1);

  auto file = cr::testing::MakeFlatFile(2, 64);
  file.car.back() ^= 0x01;
  bool threw = false;
  try {
    ReadAll(file.car, verify);
  } catch (const cr::Error& err) {
    threw = true;
    assert(err.domain == cr::ErrorDomain::Integrity);
    assert(err.code == cr::errors::integrity::kDigestMismatch);
  }
  assert(threw && "Tampered block must fail verification");

  // Unverifiable hash functions are counted rather than rejected.
  auto leaf = cr::testing::RawBlock(cr::testing::Pattern(8, 3));
  leaf.cid = cr::car::MakeCid(1, cr::car::codec::kRaw, 0xb220, cr::ByteSpan(leaf.cid.digest));
  auto car = cr::testing::BuildCar(leaf.cid, {leaf});
  cr::car::MemorySource source{cr::ByteSpan(car)};
  cr::car::CarReader reader(source, verify);
  cr::car::Block block;
  assert(reader.Next(block));
  assert(reader.unverified_blocks() == 1);
}

void TestStreamSource() {
  auto file = cr::testing::MakeFlatFile(2, 50);
  std::istringstream in(std::string(file.car.begin(), file.car.end()));
  cr::car::IStreamSource source(in);
  cr::car::CarReader reader(source, {});
  cr::car::Block block;
  size_t count = 0;
  while (reader.Next(block)) {
    ++count;
  }
  assert(count == 3);
  assert(reader.header().roots[0] == file.root.cid);
}

}  // namespace

int main() {
  TestHelloWorldFixture();
  TestChunkedSourceMatchesWholeBuffer();
  TestWriterReproducesInput();
  TestMalformedHeaders();
  TestMalformedSections();
  TestZeroLengthSection();
  TestDigestVerification();
  TestStreamSource();
  std::cout << "car reader tests ok\n";
  return 0;
}
