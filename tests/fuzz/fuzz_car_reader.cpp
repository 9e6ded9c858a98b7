#include <cstddef>
#include <cstdint>
#include <span>

#include "cr/car/byte_stream.h"
#include "cr/car/reader.h"
#include "cr/error.h"
#include "cr/range/offset_map.h"
#include "cr/unixfs/node.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (data == nullptr) {
    return 0;
  }
  std::span<const uint8_t> bytes(data, size);
  cr::car::MemorySource source(bytes, 7);
  cr::car::ReaderOptions options;
  options.max_header_size = 1u << 16;
  options.max_section_size = 1u << 16;
  options.verify_digests = true;
  cr::car::CarReader reader(source, options);
  cr::range::OffsetMapBuilder builder;
  try {
    reader.ReadHeader();
    cr::car::Block block;
    while (reader.Next(block)) {
      builder.Place(cr::unixfs::Classify(block));
    }
  } catch (const cr::Error&) {
  }
  return 0;
}
