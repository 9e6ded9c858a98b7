#pragma once

#include <atomic>
#include <exception>
#include <cstdint>
#include <optional>
#include <string>

#include "cr/car/byte_stream.h"
#include "cr/car/reader.h"
#include "cr/car/writer.h"
#include "cr/orchestrator/config.h"
#include "cr/range/filter.h"
#include "cr/range/offset_map.h"
#include "cr/range/range_request.h"

namespace cr::orchestrator {

struct SessionStats {
  uint64_t blocks_in{0};
  uint64_t blocks_out{0};
  uint64_t blocks_discarded{0};
  uint64_t bytes_in{0};
  uint64_t bytes_out{0};
  uint64_t unverified_blocks{0};
  cr::range::Phase phase{cr::range::Phase::kAwaitingStructure};
  bool late_mismatch{false};
  bool incomplete_dag{false};
  bool cancelled{false};
  bool source_closed{false};
};

// Filters one archive stream down to the blocks covering a byte range of the
// file it encodes. Single-threaded pull chain; only Cancel may be called from
// another thread.
class RangeSession {
 public:
  RangeSession(cr::car::ByteSource& source, cr::car::ByteSink& sink,
               cr::range::RangeRequest request, FilterConfig config = {});

  RangeSession(const RangeSession&) = delete;
  RangeSession& operator=(const RangeSession&) = delete;

  // Reads the header and root block, validates the range against the file
  // size and only then writes both. Throws MalformedArchiveError or a
  // Validation error without producing output. Called by the first Step.
  void Start();
  // Processes at most one block. Returns false once the session has finished.
  bool Step();
  const SessionStats& Run();
  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

  [[nodiscard]] bool finished() const noexcept { return finished_; }
  [[nodiscard]] const SessionStats& stats() const noexcept { return stats_; }
  [[nodiscard]] cr::range::Phase phase() const noexcept;
  [[nodiscard]] const cr::car::CarHeader& header() const noexcept { return reader_.header(); }
  [[nodiscard]] std::optional<uint64_t> file_size() const noexcept { return builder_.file_size(); }
  [[nodiscard]] std::optional<uint64_t> resolved_end() const noexcept { return resolved_end_; }
  [[nodiscard]] const cr::range::OffsetMap* offset_map() const noexcept { return builder_.map(); }

 private:
  bool ReadBlock();
  void Process(bool is_root);
  void Finish();
  void Fail(const std::exception& ex);
  void PublishPhaseChange(cr::range::Phase from, cr::range::Phase to);
  void PublishWarning(const std::string& event_id, const std::string& message,
                      const std::string& reason);

  cr::car::ByteSource& source_;
  cr::car::CarReader reader_;
  cr::car::CarWriter writer_;
  cr::range::RangeRequest request_;
  FilterConfig config_;
  cr::range::OffsetMapBuilder builder_;
  std::optional<cr::range::RangeFilter> filter_{};
  std::optional<uint64_t> resolved_end_{};
  cr::car::Block block_{};
  SessionStats stats_{};
  std::atomic<bool> cancelled_{false};
  bool started_{false};
  bool finished_{false};
};

}  // namespace cr::orchestrator
