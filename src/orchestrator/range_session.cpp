#include "cr/orchestrator/range_session.h"

#include <utility>

#include "cr/error.h"
#include "cr/orchestrator/event_bus.h"
#include "cr/unixfs/node.h"

namespace cr::orchestrator {

using cr::range::Decision;
using cr::range::Phase;
using cr::range::PlacementKind;

namespace {

Event MakeEvent(EventSeverity severity, std::string event_id, std::string message) {
  Event event{};
  event.category = EventCategory::kDiagnostics;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  return event;
}

void AddNumber(Event& event, const char* key, uint64_t value) {
  event.fields.emplace_back(key, std::to_string(value), FieldPrivacy::kPublic, true);
}

}  // namespace

RangeSession::RangeSession(cr::car::ByteSource& source, cr::car::ByteSink& sink,
                           cr::range::RangeRequest request, FilterConfig config)
    : source_(source),
      reader_(source, ToReaderOptions(config)),
      writer_(sink),
      request_(request),
      config_(config),
      builder_(config.retain_offset_map) {}

Phase RangeSession::phase() const noexcept {
  return filter_ ? filter_->phase() : Phase::kAwaitingStructure;
}

bool RangeSession::ReadBlock() {
  const uint64_t unverified = reader_.unverified_blocks();
  if (!reader_.Next(block_)) {
    return false;
  }
  ++stats_.blocks_in;
  if (reader_.unverified_blocks() != unverified) {
    auto event = MakeEvent(EventSeverity::kDebug, "digest_unverified",
                           "Block hash function not supported for verification");
    event.category = EventCategory::kIntegrity;
    event.fields.emplace_back("cid", block_.cid.ToString());
    AddNumber(event, "hash_code", block_.cid.hash_code);
    EventBus::Instance().Publish(event);
  }
  return true;
}

void RangeSession::Start() {
  if (started_) {
    return;
  }
  started_ = true;
  try {
    const auto& header = reader_.ReadHeader();
    if (!ReadBlock()) {
      // Header only: there is no DAG to measure, so nothing can be filtered.
      filter_.emplace(0, 0);
      filter_->EnterPassthrough();
      writer_.WriteHeader(header);
      PublishWarning("range_passthrough", "Archive holds no blocks", "empty archive");
      Finish();
      return;
    }
    Process(true);
  } catch (const std::exception& ex) {
    Fail(ex);
    throw;
  }
}

void RangeSession::Process(bool is_root) {
  const Phase before = phase();

  if (is_root) {
    const auto& header = reader_.header();
    cr::range::Placement placement;
    if (!(block_.cid == header.roots.front())) {
      placement = cr::range::Placement{PlacementKind::kMismatch, {}, "first block is not the header root"};
    } else {
      placement = builder_.Place(cr::unixfs::Classify(block_));
    }
    if (placement.kind == PlacementKind::kMismatch) {
      filter_.emplace(0, 0);
      filter_->EnterPassthrough();
      PublishWarning("range_passthrough", "Archive is not a single file DAG; forwarding unchanged",
                     placement.reason);
    } else {
      const uint64_t file_size = builder_.file_size().value_or(0);
      resolved_end_ = request_.ResolveAgainst(file_size);
      filter_.emplace(request_.start(), *resolved_end_, file_size);
      filter_->Decide(placement);
    }
    // The root is needed to verify every other block, so it is always sent.
    writer_.WriteHeader(header);
    writer_.WriteBlock(block_);
    ++stats_.blocks_out;
  } else if (before == Phase::kPassthrough) {
    writer_.WriteBlock(block_);
    ++stats_.blocks_out;
  } else {
    const auto placement = builder_.Place(cr::unixfs::Classify(block_));
    if (filter_->Decide(placement) == Decision::kEmit) {
      writer_.WriteBlock(block_);
      ++stats_.blocks_out;
    } else {
      ++stats_.blocks_discarded;
    }
    if (placement.kind == PlacementKind::kMismatch) {
      if (filter_->late_mismatch()) {
        PublishWarning("range_late_mismatch",
                       "DAG metadata contradicted after filtering started; forwarding remaining blocks",
                       placement.reason);
      } else {
        PublishWarning("range_passthrough",
                       "Archive is not a single file DAG; forwarding unchanged", placement.reason);
      }
    }
  }

  if (builder_.complete()) {
    filter_->OnDagComplete();
  }
  if (phase() != before) {
    PublishPhaseChange(before, phase());
  }
  if (filter_->satisfied()) {
    Finish();
  }
}

bool RangeSession::Step() {
  if (finished_) {
    return false;
  }
  if (cancelled_.load(std::memory_order_acquire)) {
    started_ = true;
    stats_.cancelled = true;
    Finish();
    return false;
  }
  if (!started_) {
    Start();
    return !finished_;
  }
  try {
    if (!ReadBlock()) {
      if (phase() != Phase::kPassthrough && builder_.incomplete()) {
        stats_.incomplete_dag = true;
        PublishWarning("range_incomplete_dag", "Archive ended before the file DAG was complete",
                       "open frames " + std::to_string(builder_.depth()));
      }
      Finish();
      return false;
    }
    Process(false);
  } catch (const std::exception& ex) {
    Fail(ex);
    throw;
  }
  return !finished_;
}

const SessionStats& RangeSession::Run() {
  while (Step()) {
  }
  return stats_;
}

void RangeSession::Finish() {
  finished_ = true;
  if (stats_.cancelled || phase() == Phase::kSatisfied) {
    source_.Close();
    stats_.source_closed = true;
  }
  if (writer_.header_written()) {
    writer_.Flush();
  }
  stats_.phase = phase();
  stats_.late_mismatch = filter_ && filter_->late_mismatch();
  stats_.bytes_in = reader_.bytes_consumed();
  stats_.bytes_out = writer_.bytes_written();
  stats_.unverified_blocks = reader_.unverified_blocks();

  auto event = MakeEvent(EventSeverity::kInfo, "range_session_complete", "Range session finished");
  event.category = EventCategory::kTelemetry;
  event.fields.emplace_back("range", request_.ToString());
  event.fields.emplace_back("phase", cr::range::PhaseName(stats_.phase));
  AddNumber(event, "blocks_in", stats_.blocks_in);
  AddNumber(event, "blocks_out", stats_.blocks_out);
  AddNumber(event, "bytes_in", stats_.bytes_in);
  AddNumber(event, "bytes_out", stats_.bytes_out);
  if (stats_.cancelled) {
    event.fields.emplace_back("cancelled", "true", FieldPrivacy::kPublic, true);
  }
  EventBus::Instance().Publish(event);
}

void RangeSession::Fail(const std::exception& ex) {
  finished_ = true;
  source_.Close();
  stats_.source_closed = true;
  auto event = MakeEvent(EventSeverity::kError, "range_session_failed", ex.what());
  if (const auto* err = dynamic_cast<const Error*>(&ex)) {
    AddNumber(event, "code", static_cast<uint64_t>(err->code));
    for (const auto& ctx : err->context) {
      event.fields.emplace_back("context", ctx);
    }
  }
  EventBus::Instance().Publish(event);
}

void RangeSession::PublishPhaseChange(Phase from, Phase to) {
  auto event = MakeEvent(EventSeverity::kDebug, "range_phase", "Range filter phase changed");
  event.fields.emplace_back("from", cr::range::PhaseName(from));
  event.fields.emplace_back("to", cr::range::PhaseName(to));
  AddNumber(event, "blocks_in", stats_.blocks_in);
  if (const auto& last = builder_.last_interval()) {
    AddNumber(event, "file_offset", last->end);
  }
  EventBus::Instance().Publish(event);
}

void RangeSession::PublishWarning(const std::string& event_id, const std::string& message,
                                  const std::string& reason) {
  auto event = MakeEvent(EventSeverity::kWarning, event_id, message);
  if (!reason.empty()) {
    event.fields.emplace_back("reason", reason);
  }
  AddNumber(event, "blocks_in", stats_.blocks_in);
  EventBus::Instance().Publish(event);
}

}  // namespace cr::orchestrator
