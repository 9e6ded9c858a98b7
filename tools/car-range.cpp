#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "cr/car/byte_stream.h"
#include "cr/car/reader.h"
#include "cr/common.h"
#include "cr/error.h"
#include "cr/orchestrator/activation.h"
#include "cr/orchestrator/config.h"
#include "cr/orchestrator/event_bus.h"
#include "cr/orchestrator/range_session.h"
#include "cr/range/offset_map.h"
#include "cr/unixfs/node.h"

namespace {

void PrintUsage() {
  std::cout << "Usage:\n"
            << "  car-range filter --in=<path|-> --out=<path|-> (--range=<start:end> | --query=<query>)"
               " [--verify]\n"
            << "  car-range ls --in=<path|-> [--verify]\n";
}

struct Options {
  std::optional<std::string> in;
  std::optional<std::string> out;
  std::optional<std::string> range;
  std::optional<std::string> query;
  bool verify{false};
};

bool ParseOptions(int argc, char** argv, Options& options) {
  for (int i = 2; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg.rfind("--in=", 0) == 0) {
      options.in = std::string(arg.substr(5));
      continue;
    }
    if (arg.rfind("--out=", 0) == 0) {
      options.out = std::string(arg.substr(6));
      continue;
    }
    if (arg.rfind("--range=", 0) == 0) {
      options.range = std::string(arg.substr(8));
      continue;
    }
    if (arg.rfind("--query=", 0) == 0) {
      options.query = std::string(arg.substr(8));
      continue;
    }
    if (arg == "--verify") {
      options.verify = true;
      continue;
    }
    return false;
  }
  return true;
}

std::ifstream OpenInput(const std::string& path) {
  std::ifstream in(std::filesystem::path(path), std::ios::binary);
  if (!in) {
    throw cr::Error(cr::ErrorDomain::IO, cr::errors::io::kOpenFailed,
                    "Failed to open input " + path, errno, cr::Retryability::kFatal);
  }
  return in;
}

void PublishStart(std::string_view command, const Options& options) {
  cr::orchestrator::Event event{};
  event.category = cr::orchestrator::EventCategory::kLifecycle;
  event.severity = cr::orchestrator::EventSeverity::kDebug;
  event.event_id = "car_range_start";
  event.message = std::string(command);
  event.fields.emplace_back("input", options.in.value_or("-"), cr::orchestrator::FieldPrivacy::kHash);
  if (options.range) {
    event.fields.emplace_back("range", *options.range);
  }
  cr::orchestrator::EventBus::Instance().Publish(event);
}

int RunFilter(const Options& options) {
  if (!options.in || !options.out || options.range.has_value() == options.query.has_value()) {
    PrintUsage();
    return 64;
  }
  // --range takes the same start:end / start:* syntax as the query parameter.
  const std::string query = options.range ? "bytes=" + *options.range : *options.query;
  auto request = cr::orchestrator::ParseRangeQuery(query);
  if (!request) {
    std::cerr << "Validation error: no bytes or entity-bytes parameter in query." << std::endl;
    return 64;
  }

  auto config = cr::orchestrator::LoadFilterConfigFromEnvironment();
  if (options.verify) {
    config.verify_digests = true;
  }
  PublishStart("filter", options);

  std::ifstream in_file;
  if (*options.in != "-") {
    in_file = OpenInput(*options.in);
  }
  std::istream& in = *options.in == "-" ? std::cin : in_file;

  std::ofstream out_file;
  if (*options.out != "-") {
    out_file.open(std::filesystem::path(*options.out), std::ios::binary | std::ios::trunc);
    if (!out_file) {
      throw cr::Error(cr::ErrorDomain::IO, cr::errors::io::kOpenFailed,
                      "Failed to open output " + *options.out, errno, cr::Retryability::kFatal);
    }
  }
  std::ostream& out = *options.out == "-" ? std::cout : out_file;

  cr::car::IStreamSource source(in);
  cr::car::OStreamSink sink(out);
  cr::orchestrator::RangeSession session(source, sink, *request, config);
  const auto& stats = session.Run();
  std::cerr << "range " << request->ToString() << ": " << stats.blocks_out << " of "
            << stats.blocks_in << " blocks, " << stats.bytes_out << " bytes written, phase "
            << cr::range::PhaseName(stats.phase) << std::endl;
  return 0;
}

std::string DescribeBlock(const cr::unixfs::Classification& classification) {
  if (const auto* node = std::get_if<cr::unixfs::Node>(&classification)) {
    std::string text = cr::unixfs::NodeKindName(node->kind);
    text += " links=" + std::to_string(node->link_count);
    if (node->filesize) {
      text += " filesize=" + std::to_string(*node->filesize);
    }
    return text;
  }
  return "opaque";
}

int RunList(const Options& options) {
  if (!options.in || options.out || options.range || options.query) {
    PrintUsage();
    return 64;
  }
  auto config = cr::orchestrator::LoadFilterConfigFromEnvironment();
  if (options.verify) {
    config.verify_digests = true;
  }
  PublishStart("ls", options);

  std::ifstream in_file;
  if (*options.in != "-") {
    in_file = OpenInput(*options.in);
  }
  std::istream& in = *options.in == "-" ? std::cin : in_file;

  cr::car::IStreamSource source(in);
  cr::car::CarReader reader(source, cr::orchestrator::ToReaderOptions(config));
  const auto& header = reader.ReadHeader();
  std::cout << "version: " << header.version << '\n';
  for (const auto& root : header.roots) {
    std::cout << "root: " << root.ToString() << '\n';
  }

  cr::range::OffsetMapBuilder builder;
  cr::car::Block block;
  uint64_t index = 0;
  while (reader.Next(block)) {
    const auto classification = cr::unixfs::Classify(block);
    const auto placement = builder.Place(classification);
    std::cout << index++ << '\t' << block.cid.ToString() << '\t' << cr::car::CodecName(block.codec())
              << '\t' << block.payload().size() << '\t' << DescribeBlock(classification) << '\t';
    switch (placement.kind) {
    case cr::range::PlacementKind::kLeaf:
    case cr::range::PlacementKind::kStructural:
      std::cout << '[' << placement.interval.start << ',' << placement.interval.end << ')';
      break;
    case cr::range::PlacementKind::kMismatch:
      std::cout << "mismatch: " << placement.reason;
      break;
    case cr::range::PlacementKind::kDetached:
      std::cout << "detached";
      break;
    }
    std::cout << '\n';
  }
  if (builder.file_size()) {
    std::cout << "file size: " << *builder.file_size() << (builder.complete() ? "" : " (incomplete)")
              << '\n';
  }
  if (reader.unverified_blocks() != 0) {
    std::cout << "unverified blocks: " << reader.unverified_blocks() << '\n';
  }
  std::cout << std::flush;
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return 64;
  }
  try {
    const std::string command = argv[1];
    Options options;
    if (!ParseOptions(argc, argv, options)) {
      PrintUsage();
      return 64;
    }
    if (command == "filter") {
      return RunFilter(options);
    }
    if (command == "ls") {
      return RunList(options);
    }
    PrintUsage();
    return 64;
  } catch (const cr::Error& err) {
    std::cerr << "Error: " << err.what() << std::endl;
    for (const auto& ctx : err.context) {
      std::cerr << "  " << ctx << std::endl;
    }
    return err.domain == cr::ErrorDomain::Validation ? 64 : 74;
  } catch (const std::exception& err) {
    std::cerr << "Fatal: " << err.what() << std::endl;
    return 74;
  }
}
