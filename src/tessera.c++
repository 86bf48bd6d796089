#include "util/common.h++"
#include "controllers/id_controller.h++"
#include <algorithm>
#include <cstdlib>
#include <exception>
#include <thread>
#include <vector>
#include <optparse.h>

using namespace Tessera;
using std::exception_ptr, std::make_shared, std::shared_ptr,
    std::string, std::string_view, std::thread, std::vector;

namespace Tessera {
  static auto print_parsed(string_view id, const ParsedId& p) -> void {
    const auto offset_min = p.utc_offset.count() / 60;
    fmt::print(
      "id:         {}\n"
      "packed:     {:d} (0x{:016x})\n"
      "machine id: {:d}\n"
      "sequence:   {:d}\n"
      "utc:        {}\n"
      "local:      {} (UTC{}{:02d}:{:02d})\n",
      id, p.packed, p.packed, p.machine_id, p.sequence,
      format_iso8601(p.utc), format_iso8601(p.local),
      offset_min < 0 ? '-' : '+', std::abs(offset_min) / 60, std::abs(offset_min) % 60
    );
  }

  static auto stress(IdController& ids, size_t threads, size_t count) -> bool {
    vector<vector<uint64_t>> results(threads);
    vector<exception_ptr> errors(threads);
    vector<thread> running_threads;
    const auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < threads; i++) {
      running_threads.emplace_back([&, i] {
        try {
          results[i].reserve(count);
          for (size_t n = 0; n < count; n++) results[i].push_back(ids.next_packed_id());
        } catch (...) {
          errors[i] = std::current_exception();
        }
      });
    }
    for (auto& th : running_threads) th.join();
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);
    for (auto& e : errors) if (e) std::rethrow_exception(e);

    vector<uint64_t> all;
    all.reserve(threads * count);
    for (auto& r : results) {
      if (!std::is_sorted(r.begin(), r.end())) {
        spdlog::error("IDs issued to a single thread are not monotonic");
        return false;
      }
      all.insert(all.end(), r.begin(), r.end());
    }
    std::sort(all.begin(), all.end());
    const auto dup = std::adjacent_find(all.begin(), all.end());
    if (dup != all.end()) {
      spdlog::error("Duplicate ID issued: {}", encode_id(*dup));
      return false;
    }
    spdlog::info("Issued {:d} unique IDs on {:d} threads in {:.3f}s ({:.0f} IDs/s)",
      all.size(), threads, elapsed.count(), all.size() / std::max(elapsed.count(), 1e-9));
    return true;
  }
}

int main(int argc, char** argv) {
  auto parser = optparse::OptionParser()
    .version(string(VERSION))
    .description("Generates and parses compact, sortable request IDs");
  parser.add_option("-m", "--machine-id")
    .dest("machine_id")
    .type("INT")
    .help("machine ID embedded in generated IDs, 0-1023 (default = 0)")
    .set_default(0);
  parser.add_option("--epoch")
    .dest("epoch")
    .type("ISO8601")
    .help("reference instant that ID timestamps are offset from (default = 2023-01-01T00:00:00Z)")
    .set_default("2023-01-01T00:00:00Z");
  parser.add_option("-n", "--count")
    .dest("count")
    .type("INT")
    .help("number of IDs to generate (default = 1)")
    .set_default(1);
  parser.add_option("--parse")
    .dest("parse")
    .type("ID")
    .help("parse an ID and print its components instead of generating");
  parser.add_option("-t", "--threads")
    .dest("threads")
    .type("INT")
    .help("stress test: generate --count IDs on each of this many threads and check that they are unique")
    .set_default(0);
  parser.add_option("--log-level")
    .dest("log_level")
    .help("log level (debug, info, warn, error, critical)")
    .set_default("info");
  parser.add_help_option();

  const optparse::Values options = parser.parse_args(argc, argv);
  spdlog::set_level(spdlog::level::from_str(options["log_level"]));

  const auto epoch = parse_iso8601(options["epoch"]);
  if (!epoch) {
    spdlog::critical("Invalid --epoch: {} (expected YYYY-MM-DDTHH:MM:SS[.mmm]Z)", options["epoch"]);
    return EXIT_FAILURE;
  }

  if (options.is_set_by_user("parse")) {
    const auto id = options["parse"];
    try {
      const auto parsed = parse_id(id, *epoch);
      spdlog::debug("Parsed {}: {}", id, parsed);
      print_parsed(id, parsed);
      return EXIT_SUCCESS;
    } catch (const IdError& e) {
      spdlog::error("Cannot parse {}: {}", id, e.what());
      return EXIT_FAILURE;
    }
  }

  const auto machine_id = parse_uint(options["machine_id"]),
    count = parse_uint(options["count"]),
    threads = parse_uint(options["threads"]);
  if (!machine_id || !count || !threads) {
    spdlog::critical("--machine-id, --count and --threads must be non-negative integers");
    return EXIT_FAILURE;
  }

  shared_ptr<IdController> ids;
  try {
    ids = make_shared<IdController>(IdConfig { .machine_id = *machine_id, .epoch = *epoch });
  } catch (const IdError& e) {
    spdlog::critical("{}", e.what());
    return EXIT_FAILURE;
  }

  try {
    if (*threads) return stress(*ids, *threads, *count) ? EXIT_SUCCESS : EXIT_FAILURE;
    for (uint64_t i = 0; i < *count; i++) fmt::print("{}\n", ids->next_id());
  } catch (const IdError& e) {
    spdlog::critical("ID generation failed: {}", e.what());
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    spdlog::critical("Unhandled internal exception: {}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
