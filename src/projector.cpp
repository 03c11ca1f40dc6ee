#include <lrp/projector.hpp>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <lrp/entry_registry.hpp>
#include <lrp/logging.hpp>

namespace lrp {

void sort_samples(std::vector<Sample>& samples) {
  std::stable_sort(samples.begin(), samples.end(),
                   [](const Sample& a, const Sample& b) { return a.timestamp_s < b.timestamp_s; });
}

std::vector<Sample> project_records(const LogReader& reader,
                                    double max_timestamp_s,
                                    ProjectionStats* stats) {
  ProjectionStats local{};
  ProjectionStats& st = stats ? *stats : local;
  st = ProjectionStats{};

  EntryRegistry entries;
  std::vector<Sample> out;

  for (const Record& rec : reader) {
    ++st.records;
    if (rec.is_control()) {
      ++st.control_records;
      if (entries.apply(rec) == EntryRegistry::Applied::Ignored) {
        ++st.ignored_control;
        log::debug("control record ignored", {log::num("offset", rec.offset)});
      }
      continue;
    }

    const LogEntry* entry = entries.resolve(rec.entry);
    if (!entry) {
      ++st.orphan_records;
      continue;
    }

    const double ts = rec.timestamp_s();
    if (ts > max_timestamp_s) {
      ++st.out_of_window;
      continue;
    }

    Sample s;
    s.timestamp_s = ts;
    s.key = entry->name;
    s.type = entry->type;
    s.type_name = entry->type_name;
    s.metadata = entry->metadata;
    if (auto v = decode_value(entry->type, rec.payload)) {
      s.value = std::move(*v);
    } else {
      ++st.decode_failures;
      log::debug("value decode failed",
                 {log::str("key", entry->name), log::str("type", entry->type_name),
                  log::num("bytes", rec.payload.size())});
    }
    out.push_back(std::move(s));
  }

  sort_samples(out);
  return out;
}

std::optional<Bytes> read_file_bytes(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  Bytes buf((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) return std::nullopt;
  return buf;
}

std::optional<std::vector<Sample>> load_log_file(const std::string& path,
                                                 double max_timestamp_s,
                                                 ProjectionStats* stats) {
  auto buf = read_file_bytes(path);
  if (!buf) return std::nullopt;
  LogReader reader(*buf);
  return project_records(reader, max_timestamp_s, stats);
}

} // namespace lrp
