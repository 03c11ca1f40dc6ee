#include <lrp/interchange.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace lrp {

static std::string quote_if_needed(const std::string& s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

// One CSV record; quoted fields may contain separators and line breaks.
// Returns false at end of input with nothing read.
static bool read_csv_record(std::istream& in, std::vector<std::string>& cols) {
  cols.clear();
  std::string cur;
  bool in_quotes = false;
  bool any = false;
  char c;
  while (in.get(c)) {
    any = true;
    if (in_quotes) {
      if (c == '"') {
        if (in.peek() == '"') { in.get(c); cur.push_back('"'); }
        else in_quotes = false;
      } else {
        cur.push_back(c);
      }
      continue;
    }
    if (c == '"') { in_quotes = true; }
    else if (c == ',') { cols.push_back(std::move(cur)); cur.clear(); }
    else if (c == '\n') { break; }
    else if (c == '\r') { if (in.peek() == '\n') in.get(c); break; }
    else { cur.push_back(c); }
  }
  if (!any) return false;
  cols.push_back(std::move(cur));
  return true;
}

static bool is_blank_record(const std::vector<std::string>& cols) {
  return cols.size() == 1 && cols[0].find_first_not_of(" \t") == std::string::npos;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && cols[0] == "timestamp";
}

static std::optional<double> parse_timestamp(const std::string& s) {
  const char* begin = s.c_str();
  char* end = nullptr;
  const double v = std::strtod(begin, &end);
  if (end == begin) return std::nullopt;
  while (*end == ' ' || *end == '\t') ++end;
  if (*end != '\0' || !std::isfinite(v)) return std::nullopt;
  return v;
}

void write_interchange_csv(std::ostream& out, const std::vector<Sample>& samples) {
  out << "timestamp,key,type,value,meta\r\n";
  char ts[64];
  for (const auto& s : samples) {
    std::snprintf(ts, sizeof(ts), "%.6f", s.timestamp_s);
    out << ts << ','
        << quote_if_needed(s.key) << ','
        << quote_if_needed(s.type_name.empty() ? value_type_name(s.type) : s.type_name) << ','
        << quote_if_needed(s.value) << ','
        << quote_if_needed(s.metadata) << "\r\n";
  }
}

bool save_interchange_csv(const std::string& path, const std::vector<Sample>& samples) {
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  write_interchange_csv(f, samples);
  return static_cast<bool>(f);
}

std::vector<Sample> interchange_from_csv_stream(std::istream& in, double max_timestamp_s) {
  std::vector<Sample> out;
  std::vector<std::string> cols;
  bool header_consumed = false;

  while (read_csv_record(in, cols)) {
    if (is_blank_record(cols)) continue;
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 4) continue;

    const auto ts = parse_timestamp(cols[0]);
    if (!ts || *ts < 0.0 || *ts > max_timestamp_s) continue;

    Sample s;
    s.timestamp_s = *ts;
    s.key = std::move(cols[1]);
    s.type_name = std::move(cols[2]);
    s.type = value_type_from_name(s.type_name);
    s.value = std::move(cols[3]);
    if (cols.size() >= 5) s.metadata = std::move(cols[4]);
    out.push_back(std::move(s));
  }

  sort_samples(out);
  return out;
}

std::optional<std::vector<Sample>> load_interchange_csv(const std::string& path, double max_timestamp_s) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;
  auto samples = interchange_from_csv_stream(f, max_timestamp_s);
  // Opens but cannot be read: a directory, or an I/O error mid-file.
  if (f.bad()) return std::nullopt;
  return samples;
}

} // namespace lrp
