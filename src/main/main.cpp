#include "record_stager/chunk_reader.hpp"
#include "record_stager/errors.hpp"
#include "record_stager/metrics.hpp"
#include "record_stager/parser_settings.hpp"
#include "record_stager/record_stager.hpp"
#include "record_stager/record_view.hpp"
#include "record_stager/record_writer.hpp"
#include "record_stager/run_json.hpp"
#include "record_stager/token_csv_fsm.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitParse = 1;
constexpr int kExitUsage = 2;

struct Cli {
  std::string config_path;
  std::string stats_path;
  std::string input;
  std::optional<std::vector<std::string>> headers;
  std::optional<std::vector<std::string>> select, exclude;
  std::optional<std::vector<int>> select_index, exclude_index;
  std::optional<std::string> null_value;
  std::optional<std::string> delimiter;
  std::optional<int> max_columns;
  std::optional<int> limit;
  bool header = false;
  bool no_reorder = false;
  bool keep_empty_lines = false;
};

void usage(std::ostream& o) {
  o <<
    "Usage: record-stager [--config=FILE] [--headers=a,b,...] [--header]\n"
    "                     [--select=a,b | --select-index=2,0 | --exclude=a | --exclude-index=1]\n"
    "                     [--no-reorder] [--keep-empty-lines] [--null=STR]\n"
    "                     [--max-columns=N] [--delimiter=C] [--limit=N]\n"
    "                     [--stats=FILE] <input.csv>\n";
}

std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    std::size_t pos = s.find(',', start);
    out.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return out;
}

// The whole string must be an integer: "1a" is rejected.
int parse_int(const std::string& s) {
  std::size_t used = 0;
  const int n = std::stoi(s, &used);
  if (used != s.size()) throw std::invalid_argument("not an integer: '" + s + "'");
  return n;
}

std::vector<int> split_ints(const std::string& s) {
  std::vector<int> out;
  for (const auto& item : split_list(s)) out.push_back(parse_int(item));
  return out;
}

// Throws std::invalid_argument / std::out_of_range on bad numbers.
Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto value_of = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (value_of("--config=", &c.config_path)) continue;
    if (value_of("--stats=", &c.stats_path)) continue;
    if (value_of("--headers=", &v))       { c.headers = split_list(v); continue; }
    if (value_of("--select=", &v))        { c.select = split_list(v); continue; }
    if (value_of("--exclude=", &v))       { c.exclude = split_list(v); continue; }
    if (value_of("--select-index=", &v))  { c.select_index = split_ints(v); continue; }
    if (value_of("--exclude-index=", &v)) { c.exclude_index = split_ints(v); continue; }
    if (value_of("--null=", &v))          { c.null_value = v; continue; }
    if (value_of("--delimiter=", &v))     { c.delimiter = v; continue; }
    if (value_of("--max-columns=", &v))   { c.max_columns = parse_int(v); continue; }
    if (value_of("--limit=", &v))         { c.limit = parse_int(v); continue; }
    if (a == "--header")           { c.header = true; continue; }
    if (a == "--no-reorder")       { c.no_reorder = true; continue; }
    if (a == "--keep-empty-lines") { c.keep_empty_lines = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(kExitOk); }
    if (a.rfind("--", 0) == 0) throw std::invalid_argument("unknown option " + a);
    if (!c.input.empty()) throw std::invalid_argument("more than one input file given");
    c.input = a;
  }
  return c;
}

bool build_settings(const Cli& cli, rs::ParserSettings& s, std::string* err) {
  if (!cli.config_path.empty() && !rs::load_settings_json(cli.config_path, s, err)) return false;

  int selectors = (cli.select ? 1 : 0) + (cli.exclude ? 1 : 0) +
                  (cli.select_index ? 1 : 0) + (cli.exclude_index ? 1 : 0);
  if (selectors > 1) { *err = "use only one of --select, --select-index, --exclude, --exclude-index"; return false; }

  if (cli.headers) s.headers = *cli.headers;
  if (cli.select) s.selector = rs::select_fields(*cli.select);
  if (cli.exclude) s.selector = rs::exclude_fields(*cli.exclude);
  if (cli.select_index) s.selector = rs::select_indexes(*cli.select_index);
  if (cli.exclude_index) s.selector = rs::exclude_indexes(*cli.exclude_index);
  if (cli.header) s.header_extraction = true;
  if (cli.no_reorder) s.column_reordering = false;
  if (cli.keep_empty_lines) s.skip_empty_lines = false;
  if (cli.null_value) s.null_value = *cli.null_value;
  if (cli.delimiter) {
    if (cli.delimiter->size() != 1) { *err = "--delimiter takes a single character"; return false; }
    s.delimiter = (*cli.delimiter)[0];
  }
  if (cli.max_columns) {
    if (*cli.max_columns <= 0) { *err = "--max-columns must be > 0"; return false; }
    s.max_columns = static_cast<std::size_t>(*cli.max_columns);
  }
  if (cli.limit) {
    if (*cli.limit < 0) { *err = "--limit must be >= 0"; return false; }
    s.record_limit = static_cast<std::uint64_t>(*cli.limit);
  }
  return s.validate(err);
}

int stage_one_file(const Cli& cli, const rs::ParserSettings& settings) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  rs::MetricsRegistry metrics;
  rs::CsvFsm csv(settings);
  rs::RecordWriter writer(std::cout, settings.delimiter, settings.quote);
  rs::ChunkReader reader(cli.input);

  auto on_record = [&](const rs::RecordView& rv){ writer.write(rv); };

  metrics.start_stage("parse");
  bool parsed = true;
  bool read_ok = reader.for_each_line([&](std::string_view line){
    if (!csv.feed(line, on_record)) { parsed = false; return false; }
    return !csv.done();
  });
  if (parsed && !csv.done()) parsed = csv.finish(on_record);
  metrics.end_stage("parse");
  std::cout.flush();

  const bool io_failed = !read_ok && !reader.stopped();
  if (io_failed) std::cerr << "[read] " << reader.error_message() << "\n";
  if (!parsed) std::cerr << "[parse] " << cli.input << ": " << csv.error() << "\n";
  if (reader.oversize_lines() > 0) {
    std::cerr << "[read] dropped " << reader.oversize_lines() << " oversize line(s)\n";
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  metrics.add_bytes(reader.bytes_read());
  metrics.set_rows(csv.rows(), csv.header_rows(), csv.skipped_lines());

  if (!cli.stats_path.empty()) {
    rs::RunJsonPayload p;
    p.stats = metrics.snapshot(wall_ms);
    p.headers = csv.headers();
    p.selected_indexes = csv.stager().selected_indexes();
    p.reordered = csv.stager().is_reordering_enabled();
    p.filename = cli.input;
    std::error_code fec;
    const auto size = std::filesystem::file_size(cli.input, fec);
    p.file_size = fec ? 0 : static_cast<std::uint64_t>(size);
    if (io_failed) p.error = reader.error_message();
    else if (!parsed) p.error = csv.error();

    std::string err;
    if (!rs::RunJsonWriter::write_file(cli.stats_path, p, &err)) {
      std::cerr << "[stats] " << err << "\n";
      return kExitUsage;
    }
  }

  if (io_failed) return kExitUsage;
  if (!parsed) return kExitParse;
  std::cerr << "[parse] ok: " << cli.input << " rows=" << csv.rows()
            << " header_rows=" << csv.header_rows()
            << " skipped=" << csv.skipped_lines() << "\n";
  return kExitOk;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    cli = parse_cli(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[cli] " << e.what() << "\n";
    usage(std::cerr);
    return kExitUsage;
  }
  if (cli.input.empty()) {
    usage(std::cerr);
    return kExitUsage;
  }

  rs::ParserSettings settings;
  std::string err;
  try {
    if (!build_settings(cli, settings, &err)) {
      std::cerr << "[config] " << err << "\n";
      return kExitUsage;
    }
  } catch (const rs::SelectionError& e) {
    std::cerr << "[config] " << e.what() << "\n";
    return kExitUsage;
  }
  if (settings.selector) std::cerr << "[config] selector " << settings.selector->describe() << "\n";

  return stage_one_file(cli, settings);
}
