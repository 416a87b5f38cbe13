#include "record_stager/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <fstream>
#include <sstream>

namespace rs {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(c));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  const RunStats& s = p.stats;
  std::ostringstream o;
  o << "{";
  o << "\"rows\":" << s.rows << ",";
  o << "\"header_rows\":" << s.header_rows << ",";
  o << "\"skipped_lines\":" << s.skipped_lines << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"rows_per_sec\":" << safe_num(s.rows_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << s.stages[i].duration_ms << "}";
  }
  o << "],";

  o << "\"headers\":";
  if (p.headers) {
    o << "[";
    for (size_t i=0;i<p.headers->size();++i){ if (i) o << ","; esc(o, (*p.headers)[i]); }
    o << "]";
  } else {
    o << "null";
  }
  o << ",";

  o << "\"selected_indexes\":";
  if (p.selected_indexes) {
    o << "[";
    for (size_t i=0;i<p.selected_indexes->size();++i){ if (i) o << ","; o << (*p.selected_indexes)[i]; }
    o << "]";
  } else {
    o << "null";
  }
  o << ",";

  o << "\"reordered\":" << (p.reordered ? "true" : "false") << ",";
  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"error\":";    esc(o, p.error);

  o << "}";
  return o.str();
}

bool RunJsonWriter::write_file(const std::string& path, const RunJsonPayload& p,
                               std::string* err_out) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  const std::string json = to_json(p);
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}
