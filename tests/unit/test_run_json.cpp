#include "record_stager/metrics.hpp"
#include "record_stager/run_json.hpp"
#include <iostream>
#include <string>
#include <simdjson.h>

int main(){
  rs::MetricsRegistry m;
  m.start_stage("parse");
  m.end_stage("parse");
  m.end_stage("never-started");
  m.add_bytes(2048);
  m.set_rows(10, 1, 3);

  rs::RunJsonPayload p;
  p.stats = m.snapshot(0.0);
  p.headers = std::vector<std::string>{"a", "b \"quoted\""};
  p.selected_indexes = std::vector<int>{1, 0};
  p.reordered = true;
  p.filename = "in\\put.csv";

  const std::string json = rs::RunJsonWriter::to_json(p);

  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);
  simdjson::ondemand::document doc;
  if (parser.iterate(padded).get(doc)) { std::cerr << "[FAIL] not JSON: " << json << "\n"; return 1; }

  uint64_t rows = 0, header_rows = 0, skipped = 0, bytes = 0;
  double mbps = -1.0;
  if (doc["rows"].get(rows) || doc["header_rows"].get(header_rows) ||
      doc["skipped_lines"].get(skipped) || doc["bytes"].get(bytes) ||
      doc["throughput_mb_s"].get(mbps)) {
    std::cerr << "[FAIL] missing counters in run.json: " << json << "\n";
    return 1;
  }
  if (rows != 10 || header_rows != 1 || skipped != 3 || bytes != 2048) {
    std::cerr << "[FAIL] counters in run.json: " << json << "\n";
    return 1;
  }
  if (mbps != 0.0) { std::cerr << "[FAIL] zero wall time must give zero throughput\n"; return 1; }

  simdjson::ondemand::array stages;
  if (doc["stage_times"].get(stages)) { std::cerr << "[FAIL] stage_times not an array\n"; return 1; }
  std::size_t n_stages = 0;
  for (auto st : stages) {
    std::string_view name;
    if (st["stage"].get(name) || name != "parse") { std::cerr << "[FAIL] unexpected stage\n"; return 1; }
    ++n_stages;
  }
  if (n_stages != 1) { std::cerr << "[FAIL] stages=" << n_stages << "\n"; return 1; }

  simdjson::ondemand::array headers;
  if (doc["headers"].get(headers)) { std::cerr << "[FAIL] headers not an array\n"; return 1; }
  std::string second_header;
  std::size_t i = 0;
  for (auto h : headers) {
    std::string_view sv;
    if (h.get(sv)) { std::cerr << "[FAIL] header not a string\n"; return 1; }
    if (i++ == 1) second_header.assign(sv.data(), sv.size());
  }
  if (second_header != "b \"quoted\"") { std::cerr << "[FAIL] header escaping: " << json << "\n"; return 1; }

  bool reordered = false;
  std::string_view fname;
  if (doc["reordered"].get(reordered) || doc["filename"].get(fname) ||
      !reordered || fname != "in\\put.csv") {
    std::cerr << "[FAIL] trailing fields: " << json << "\n";
    return 1;
  }

  rs::RunJsonPayload empty;
  const std::string nulls = rs::RunJsonWriter::to_json(empty);
  if (nulls.find("\"headers\":null") == std::string::npos ||
      nulls.find("\"selected_indexes\":null") == std::string::npos) {
    std::cerr << "[FAIL] absent layout must serialize as null: " << nulls << "\n";
    return 1;
  }

  std::cout << "[PASS] run_json " << json.size() << " bytes\n";
  return 0;
}
