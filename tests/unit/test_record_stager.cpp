#include "record_stager/errors.hpp"
#include "record_stager/field_selector.hpp"
#include "record_stager/parser_settings.hpp"
#include "record_stager/record_stager.hpp"
#include <iostream>
#include <string>
#include <vector>

using Row = std::vector<std::string>;
using Kind = rs::RowOutcome::Kind;

static int failures = 0;

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static rs::RowOutcome push_row(rs::RecordStager& st, const Row& fields) {
  for (const auto& f : fields) st.append_value(f);
  rs::RowOutcome out = st.finalize_row();
  st.reset();
  return out;
}

static bool emitted(const rs::RowOutcome& o, const Row& want) {
  return o.kind == Kind::Emit && o.values == want;
}

static void pass_through_without_selection() {
  rs::ParserSettings s;
  s.max_columns = 4;
  rs::RecordStager st(s);

  check(emitted(push_row(st, {"x", "y", "z"}), {"x", "y", "z"}), "pass-through keeps first k values in order");
  check(emitted(push_row(st, {"1", "2", "3", "4"}), {"1", "2", "3", "4"}), "pass-through full-width row");
  check(emitted(push_row(st, {"only"}), {"only"}), "pass-through short row");
  check(st.record_count() == 3, "record_count counts emitted rows");
  check(!st.headers().has_value(), "no headers without extraction");
  check(!st.selected_indexes().has_value(), "no selection configured");
  check(!st.is_reordering_enabled(), "no reordering without selection");
  check(st.selection_initialized(), "first row initializes selection");
}

static void header_row_then_reordered_data() {
  rs::ParserSettings s;
  s.max_columns = 3;
  s.header_extraction = true;
  s.column_reordering = true;
  s.selector = rs::select_fields({"b", "a"});
  rs::RecordStager st(s);

  rs::RowOutcome first = push_row(st, {"a", "b", "c"});
  check(first.kind == Kind::Suppressed, "header row is suppressed");
  check(st.record_count() == 0, "header row does not count");
  check(st.headers() && *st.headers() == Row({"a", "b", "c"}), "headers taken from first row");
  check(st.selected_indexes() && *st.selected_indexes() == std::vector<int>({1, 0}), "selected indexes b,a -> 1,0");
  check(st.is_reordering_enabled(), "reordering enabled with selection");
  check(st.target(2) == rs::ColumnTarget::Discard, "unselected column routed to discard");
  check(st.target(0) == rs::ColumnTarget::Capture && st.target(1) == rs::ColumnTarget::Capture,
        "selected columns captured");

  check(emitted(push_row(st, {"1", "2", "3"}), {"2", "1"}), "data row emitted as b,a");
  check(st.record_count() == 1, "record_count after first data row");
}

static void short_rows_get_null_under_reordering() {
  rs::ParserSettings s;
  s.max_columns = 4;
  s.null_value = "NULL";
  s.selector = rs::select_indexes({2, 0});
  rs::RecordStager st(s);

  check(emitted(push_row(st, {"p", "q", "r"}), {"r", "p"}), "first row resolves and is emitted");
  check(emitted(push_row(st, {"s"}), {"NULL", "s"}), "missing selected column becomes null_value");
  check(emitted(push_row(st, {"t", "u", "v", "w"}), {"v", "t"}), "wider row maps through fixed indexes");
}

static void skip_empty_lines_policy() {
  rs::ParserSettings s;
  s.max_columns = 2;
  rs::RecordStager st(s);
  for (int i = 0; i < 3; ++i) {
    rs::RowOutcome o = st.finalize_row();
    st.reset();
    check(o.kind == Kind::Skipped, "empty row skipped");
  }
  check(st.record_count() == 0, "skipped rows never counted");
  check(!st.selection_initialized(), "skipped rows do not resolve selection");
}

static void empty_row_kept_without_selection() {
  rs::ParserSettings s;
  s.max_columns = 2;
  s.skip_empty_lines = false;
  s.null_value = "NULL";
  rs::RecordStager st(s);

  rs::RowOutcome o = st.finalize_row();
  st.reset();
  check(emitted(o, {}), "empty row emitted as empty record");
  check(st.record_count() == 1, "empty row counted");
}

static void empty_row_kept_with_selection() {
  rs::ParserSettings s;
  s.max_columns = 3;
  s.skip_empty_lines = false;
  s.null_value = "NULL";
  s.headers = Row{"a", "b", "c"};
  s.selector = rs::select_fields({"c", "a"});
  rs::RecordStager st(s);

  rs::RowOutcome o = st.finalize_row();
  st.reset();
  check(emitted(o, {"NULL", "NULL"}), "empty row under selection is all null_value");
  check(st.selection_initialized(), "configured headers resolve on empty row");
  check(st.headers() && *st.headers() == Row({"a", "b", "c"}), "configured headers in effect");
  check(emitted(push_row(st, {"1", "2", "3"}), {"3", "1"}), "data row after empty row");
  check(st.record_count() == 2, "both rows counted");
}

static void leading_empty_row_does_not_steal_header() {
  rs::ParserSettings s;
  s.max_columns = 3;
  s.skip_empty_lines = false;
  s.header_extraction = true;
  rs::RecordStager st(s);

  rs::RowOutcome o = st.finalize_row();
  st.reset();
  check(emitted(o, {}), "leading empty row emitted");
  check(!st.selection_initialized(), "empty row without headers leaves resolution pending");

  check(push_row(st, {"h1", "h2"}).kind == Kind::Suppressed, "first row with fields is the header row");
  check(st.headers() && *st.headers() == Row({"h1", "h2"}), "headers from first non-empty row");
  check(emitted(push_row(st, {"v1", "v2"}), {"v1", "v2"}), "data follows header");
  check(st.record_count() == 2, "empty row and data row counted");
}

static void resolve_is_one_shot() {
  rs::ParserSettings s;
  s.max_columns = 4;
  s.selector = rs::select_fields({"b"});
  rs::RecordStager st(s);

  st.resolve({"a", "b", "c"});
  check(st.selection_initialized(), "resolve sets the flag");
  auto sel = st.selected_indexes();
  bool reordered = st.is_reordering_enabled();

  st.resolve({"b", "x"});
  check(st.selected_indexes() == sel, "second resolve leaves selection alone");
  check(st.is_reordering_enabled() == reordered, "second resolve leaves reordering alone");
  check(!st.headers().has_value(), "resolve alone does not adopt headers");

  check(emitted(push_row(st, {"1", "2", "3"}), {"2"}), "rows use the first resolution");
  check(st.selected_indexes() == sel, "finalize_row does not re-resolve");
}

static void pass_through_selection_keeps_wider_columns() {
  rs::ParserSettings s;
  s.max_columns = 5;
  s.header_extraction = true;
  s.column_reordering = false;
  s.null_value = "N";
  s.selector = rs::select_fields({"b"});
  rs::RecordStager st(s);

  check(push_row(st, {"a", "b"}).kind == Kind::Suppressed, "header consumed");
  check(!st.is_reordering_enabled(), "reordering disabled");
  check(st.selected_indexes() && *st.selected_indexes() == std::vector<int>({1}), "selection still recorded");
  check(st.target(0) == rs::ColumnTarget::Discard, "unselected header column discarded");
  check(st.target(2) == rs::ColumnTarget::Capture && st.target(4) == rs::ColumnTarget::Capture,
        "columns beyond header are captured");

  check(emitted(push_row(st, {"1", "2", "3", "4"}), {"N", "2", "3", "4"}),
        "discarded column keeps its slot as null_value");
}

static void configured_headers_with_extraction_skip_first_row() {
  rs::ParserSettings s;
  s.max_columns = 3;
  s.header_extraction = true;
  s.headers = Row{"x", "y", "z"};
  s.selector = rs::select_fields({"z"});
  rs::RecordStager st(s);

  check(push_row(st, {"A", "B", "C"}).kind == Kind::Suppressed, "input header row dropped");
  check(st.headers() && *st.headers() == Row({"x", "y", "z"}), "configured headers win over parsed row");
  check(emitted(push_row(st, {"1", "2", "3"}), {"3"}), "selection resolved against configured headers");
}

static void selected_index_beyond_capacity() {
  rs::ParserSettings s;
  s.max_columns = 3;
  s.selector = rs::select_indexes({0, 9});
  rs::RecordStager st(s);

  check(emitted(push_row(st, {"a", "b"}), {"a", ""}), "index past max_columns yields null_value");
  check(st.target(1) == rs::ColumnTarget::Discard, "unselected column discarded");
}

static void capacity_violation() {
  rs::ParserSettings s;
  s.max_columns = 3;
  rs::RecordStager st(s);

  st.append_value("1");
  st.append_value("2");
  st.append_value("3");
  check(st.current_column() == 3, "exactly max_columns fields fit");
  check(st.current_target() == rs::ColumnTarget::Discard, "target past the last column discards");

  bool threw = false;
  try {
    st.append_value("4");
  } catch (const rs::CapacityError& e) {
    threw = true;
    check(e.column() == 3, "capacity error reports the column");
  }
  check(threw, "4th field with max_columns=3 throws CapacityError");
  check(st.record_count() == 0, "no partial emission");

  st.reset();
  check(emitted(push_row(st, {"a", "b", "c"}), {"a", "b", "c"}), "stager usable after reset");
}

static void sequencing_violations() {
  rs::ParserSettings s;
  s.max_columns = 2;
  rs::RecordStager st(s);

  st.append_value("a");
  (void)st.finalize_row();

  bool twice = false;
  try { (void)st.finalize_row(); } catch (const rs::SequenceError&) { twice = true; }
  check(twice, "finalize_row twice without reset is rejected");

  bool append_after = false;
  try { st.append_empty(); } catch (const rs::SequenceError&) { append_after = true; }
  check(append_after, "append after finalize_row is rejected");

  st.reset();
  check(emitted(push_row(st, {"b"}), {"b"}), "protocol resumes after reset");
  check(st.record_count() == 2, "counts unaffected by rejected calls");
}

static void character_routing() {
  rs::ParserSettings s;
  s.max_columns = 3;
  s.null_value = "-";
  s.headers = Row{"a", "b", "c"};
  s.selector = rs::select_fields({"a", "c"});
  s.column_reordering = false;
  rs::RecordStager st(s);

  // Routing is only in place once the selection has been resolved.
  st.resolve(*s.headers);

  st.append_chars("hello");
  check(st.appender().size() == 5, "captured column accumulates");
  st.value_parsed();
  st.append_chars("dropped");
  check(!st.capturing() && st.appender().size() == 0, "discarded column drops characters");
  st.value_parsed();
  st.append_char('z');
  st.value_parsed();
  rs::RowOutcome o = st.finalize_row();
  st.reset();
  check(emitted(o, {"hello", "-", "z"}), "routing applied per column");

  st.value_parsed();
  st.append_empty();
  o = st.finalize_row();
  st.reset();
  check(emitted(o, {"-", "-"}), "empty accumulations stage null_value");
}

static void selector_failure_leaves_stager_unresolved() {
  rs::ParserSettings s;
  s.max_columns = 3;
  s.header_extraction = true;
  s.selector = rs::select_fields({"missing"});
  rs::RecordStager st(s);

  st.append_value("a");
  bool threw = false;
  try { (void)st.finalize_row(); } catch (const rs::SelectionError&) { threw = true; }
  check(threw, "unknown field name raises SelectionError");
  check(!st.selection_initialized(), "failed resolution is not committed");
  check(!st.headers().has_value(), "failed resolution adopts no headers");
}

int main() {
  pass_through_without_selection();
  header_row_then_reordered_data();
  short_rows_get_null_under_reordering();
  skip_empty_lines_policy();
  empty_row_kept_without_selection();
  empty_row_kept_with_selection();
  leading_empty_row_does_not_steal_header();
  resolve_is_one_shot();
  pass_through_selection_keeps_wider_columns();
  configured_headers_with_extraction_skip_first_row();
  selected_index_beyond_capacity();
  capacity_violation();
  sequencing_violations();
  character_routing();
  selector_failure_leaves_stager_unresolved();

  if (failures) { std::cerr << "[FAIL] record_stager: " << failures << " check(s) failed\n"; return 1; }
  std::cout << "[PASS] record_stager\n";
  return 0;
}
