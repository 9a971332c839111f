#include "command_line_parser.hpp"
#include "completion_oracle.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "progress_monitor.hpp"
#include "run_log.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_runner.hpp"
#include "verifier.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace bulkfetch::test;

namespace {

bool test_manifest_parses_rows(TestContext&) {
  std::istringstream in("id\tfilename\tmd5\nA\ta.bam\tx\nB\tb.bam\n");
  auto manifest = parse_manifest(in, "inline.tsv");
  bool ok = true;
  ok &= check(manifest.size() == 2, "two rows");
  ok &= check(manifest.rows[0].id == "A" && manifest.rows[0].filename == "a.bam", "first row");
  ok &= check(manifest.rows[1].id == "B" && manifest.rows[1].filename == "b.bam", "second row");
  ok &= check(manifest.skipped_rows == 0 && manifest.duplicate_rows == 0, "nothing dropped");
  return ok;
}

bool test_manifest_rejects_bad_header(TestContext&) {
  bool ok = true;
  for(const char* text : {"filename\tid\nA\ta\n", "id,filename\nA,a\n", "id\n", ""}) {
    std::istringstream in(text);
    bool threw = false;
    try {
      parse_manifest(in, "bad.tsv");
    } catch(const ConfigError& e) {
      threw = std::string(e.what()).find("id<TAB>filename") != std::string::npos;
    }
    ok &= check(threw, std::string("header rejected for '") + text + "'");
  }
  return ok;
}

bool test_manifest_skips_malformed_and_duplicates(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("manifest");
  ctx.logs.attach(logger);
  std::istringstream in("id\tfilename\r\nA\ta.bam\r\n\nnotab\n\tmissing_id\nB\t\nA\tother.bam\nC\tc.bam\r\n");
  auto manifest = parse_manifest(in, "messy.tsv", logger.get());
  bool ok = true;
  ok &= check(manifest.size() == 2, "A and C kept");
  ok &= check(manifest.rows[0].id == "A" && manifest.rows[0].filename == "a.bam", "first A wins");
  ok &= check(manifest.rows[1].id == "C" && manifest.rows[1].filename == "c.bam", "CR stripped from C");
  ok &= check(manifest.skipped_rows == 3, "three malformed rows");
  ok &= check(manifest.duplicate_rows == 1, "one duplicate");
  ok &= check(ctx.logs.contains("duplicate id 'A'"), "duplicate warned");
  return ok;
}

bool test_manifest_rejects_escaping_paths(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("manifest");
  ctx.logs.attach(logger);
  std::istringstream in("id\tfilename\n"
                        "..\ta.bam\n"
                        "/etc\tpasswd\n"
                        "A\tsub/a.bam\n"
                        "B\t..\n"
                        "C\t.\n"
                        "D\td.bam\n");
  auto manifest = parse_manifest(in, "escaping.tsv", logger.get());
  bool ok = true;
  ok &= check(manifest.size() == 1 && manifest.rows[0].id == "D", "only the plain row survives");
  ok &= check(manifest.skipped_rows == 5, "five rows skipped");
  ok &= check(ctx.logs.contains("unsafe id or filename"), "skips warned");
  return ok;
}

bool test_load_manifest_errors(TestContext&) {
  auto root = prepare_workspace("load_manifest");
  bool ok = true;

  bool missing = false;
  try {
    load_manifest(root / "nope.tsv");
  } catch(const ConfigError&) {
    missing = true;
  }
  ok &= check(missing, "missing file is a ConfigError");

  write_file(root / "header_only.tsv", "id\tfilename\n");
  bool empty = false;
  try {
    load_manifest(root / "header_only.tsv");
  } catch(const ConfigError& e) {
    empty = std::string(e.what()).find("0 rows") != std::string::npos;
  }
  ok &= check(empty, "header-only manifest has 0 rows");

  write_manifest(root / "good.tsv", {{"X", "x.txt"}});
  ok &= check(load_manifest(root / "good.tsv").size() == 1, "good manifest loads");
  return ok;
}

bool test_expected_path_layout(TestContext&) {
  auto path = expected_path("/data/out", "abc-123", "sample.bam");
  bool ok = true;
  ok &= check(path == std::filesystem::path("/data/out/abc-123/sample.bam"), "root/id/filename");
  ok &= check(expected_path("/data/out", ManifestRow{"abc-123", "sample.bam"}) == path, "row overload");
  return ok;
}

bool test_count_completed_is_idempotent(TestContext&) {
  auto root = prepare_workspace("count_completed");
  std::vector<ManifestRow> rows = {{"A", "a"}, {"B", "b"}, {"C", "c"}};
  write_file(root / "A" / "a", "data");
  write_file(root / "B" / "b", "");
  bool ok = true;
  ok &= check(count_completed(rows, root) == 2, "existing files count, empty included");
  ok &= check(count_completed(rows, root) == 2, "repeat gives same answer");
  ok &= check(count_completed(rows, root / "absent") == 0, "missing root counts zero");
  ok &= check(count_completed({}, root) == 0, "no rows");
  return ok;
}

bool test_classify_statuses(TestContext&) {
  auto root = prepare_workspace("classify");
  write_file(root / "A" / "a", "payload");
  write_file(root / "B" / "b", "");
  std::filesystem::create_directories(root / "D" / "d");

  auto a = classify({"A", "a"}, root);
  auto b = classify({"B", "b"}, root);
  auto c = classify({"C", "c"}, root);
  auto d = classify({"D", "d"}, root);
  bool ok = true;
  ok &= check(a.status == FileStatus::Ok && a.size_bytes == 7, "non-empty file is OK");
  ok &= check(b.status == FileStatus::Empty && b.size_bytes == 0, "zero bytes is EMPTY");
  ok &= check(c.status == FileStatus::Missing, "absent is MISSING");
  ok &= check(d.status == FileStatus::Missing, "directory is MISSING");
  ok &= check(std::string(to_string(FileStatus::Ok)) == "OK", "OK label");
  ok &= check(std::string(to_string(FileStatus::Empty)) == "EMPTY", "EMPTY label");
  ok &= check(std::string(to_string(FileStatus::Missing)) == "MISSING", "MISSING label");
  return ok;
}

bool test_verify_writes_report(TestContext&) {
  auto root = prepare_workspace("verify_report");
  auto out = root / "out";
  write_file(out / "A" / "a.txt", "abc");
  write_file(out / "B" / "b.txt", "");
  std::vector<ManifestRow> rows = {{"A", "a.txt"}, {"B", "b.txt"}, {"C", "c,1.txt"}};

  auto report = root / "logs" / "verify.csv";
  auto summary = verify(rows, out, report);
  bool ok = true;
  ok &= check(summary.ok == 1 && summary.empty == 1 && summary.missing == 1, "counts");
  ok &= check(summary.total() == rows.size(), "every row classified");
  ok &= check(!summary.clean(), "not clean");
  ok &= check(summary.report_path == report, "report path recorded");

  auto lines = read_lines(report);
  ok &= check(lines.size() == 4, "header plus one line per row");
  if(lines.size() == 4) {
    ok &= check(lines[0] == kVerifyReportHeader, "header");
    ok &= check(lines[1] == "A,a.txt," + (out / "A" / "a.txt").string() + ",OK,3", "OK line");
    ok &= check(lines[2] == "B,b.txt," + (out / "B" / "b.txt").string() + ",EMPTY,0", "EMPTY line");
    ok &= check(lines[3] == "C,\"c,1.txt\",\"" + (out / "C" / "c,1.txt").string() + "\",MISSING,",
                "MISSING line has blank size and quoted comma");
  }

  // Verification never touches the output tree, and a rerun overwrites the report.
  ok &= check(!std::filesystem::exists(out / "C"), "no directories created");
  auto again = verify(rows, out, report);
  ok &= check(again.ok == 1 && read_lines(report).size() == 4, "report overwritten");
  return ok;
}

bool test_csv_escape(TestContext&) {
  bool ok = true;
  ok &= check(csv_escape("plain") == "plain", "plain passes");
  ok &= check(csv_escape("a,b") == "\"a,b\"", "comma quoted");
  ok &= check(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"", "quotes doubled");
  return ok;
}

bool test_format_elapsed(TestContext&) {
  using std::chrono::seconds;
  bool ok = true;
  ok &= check(format_elapsed(seconds(0)) == "00:00:00", "zero");
  ok &= check(format_elapsed(seconds(65)) == "00:01:05", "minutes");
  ok &= check(format_elapsed(seconds(3 * 3600 + 7)) == "03:00:07", "hours");
  ok &= check(format_elapsed(seconds(100 * 3600)) == "100:00:00", "hours do not wrap");
  return ok;
}

bool test_interesting_lines(TestContext&) {
  bool ok = true;
  ok &= check(is_interesting("Downloading file 3"), "download");
  ok &= check(is_interesting("ERROR: connection reset"), "error in caps");
  ok &= check(is_interesting("Retry 2 of 5"), "retry");
  ok &= check(is_interesting("Skipping already complete file"), "skipping");
  ok &= check(is_interesting("saved to disk"), "saved");
  ok &= check(!is_interesting("100%|#######|"), "bar is not interesting");
  ok &= check(!is_interesting(""), "empty");
  return ok;
}

bool test_progress_line_format(TestContext&) {
  ProgressSnapshot snapshot;
  snapshot.done = 3;
  snapshot.total = 10;
  snapshot.initial_done = 2;
  snapshot.elapsed = std::chrono::seconds(65);
  snapshot.last_line = "spinner output";
  bool ok = true;
  ok &= check(format_progress_line(snapshot) ==
              "Progress: 3/10 ( 30.0%) | elapsed 00:01:05 | resumed_from 2",
              "uninteresting last line omitted");

  snapshot.last_line = "Downloading " + std::string(200, 'x');
  auto line = format_progress_line(snapshot);
  auto pos = line.find(" | last: ");
  ok &= check(pos != std::string::npos, "interesting last line shown");
  if(pos != std::string::npos) {
    ok &= check(line.size() - (pos + 9) == kStatusExcerptLength, "excerpt truncated");
  }

  ProgressSnapshot empty;
  ok &= check(format_progress_line(empty).find("0/0 (  0.0%)") != std::string::npos, "zero total");
  return ok;
}

bool test_excerpt_keeps_utf8_whole(TestContext&) {
  const std::string e_acute = "\xC3\xA9";
  bool ok = true;
  ok &= check(utf8_prefix("ab" + e_acute, 3) == "ab", "no half character");
  ok &= check(utf8_prefix("ab" + e_acute, 4) == "ab" + e_acute, "whole character kept");
  ok &= check(utf8_prefix("abc", 10) == "abc", "short text unchanged");

  ProgressSnapshot snapshot;
  snapshot.total = 1;
  // The two-byte character straddles the excerpt boundary.
  snapshot.last_line = "Downloading " + std::string(kStatusExcerptLength - 13, 'x') + e_acute + "tail";
  auto line = format_progress_line(snapshot);
  auto pos = line.find(" | last: ");
  ok &= check(pos != std::string::npos, "excerpt present");
  if(pos != std::string::npos) {
    auto excerpt = line.substr(pos + 9);
    ok &= check(excerpt.size() == kStatusExcerptLength - 1, "cut before the character");
    ok &= check(excerpt.back() == 'x', "ends on a whole character");
  }
  return ok;
}

bool test_line_splitter_endings(TestContext&) {
  std::vector<std::string> lines;
  LineSplitter::LineHandler collect = [&](const std::string& line){ lines.push_back(line); };
  LineSplitter splitter;
  // A CR LF pair split across two reads still ends only one line.
  const std::string first = "10%\r50%\rdone\r";
  const std::string second = "\nnext\n\nlast";
  splitter.feed(first.data(), first.size(), collect);
  splitter.feed(second.data(), second.size(), collect);
  splitter.finish(collect);
  std::vector<std::string> expected = {"10%", "50%", "done", "next", "", "last"};
  bool ok = check(lines == expected, "CR, LF and CRLF each end one line");

  lines.clear();
  LineSplitter endless;
  const std::string bar(LineSplitter::kMaxLineLength + 10, '#');
  endless.feed(bar.data(), bar.size(), collect);
  endless.finish(collect);
  ok &= check(lines.size() == 2 && lines[0].size() == LineSplitter::kMaxLineLength &&
              lines[1].size() == 10, "unterminated output is cut");
  return ok;
}

bool test_last_line_cell(TestContext&) {
  LastLineCell cell;
  bool ok = check(cell.get().empty(), "starts empty");
  cell.set("one");
  cell.set("two");
  ok &= check(cell.get() == "two", "last write wins");
  return ok;
}

bool test_transfer_command_argv(TestContext&) {
  TransferCommand cmd;
  cmd.client = "/opt/gdc-client";
  cmd.manifest = "m.tsv";
  cmd.out_dir = "out dir";
  cmd.threads = 4;
  std::vector<std::string> expected = {"/opt/gdc-client", "download", "-m", "m.tsv", "-d", "out dir", "-n", "4"};
  bool ok = check(cmd.argv() == expected, "argv without token");

  cmd.token_file = "token.txt";
  expected.push_back("-t");
  expected.push_back("token.txt");
  ok &= check(cmd.argv() == expected, "token appended");
  ok &= check(cmd.to_string().find("'out dir'") != std::string::npos, "display quotes spaces");
  return ok;
}

bool test_prepare_directories(TestContext&) {
  auto root = prepare_workspace("prepare_dirs");
  prepare_directories(root / "out" / "nested", root / "logs");
  prepare_directories(root / "out" / "nested", root / "logs");
  bool ok = true;
  ok &= check(std::filesystem::is_directory(root / "out" / "nested"), "out dir created");
  ok &= check(std::filesystem::is_directory(root / "logs"), "log dir created");

  write_file(root / "blocker", "x");
  bool threw = false;
  try {
    prepare_directories(root / "blocker" / "sub", root / "logs");
  } catch(const IoError&) {
    threw = true;
  }
  ok &= check(threw, "file in the way is an IoError");
  return ok;
}

bool test_run_log_layout(TestContext&) {
  auto root = prepare_workspace("run_log");
  auto path = timestamped_path(root, "transfer", ".log");
  bool ok = check(path.filename().string().rfind("transfer_", 0) == 0, "prefix");
  ok &= check(path.extension() == ".log", "extension");
  ok &= check(path.filename().string().size() == std::string("transfer_YYYYmmdd_HHMMSS.log").size(),
              "timestamp width");
  {
    RunLog log(path);
    log.write_header("gdc-client download", {{"MANIFEST", "m.tsv"}, {"THREADS", "8"}});
    log.append_output("raw line");
    log.append_blank();
    log.append_tagged("VERIFY", "OK=1 MISSING=0 EMPTY=0");
  }
  auto lines = read_lines(path);
  std::vector<std::string> expected = {
    "[CMD] gdc-client download", "[MANIFEST] m.tsv", "[THREADS] 8", "",
    "raw line", "", "[VERIFY] OK=1 MISSING=0 EMPTY=0"};
  ok &= check(lines == expected, "header, output and trailer verbatim");
  return ok;
}

bool test_settings_defaults_and_types(TestContext&) {
  SettingsManager settings;
  bool ok = true;
  ok &= check(settings.get<int>("threads") == 8, "threads default");
  ok &= check(settings.get<std::string>("log_dir") == "logs", "log_dir default");
  ok &= check(settings.get<std::string>("client") == "gdc-client", "client default");
  ok &= check(settings.get<int>("progress_every") == 10, "progress default");
  ok &= check(!settings.get<bool>("verify_after"), "verify_after default");

  std::string error;
  ok &= check(!settings.set_from_string("threads", "4x", error), "trailing junk rejected");
  ok &= check(settings.set_from_string("threads", "16", error), "int accepted");
  ok &= check(settings.get<int>("threads") == 16, "int stored");
  ok &= check(!settings.set_from_string("verify_after", "maybe", error), "bad bool rejected");
  ok &= check(settings.resolve_key("strict").value_or("") == "fail_on_verify", "alias resolves");
  ok &= check(!settings.resolve_key("bogus").has_value(), "unknown key");
  return ok;
}

bool test_settings_persist_round_trip(TestContext&) {
  auto root = prepare_workspace("settings_file");
  auto file = root / ".config" / "settings.json";
  SettingsManager writer;
  std::string error;
  writer.set_from_string("out_dir", "/data/out", error);
  writer.set_from_string("manifest", "not_persisted.tsv", error);
  writer.set_from_string("threads", "3", error);
  bool ok = check(writer.save_to_file(file), "saved");

  SettingsManager reader;
  ok &= check(reader.load_from_file(file), "loaded");
  ok &= check(reader.get<std::string>("out_dir") == "/data/out", "persistent key restored");
  ok &= check(reader.get<int>("threads") == 3, "int restored");
  ok &= check(reader.get<std::string>("manifest").empty(), "manifest is not persisted");
  return ok;
}

bool test_command_line_parsing(TestContext&) {
  CommandLineParser parser;
  SettingsManager settings;
  parser.parse({"ids.tsv", "out", "-n", "12", "--verify", "--fail_on_verify=true",
                "--token_file", "tok", "-p", "3"}, settings);
  bool ok = true;
  ok &= check(settings.get<std::string>("manifest") == "ids.tsv", "positional manifest");
  ok &= check(settings.get<std::string>("out_dir") == "out", "positional out_dir");
  ok &= check(settings.get<int>("threads") == 12, "alias with value");
  ok &= check(settings.get<bool>("verify_after"), "bare bool flag");
  ok &= check(settings.get<bool>("fail_on_verify"), "key=value form");
  ok &= check(settings.get<std::string>("token_file") == "tok", "long option value");
  ok &= check(settings.get<int>("progress_every") == 3, "short int option");

  SettingsManager flags;
  parser.parse({"--dry_run", "false", "--verbose", "-m", "x.tsv"}, flags);
  ok &= check(!flags.get<bool>("dry_run"), "explicit false literal");
  ok &= check(flags.get<bool>("verbose"), "bool before option");
  ok &= check(flags.get<std::string>("manifest") == "x.tsv", "-m alias");
  return ok;
}

bool test_command_line_errors(TestContext&) {
  CommandLineParser parser;
  auto fails = [&](const std::vector<std::string>& args){
    SettingsManager settings;
    try {
      parser.parse(args, settings);
    } catch(const ConfigError&) {
      return true;
    }
    return false;
  };
  bool ok = true;
  ok &= check(fails({"--nonsense"}), "unknown long option");
  ok &= check(fails({"--threads"}), "missing value");
  ok &= check(fails({"--threads", "many"}), "invalid int");
  ok &= check(fails({"a.tsv", "out", "extra"}), "too many positionals");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  const bool verbose = verbose_requested(argc, argv, "BULKFETCH_TEST_VERBOSE");
  init(verbose);

  std::vector<TestCase> tests = {
    {"manifest_parses_rows", test_manifest_parses_rows},
    {"manifest_rejects_bad_header", test_manifest_rejects_bad_header},
    {"manifest_skips_malformed_and_duplicates", test_manifest_skips_malformed_and_duplicates},
    {"manifest_rejects_escaping_paths", test_manifest_rejects_escaping_paths},
    {"load_manifest_errors", test_load_manifest_errors},
    {"expected_path_layout", test_expected_path_layout},
    {"count_completed_is_idempotent", test_count_completed_is_idempotent},
    {"classify_statuses", test_classify_statuses},
    {"verify_writes_report", test_verify_writes_report},
    {"csv_escape", test_csv_escape},
    {"format_elapsed", test_format_elapsed},
    {"interesting_lines", test_interesting_lines},
    {"progress_line_format", test_progress_line_format},
    {"excerpt_keeps_utf8_whole", test_excerpt_keeps_utf8_whole},
    {"line_splitter_endings", test_line_splitter_endings},
    {"last_line_cell", test_last_line_cell},
    {"transfer_command_argv", test_transfer_command_argv},
    {"prepare_directories", test_prepare_directories},
    {"run_log_layout", test_run_log_layout},
    {"settings_defaults_and_types", test_settings_defaults_and_types},
    {"settings_persist_round_trip", test_settings_persist_round_trip},
    {"command_line_parsing", test_command_line_parsing},
    {"command_line_errors", test_command_line_errors},
  };
  return run_tests("unit", tests, verbose);
}
