#include "verifier.hpp"

#include <fstream>

#include "errors.hpp"
#include "log.hpp"

std::string csv_escape(const std::string& field) {
  if(field.find_first_of(",\"\r\n") == std::string::npos) return field;
  std::string quoted;
  quoted.reserve(field.size() + 2);
  quoted.push_back('"');
  for(char ch : field) {
    if(ch == '"') quoted.push_back('"');
    quoted.push_back(ch);
  }
  quoted.push_back('"');
  return quoted;
}

void write_verify_report(std::ostream& out, const std::vector<VerificationRecord>& records) {
  out << kVerifyReportHeader << "\n";
  for(const auto& record : records) {
    out << csv_escape(record.id) << ','
        << csv_escape(record.filename) << ','
        << csv_escape(record.expected_path.string()) << ','
        << to_string(record.status) << ',';
    if(record.status != FileStatus::Missing) {
      out << record.size_bytes;
    }
    out << "\n";
  }
}

VerifySummary verify(const std::vector<ManifestRow>& rows,
                     const std::filesystem::path& output_root,
                     const std::filesystem::path& report_path,
                     Logger* logger) {
  VerifySummary summary;
  summary.report_path = report_path;
  summary.records.reserve(rows.size());

  for(const auto& row : rows) {
    auto record = classify(row, output_root);
    switch(record.status) {
      case FileStatus::Ok:      ++summary.ok; break;
      case FileStatus::Missing: ++summary.missing; break;
      case FileStatus::Empty:   ++summary.empty; break;
    }
    summary.records.push_back(std::move(record));
  }

  if(report_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(report_path.parent_path(), ec);
    if(ec) {
      throw IoError("Unable to create report directory " + report_path.parent_path().string() +
                    ": " + ec.message());
    }
  }
  std::ofstream out(report_path, std::ios::trunc);
  if(!out) {
    throw IoError("Unable to write verification report " + report_path.string());
  }
  write_verify_report(out, summary.records);
  out.flush();
  if(!out) {
    throw IoError("Failed writing verification report " + report_path.string());
  }

  log_debug(logger, "Verified {} rows under {}: OK={} MISSING={} EMPTY={}",
            rows.size(), output_root.string(), summary.ok, summary.missing, summary.empty);
  return summary;
}
