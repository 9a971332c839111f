#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "completion_oracle.hpp"
#include "manifest.hpp"

class Logger;

struct VerifySummary {
  std::size_t ok = 0;
  std::size_t missing = 0;
  std::size_t empty = 0;
  std::filesystem::path report_path;
  std::vector<VerificationRecord> records; // manifest order

  bool clean() const { return missing == 0 && empty == 0; }
  std::size_t total() const { return ok + missing + empty; }
};

inline constexpr const char* kVerifyReportHeader = "id,filename,expected_path,status,size_bytes";

// Classifies every row against output_root and (over)writes report_path. Never
// touches the output tree. Throws IoError when the report cannot be written.
VerifySummary verify(const std::vector<ManifestRow>& rows,
                     const std::filesystem::path& output_root,
                     const std::filesystem::path& report_path,
                     Logger* logger = nullptr);

void write_verify_report(std::ostream& out, const std::vector<VerificationRecord>& records);

std::string csv_escape(const std::string& field);
