#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "manifest.hpp"

// Completion is never tracked: it is recomputed from the output tree every
// time, so a restart after a crash resumes exactly like a restart after a
// clean exit.

enum class FileStatus { Ok, Missing, Empty };

const char* to_string(FileStatus status);

struct VerificationRecord {
  std::string id;
  std::string filename;
  std::filesystem::path expected_path;
  FileStatus status = FileStatus::Missing;
  uint64_t size_bytes = 0;
};

// The client stores every item as <output_root>/<id>/<filename>.
std::filesystem::path expected_path(const std::filesystem::path& output_root,
                                    const std::string& id,
                                    const std::string& filename);
std::filesystem::path expected_path(const std::filesystem::path& output_root,
                                    const ManifestRow& row);

std::size_t count_completed(const std::vector<ManifestRow>& rows,
                            const std::filesystem::path& output_root);

VerificationRecord classify(const ManifestRow& row,
                            const std::filesystem::path& output_root);
