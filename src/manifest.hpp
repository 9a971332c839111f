#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

class Logger;

struct ManifestRow {
  std::string id;
  std::string filename;
};

struct Manifest {
  std::filesystem::path source;
  std::vector<ManifestRow> rows;
  std::size_t skipped_rows = 0;   // fewer than two fields, or an id/filename that is not one path component
  std::size_t duplicate_rows = 0; // repeated id; the first occurrence is kept

  std::size_t size() const { return rows.size(); }
  bool empty() const { return rows.empty(); }
};

inline constexpr const char* kManifestIdColumn = "id";
inline constexpr const char* kManifestFilenameColumn = "filename";

// Parses a tab-separated manifest whose header starts with id<TAB>filename.
// Malformed data lines are dropped with a warning; a bad header throws ConfigError.
Manifest parse_manifest(std::istream& in,
                        const std::filesystem::path& source,
                        Logger* logger = nullptr);

// As parse_manifest, but also throws ConfigError when the file cannot be read or
// when no usable rows remain.
Manifest load_manifest(const std::filesystem::path& path, Logger* logger = nullptr);

std::vector<std::string> split_tabs(const std::string& line);
