#include "manifest.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>

#include "errors.hpp"
#include "log.hpp"

namespace {

void strip_line_ending(std::string& line) {
  if(!line.empty() && line.back() == '\r') line.pop_back();
}

std::string describe_header(const std::vector<std::string>& fields) {
  std::ostringstream out;
  out << "[";
  for(std::size_t i = 0; i < fields.size() && i < 5; ++i) {
    if(i > 0) out << ", ";
    out << "'" << fields[i] << "'";
  }
  out << "]";
  return out.str();
}

// Each field becomes exactly one path component under the output root.
bool is_single_component(const std::string& field) {
  if(field.empty() || field == "." || field == "..") return false;
  return field.find_first_of(std::string("/\0", 2)) == std::string::npos;
}

} // namespace

std::vector<std::string> split_tabs(const std::string& line) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  for(;;) {
    auto pos = line.find('\t', start);
    if(pos == std::string::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

Manifest parse_manifest(std::istream& in,
                        const std::filesystem::path& source,
                        Logger* logger) {
  Manifest manifest;
  manifest.source = source;

  std::string line;
  if(!std::getline(in, line)) {
    throw ConfigError("Manifest " + source.string() + " is empty; expected header id<TAB>filename");
  }
  strip_line_ending(line);
  auto header = split_tabs(line);
  if(header.size() < 2 || header[0] != kManifestIdColumn || header[1] != kManifestFilenameColumn) {
    throw ConfigError("Manifest header must be: id<TAB>filename. Got: " + describe_header(header) +
                      " in " + source.string());
  }

  std::unordered_set<std::string> seen_ids;
  std::size_t line_number = 1;
  while(std::getline(in, line)) {
    ++line_number;
    strip_line_ending(line);
    if(line.empty()) continue;

    auto fields = split_tabs(line);
    if(fields.size() < 2) {
      log_warn(logger, "{}:{}: expected at least 2 tab-separated fields, skipping row",
               source.string(), line_number);
      ++manifest.skipped_rows;
      continue;
    }
    if(!is_single_component(fields[0]) || !is_single_component(fields[1])) {
      log_warn(logger, "{}:{}: empty or unsafe id or filename, skipping row", source.string(), line_number);
      ++manifest.skipped_rows;
      continue;
    }
    if(!seen_ids.insert(fields[0]).second) {
      log_warn(logger, "{}:{}: duplicate id '{}', keeping first occurrence",
               source.string(), line_number, fields[0]);
      ++manifest.duplicate_rows;
      continue;
    }
    manifest.rows.push_back(ManifestRow{std::move(fields[0]), std::move(fields[1])});
  }
  return manifest;
}

Manifest load_manifest(const std::filesystem::path& path, Logger* logger) {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) {
    throw ConfigError("Manifest not found: " + path.string());
  }
  std::ifstream in(path);
  if(!in) {
    throw ConfigError("Unable to read manifest " + path.string());
  }
  auto manifest = parse_manifest(in, path, logger);
  if(manifest.empty()) {
    throw ConfigError("Manifest " + path.string() + " has 0 rows. Nothing to download.");
  }
  if(manifest.skipped_rows > 0 || manifest.duplicate_rows > 0) {
    log_warn(logger, "Manifest {}: {} rows kept, {} malformed skipped, {} duplicates dropped",
             path.string(), manifest.size(), manifest.skipped_rows, manifest.duplicate_rows);
  }
  return manifest;
}
