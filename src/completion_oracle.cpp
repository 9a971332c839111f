#include "completion_oracle.hpp"

const char* to_string(FileStatus status) {
  switch(status) {
    case FileStatus::Ok:      return "OK";
    case FileStatus::Missing: return "MISSING";
    case FileStatus::Empty:   return "EMPTY";
  }
  return "MISSING";
}

std::filesystem::path expected_path(const std::filesystem::path& output_root,
                                    const std::string& id,
                                    const std::string& filename) {
  return output_root / id / filename;
}

std::filesystem::path expected_path(const std::filesystem::path& output_root,
                                    const ManifestRow& row) {
  return expected_path(output_root, row.id, row.filename);
}

std::size_t count_completed(const std::vector<ManifestRow>& rows,
                            const std::filesystem::path& output_root) {
  std::size_t done = 0;
  for(const auto& row : rows) {
    std::error_code ec;
    if(std::filesystem::exists(expected_path(output_root, row), ec) && !ec) {
      ++done;
    }
  }
  return done;
}

VerificationRecord classify(const ManifestRow& row,
                            const std::filesystem::path& output_root) {
  VerificationRecord record;
  record.id = row.id;
  record.filename = row.filename;
  record.expected_path = expected_path(output_root, row);

  std::error_code ec;
  auto status = std::filesystem::status(record.expected_path, ec);
  if(ec || !std::filesystem::is_regular_file(status)) {
    record.status = FileStatus::Missing;
    return record;
  }
  auto size = std::filesystem::file_size(record.expected_path, ec);
  if(ec) {
    record.status = FileStatus::Missing;
    return record;
  }
  record.size_bytes = static_cast<uint64_t>(size);
  record.status = size == 0 ? FileStatus::Empty : FileStatus::Ok;
  return record;
}
