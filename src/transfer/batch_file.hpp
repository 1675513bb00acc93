#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include "file_spec.hpp"
#include "transfer_error.hpp"

namespace fs = std::filesystem;

// Load a batch description:
//   files:
//     - lfn: a.root
//       scope: mc16_13TeV
//       turl: root://host//path/a.root
//       filesize: 1000000
//       checksum: {adler32: 001a2b3c}
// A bare top-level sequence is accepted too. Every entry needs an lfn.
Result<std::vector<FileSpec>> load_batch_file(const fs::path& path);
Result<std::vector<FileSpec>> parse_batch(const std::string& yaml_text);

// Stage-in batch from parallel comma-separated lists (turls may be empty).
Result<std::vector<FileSpec>> files_from_lists(const std::string& lfns,
                                               const std::string& scopes,
                                               const std::string& turls);

// Per-file outcome dictionary:
//   <lfn>: [status, status_code]
//   error: [diagnostic, code]
std::string format_summary(const std::vector<FileSpec>& files,
                           const std::optional<TypedError>& error);
Result<void> write_summary(const fs::path& path, const std::vector<FileSpec>& files,
                           const std::optional<TypedError>& error);
