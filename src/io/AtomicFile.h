// src/io/AtomicFile.h
//
// Durable, atomic file writes and bounded whole-file reads (POSIX).
//
// Guarantees:
//  - Data is written to a unique sibling temp file, fsync'ed, then published over
//    the destination with rename(2). Readers see either the old or the new file,
//    never a partial one.
//  - The containing directory is fsync'ed after the rename so the new name
//    survives a crash.
//  - On any failure the temp file is removed and the destination is untouched.
//
// Build: C++20, POSIX only.

#pragma once

#if defined(_WIN32)
#  error "ghostledger::io atomic file API is POSIX-only in this build."
#endif

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace ghostledger::io {

namespace fs = std::filesystem;

// Guardrail for files we expect to be small (runs, settings, index).
inline constexpr std::size_t kDefaultMaxReadBytes = 16u * 1024u * 1024u;

/// Atomically replace `target` with `bytes`.
///
/// Creates missing parent directories. A relative target without a parent is
/// resolved against the current working directory so the temp file and the
/// target always share a directory.
///
/// @return true on success; false on error (with `out_ec` populated if provided).
[[nodiscard]] bool AtomicWriteFile(const fs::path& target,
                                   std::string_view bytes,
                                   std::error_code* out_ec = nullptr) noexcept;

/// Read the whole file at `path` into `out`.
///
/// Fails with std::errc::no_such_file_or_directory for a missing file (callers
/// treat that as "first run") and std::errc::file_too_large past `max_bytes`.
[[nodiscard]] bool ReadFileToString(const fs::path& path,
                                    std::string& out,
                                    std::error_code* out_ec = nullptr,
                                    std::size_t max_bytes = kDefaultMaxReadBytes) noexcept;

/// Return the sibling temp-file prefix used by AtomicWriteFile for `target`
/// (".<filename>.tmp."). Leftovers with this prefix are safe to delete.
[[nodiscard]] std::string TempPrefixFor(const fs::path& target);

} // namespace ghostledger::io
