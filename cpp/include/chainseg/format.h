// chainseg/cpp/include/chainseg/format.h
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace chainseg {

// "2026-10-19T08:15:00Z"
std::string utc_now_iso();

// mkdir -p, throws DurabilityError
void ensure_dirs(const std::filesystem::path& p);

// Full write(2) loop (EINTR, short writes). Throws DurabilityError naming `what`.
void write_all_fd(int fd, const char* data, size_t size, const std::string& what);

void fsync_fd(int fd, const std::string& what);

// fsync of the directory entry after create/rename
void fsync_dir(const std::filesystem::path& dir);

// tmp = fin + ".tmp"; write, fsync, rename over fin, fsync dir.
// Readers never observe a half-written fin.
void atomic_write_file(const std::filesystem::path& fin, std::string_view content);

// false if missing or unreadable
bool read_file_to_string(const std::filesystem::path& p, std::string& out);

} // namespace chainseg
