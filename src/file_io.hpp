#pragma once
/*
 * FileIO
 *
 * Purpose: whole-file read via mmap (CRLF normalized to LF) and safe writes
 * (write .tmp -> fsync/fdatasync -> atomic rename).
 * Usage: functions return false and fill msg on failure.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>

bool read_file_text(const std::filesystem::path& path, std::string& out, std::string& msg);
bool read_file_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& msg);
bool write_file_text(const std::filesystem::path& path, std::string_view text, std::string& msg);
