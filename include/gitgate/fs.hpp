#pragma once
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitgate::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

// Text conveniences over read_file / write_file_atomic.
std::string read_text(const std::filesystem::path& p);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

} // namespace gitgate::fs
