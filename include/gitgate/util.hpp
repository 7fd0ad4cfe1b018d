#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitgate {

// Does `name` match "[A-Za-z0-9_-]+(/[A-Za-z0-9_-]+)*"?
auto is_valid_repo_name(std::string_view name) -> bool;

// Drop one trailing ".git" if present.
auto strip_repo_suffix(std::string_view name) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Trim spaces, tabs, CR and LF on both ends
  auto trim(std::string_view sv) -> std::string;

  // Split on runs of spaces/tabs, dropping empty fields
  auto fields(std::string_view sv) -> std::vector<std::string>;
}

}
