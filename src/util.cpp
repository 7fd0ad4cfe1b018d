// String helpers and repository-name validation
#include "gitgate/util.hpp"

#include "gitgate/consts.hpp"

#include <regex>

namespace gitgate {

auto is_valid_repo_name(std::string_view name) -> bool {
  static const std::regex kName{"^[A-Za-z0-9_-]+(/[A-Za-z0-9_-]+)*$"};
  return std::regex_match(name.begin(), name.end(), kName);
}

auto strip_repo_suffix(std::string_view name) -> std::string {
  if (name.ends_with(consts::kRepoSuffix)) {
    name.remove_suffix(consts::kRepoSuffix.size());
  }
  return std::string(name);
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

static bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

auto trim(std::string_view sv) -> std::string {
  while (!sv.empty() && is_blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_blank(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

auto fields(std::string_view sv) -> std::vector<std::string> {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && (sv[i] == ' ' || sv[i] == '\t'))
      ++i;
    const std::size_t start = i;
    while (i < sv.size() && sv[i] != ' ' && sv[i] != '\t')
      ++i;
    if (i > start)
      out.emplace_back(sv.substr(start, i - start));
  }
  return out;
}

} // namespace strutil

} // namespace gitgate
