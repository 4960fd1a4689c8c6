#include "app/profile_config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace bindbench::app {
namespace {

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

void skip_ws(std::string_view sv, size_t& pos) {
  while (pos < sv.size() && std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
}

bool is_quote(char c) { return c == '"' || c == '\''; }

bool is_bare_table_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::string join_path(const ProfileReader::TablePath& path) {
  std::string out;
  for (const auto& part : path) {
    if (!out.empty()) out.push_back('.');
    out += part;
  }
  return out;
}

// sv[pos] is the opening quote; pos ends past the closing one. Only basic
// strings ("...") honour escapes.
Expected<std::string> parse_quoted(std::string_view sv, size_t& pos) {
  const char quote = sv[pos++];
  std::string out;
  while (pos < sv.size()) {
    const char c = sv[pos++];
    if (c == quote) {
      return out;
    }
    if (c == '\\' && quote == '"') {
      if (pos >= sv.size()) {
        break;
      }
      const char e = sv[pos++];
      switch (e) {
        case '"':
        case '\\':
          out.push_back(e);
          break;
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        default:
          return fail(ErrorCode::InvalidConfig, std::format("unsupported escape '\\{}'", e));
      }
      continue;
    }
    out.push_back(c);
  }
  return fail(ErrorCode::InvalidConfig, "unterminated string");
}

Expected<void> expect_line_end(std::string_view sv, size_t pos) {
  const auto rest = trim(sv.substr(pos));
  if (!rest.empty() && rest.front() != '#') {
    return fail(ErrorCode::InvalidConfig, std::format("unexpected text '{}'", rest));
  }
  return {};
}

Expected<ProfileReader::TablePath> parse_header(std::string_view line) {
  if (line.starts_with("[[")) {
    return fail(ErrorCode::InvalidConfig, "arrays of tables are not supported");
  }
  ProfileReader::TablePath path;
  size_t pos = 1;
  while (true) {
    skip_ws(line, pos);
    if (pos >= line.size()) {
      return fail(ErrorCode::InvalidConfig, "unterminated table header");
    }
    if (is_quote(line[pos])) {
      auto part = parse_quoted(line, pos);
      if (!part) {
        return std::unexpected(part.error());
      }
      path.push_back(std::move(*part));
    } else {
      const size_t start = pos;
      while (pos < line.size() && is_bare_table_char(line[pos])) ++pos;
      if (pos == start) {
        return fail(ErrorCode::InvalidConfig, "invalid table name");
      }
      path.emplace_back(line.substr(start, pos - start));
    }
    skip_ws(line, pos);
    if (pos >= line.size()) {
      return fail(ErrorCode::InvalidConfig, "unterminated table header");
    }
    if (line[pos] == ']') {
      ++pos;
      break;
    }
    if (line[pos] != '.') {
      return fail(ErrorCode::InvalidConfig, "invalid table name");
    }
    ++pos;
  }
  auto end = expect_line_end(line, pos);
  if (!end) {
    return std::unexpected(end.error());
  }
  return path;
}

// Keys are taken literally (no dotted keys) so bare addresses such as
// 10.0.0.1 or ::1 work without quoting.
Expected<ProfileReader::Entry> parse_entry(std::string_view line) {
  size_t pos = 0;
  std::string key;
  if (is_quote(line[pos])) {
    auto k = parse_quoted(line, pos);
    if (!k) {
      return std::unexpected(k.error());
    }
    key = std::move(*k);
  } else {
    while (pos < line.size() && line[pos] != '=' &&
           !std::isspace(static_cast<unsigned char>(line[pos]))) {
      ++pos;
    }
    key = std::string(line.substr(0, pos));
    if (key.empty()) {
      return fail(ErrorCode::InvalidConfig, "missing key");
    }
  }

  skip_ws(line, pos);
  if (pos >= line.size() || line[pos] != '=') {
    return fail(ErrorCode::InvalidConfig, std::format("expected '=' after key '{}'", key));
  }
  ++pos;
  skip_ws(line, pos);
  if (pos >= line.size()) {
    return fail(ErrorCode::InvalidConfig, std::format("missing value for '{}'", key));
  }

  std::string value;
  if (is_quote(line[pos])) {
    auto v = parse_quoted(line, pos);
    if (!v) {
      return std::unexpected(v.error());
    }
    auto end = expect_line_end(line, pos);
    if (!end) {
      return std::unexpected(end.error());
    }
    value = std::move(*v);
  } else if (line[pos] == '{' || line[pos] == '[') {
    return fail(ErrorCode::InvalidConfig,
                std::format("inline tables and arrays are not supported (key '{}')", key));
  } else {
    auto raw = line.substr(pos);
    const auto hash = raw.find('#');
    if (hash != std::string_view::npos) {
      raw = raw.substr(0, hash);
    }
    value = std::string(trim(raw));
    if (value.empty()) {
      return fail(ErrorCode::InvalidConfig, std::format("missing value for '{}'", key));
    }
  }
  return ProfileReader::Entry{std::move(key), std::move(value)};
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

Expected<ProfileReader> ProfileReader::parse(std::string_view text) {
  ProfileReader reader;
  reader.tables_.push_back(Table{});
  size_t current = 0;

  size_t line_no = 0;
  size_t start = 0;
  while (start <= text.size()) {
    const auto nl = text.find('\n', start);
    const auto raw = text.substr(start, nl == std::string_view::npos ? text.npos : nl - start);
    start = nl == std::string_view::npos ? text.size() + 1 : nl + 1;
    ++line_no;

    const auto line = trim(raw);
    if (line.empty() || line.front() == '#') {
      continue;
    }

    if (line.front() == '[') {
      auto path = parse_header(line);
      if (!path) {
        return fail(ErrorCode::InvalidConfig,
                    std::format("line {}: {}", line_no, path.error().message()));
      }
      if (reader.find_table(*path) != nullptr) {
        return fail(ErrorCode::InvalidConfig,
                    std::format("line {}: table [{}] defined twice", line_no, join_path(*path)));
      }
      reader.tables_.push_back(Table{std::move(*path), {}});
      current = reader.tables_.size() - 1;
      continue;
    }

    auto entry = parse_entry(line);
    if (!entry) {
      return fail(ErrorCode::InvalidConfig,
                  std::format("line {}: {}", line_no, entry.error().message()));
    }
    auto& table = reader.tables_[current];
    const bool dup = std::any_of(table.entries.begin(), table.entries.end(),
                                 [&](const Entry& e) { return e.first == entry->first; });
    if (dup) {
      return fail(ErrorCode::InvalidConfig,
                  std::format("line {}: duplicate key '{}' in [{}]", line_no, entry->first,
                              join_path(table.path)));
    }
    table.entries.push_back(std::move(*entry));
  }
  return reader;
}

Expected<ProfileReader> ProfileReader::load(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return fail(ErrorCode::IoError, std::format("{}: {}", path.string(), std::strerror(errno)));
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return fail(ErrorCode::IoError, std::format("{}: read failed", path.string()));
  }

  auto reader = parse(ss.str());
  if (!reader) {
    return fail(reader.error().code(),
                std::format("{}: {}", path.string(), reader.error().message()));
  }
  return reader;
}

const ProfileReader::Table* ProfileReader::find_table(const TablePath& path) const noexcept {
  for (const auto& t : tables_) {
    if (t.path == path) {
      return &t;
    }
  }
  return nullptr;
}

bool ProfileReader::has_table(const TablePath& table) const noexcept {
  return find_table(table) != nullptr;
}

std::optional<std::string> ProfileReader::get(const TablePath& table, std::string_view key) const {
  const auto* t = find_table(table);
  if (t == nullptr) {
    return std::nullopt;
  }
  for (const auto& [k, v] : t->entries) {
    if (k == key) {
      return v;
    }
  }
  return std::nullopt;
}

const std::vector<ProfileReader::Entry>* ProfileReader::entries(const TablePath& table) const noexcept {
  const auto* t = find_table(table);
  return t ? &t->entries : nullptr;
}

Expected<RunnerFormat> parse_format(std::string_view name) {
  const auto s = to_lower(name);
  if (s == "ip") {
    return RunnerFormat::LocalBind;
  }
  if (s == "docker") {
    return RunnerFormat::IsolatedNetwork;
  }
  return fail(ErrorCode::InvalidConfig,
              std::format("unknown format: {}. Supported formats: ip, docker", s));
}

Expected<Profile> load_profile(const ProfileReader& reader, std::string_view name) {
  const ProfileReader::TablePath table{std::string(name)};
  const ProfileReader::TablePath uses_table{std::string(name), "uses"};

  if (!reader.has_table(table) && !reader.has_table(uses_table)) {
    return fail(ErrorCode::InvalidConfig, std::format("profile '{}' not found in config file", name));
  }

  const auto format_text = reader.get(table, "format");
  if (!format_text) {
    return fail(ErrorCode::InvalidConfig, std::format("profile '{}' has no 'format' field", name));
  }
  auto format = parse_format(*format_text);
  if (!format) {
    return std::unexpected(format.error());
  }

  Profile p{};
  p.name = std::string(name);
  p.format = *format;
  p.image = reader.get(table, "image").value_or("");
  p.runtime_binary = reader.get(table, "docker").value_or("docker");
  if (p.runtime_binary.empty()) {
    return fail(ErrorCode::InvalidConfig, std::format("profile '{}' has an empty 'docker' field", name));
  }
  if (p.format == RunnerFormat::IsolatedNetwork && p.image.empty()) {
    return fail(ErrorCode::InvalidConfig,
                std::format("docker format requires 'image' field in profile '{}'", name));
  }

  const auto* uses = reader.entries(uses_table);
  if (uses == nullptr) {
    return fail(ErrorCode::InvalidConfig,
                std::format("profile '{}' has no [{}.uses] table", name, name));
  }
  if (uses->empty()) {
    return fail(ErrorCode::InvalidConfig, std::format("profile '{}' lists no bindings", name));
  }
  p.uses.reserve(uses->size());
  for (const auto& [identifier, label] : *uses) {
    p.uses.push_back(Binding{identifier, label});
  }
  return p;
}

ConfigEnv ConfigEnv::from_process() {
  ConfigEnv env{};
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
    env.xdg_config_home = xdg;
  }
  if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    env.home = home;
  }
  return env;
}

std::vector<std::filesystem::path> config_search_paths(
    const std::optional<std::filesystem::path>& explicit_path, const ConfigEnv& env) {
  if (explicit_path) {
    return {*explicit_path};
  }

  std::vector<std::filesystem::path> paths;
  if (env.xdg_config_home && std::filesystem::path(*env.xdg_config_home).is_absolute()) {
    paths.push_back(std::filesystem::path(*env.xdg_config_home) / kConfigFileName);
  } else if (env.home) {
    paths.push_back(std::filesystem::path(*env.home) / ".config" / kConfigFileName);
  }
  if (env.home) {
    paths.push_back(std::filesystem::path(*env.home) / ".bindbench.conf");
  }
  paths.emplace_back("/etc/bindbench.conf");
  return paths;
}

Expected<ProfileReader> load_first_config(const std::vector<std::filesystem::path>& paths) {
  std::string tried;
  for (const auto& path : paths) {
    auto reader = ProfileReader::load(path);
    if (reader) {
      return reader;
    }
    if (reader.error().code() != ErrorCode::IoError) {
      return std::unexpected(reader.error());
    }
    tried += std::format("\n  tried {}", reader.error().message());
  }
  return fail(ErrorCode::InvalidConfig, "cannot open config file" + tried);
}

}  // namespace bindbench::app
