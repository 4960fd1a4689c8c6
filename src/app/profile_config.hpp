#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "app/config_types.hpp"
#include "bindbench/core/expected.hpp"

namespace bindbench::app {

inline constexpr std::string_view kConfigFileName = "bindbench.conf";

// Reads the TOML subset used by profile files: `[table]` and `[table.sub]`
// headers, `key = value` lines with bare or quoted keys and values, and `#`
// comments. Tables and keys keep their file order.
class ProfileReader {
 public:
  using Entry = std::pair<std::string, std::string>;
  using TablePath = std::vector<std::string>;

  static Expected<ProfileReader> parse(std::string_view text);
  static Expected<ProfileReader> load(const std::filesystem::path& path);

  bool has_table(const TablePath& table) const noexcept;
  std::optional<std::string> get(const TablePath& table, std::string_view key) const;
  // nullptr when the table is absent.
  const std::vector<Entry>* entries(const TablePath& table) const noexcept;

 private:
  struct Table {
    TablePath path;
    std::vector<Entry> entries;
  };

  const Table* find_table(const TablePath& path) const noexcept;

  std::vector<Table> tables_;
};

Expected<RunnerFormat> parse_format(std::string_view name);

Expected<Profile> load_profile(const ProfileReader& reader, std::string_view name);

struct ConfigEnv {
  std::optional<std::string> xdg_config_home{};
  std::optional<std::string> home{};

  static ConfigEnv from_process();
};

// `explicit_path` alone when given, otherwise the XDG, home and system locations.
std::vector<std::filesystem::path> config_search_paths(
    const std::optional<std::filesystem::path>& explicit_path, const ConfigEnv& env);

// Parses the first file that opens; the error lists every path tried.
Expected<ProfileReader> load_first_config(const std::vector<std::filesystem::path>& paths);

}  // namespace bindbench::app
