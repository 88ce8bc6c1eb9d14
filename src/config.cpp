#include "datacat/config.hpp"

#include "datacat/errors.hpp"
#include "datacat/fs.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

spdlog::level::level_enum parse_level(const std::string &name) {
  const auto lvl = spdlog::level::from_str(name);
  // from_str maps anything it does not know to "off"
  if (lvl == spdlog::level::off && name != "off")
    throw datacat::ConfigError("unknown log_level: '" + name + "'");
  return lvl;
}

} // namespace

namespace datacat {

auto load_options(const std::filesystem::path &path) -> Options {
  Options out{};
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_text(path));

  constexpr std::string_view k_format = "default_format";
  constexpr std::string_view k_chunk = "chunk_size";
  constexpr std::string_view k_level = "log_level";

  std::string line;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const std::string stripped = trim(line);
    if (stripped.empty() || stripped[0] == '#')
      continue; // allow comments

    const auto colon = stripped.find(':');
    if (colon == std::string::npos) {
      throw ConfigError(path.string() + ":" + std::to_string(lineno) + ": expected 'key: value'");
    }
    const std::string key = trim(std::string_view(stripped).substr(0, colon));
    const std::string value = trim(std::string_view(stripped).substr(colon + 1));

    if (key == k_format) {
      try {
        out.default_format = parse_format(value);
      } catch (const ValidationError &e) {
        throw ConfigError(path.string() + ":" + std::to_string(lineno) + ": " + e.what());
      }
    } else if (key == k_chunk) {
      std::size_t n = 0;
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
      if (ec != std::errc{} || ptr != value.data() + value.size() || n == 0) {
        throw ConfigError(path.string() + ":" + std::to_string(lineno) +
                          ": chunk_size must be a positive integer");
      }
      out.chunk_size = n;
    } else if (key == k_level) {
      parse_level(value);
      out.log_level = value;
    } else {
      throw ConfigError(path.string() + ":" + std::to_string(lineno) + ": unknown key '" + key +
                        "'");
    }
  }
  return out;
}

void save_options(const std::filesystem::path &path, const Options &opts) {
  std::ostringstream os;
  os << "default_format: " << format_name(opts.default_format) << '\n'
     << "chunk_size: " << opts.chunk_size << '\n'
     << "log_level: " << opts.log_level << '\n';
  fs::write_text_atomic(path, os.str());
}

void configure_logging(const Options &opts) { spdlog::set_level(parse_level(opts.log_level)); }

} // namespace datacat
