#include "datacat/config.hpp"
#include "datacat/errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("datacat_options_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // Missing file -> defaults
    const auto defaults = datacat::load_options(root / "absent.conf");
    if (defaults != datacat::Options{} ||
        defaults.default_format != datacat::TableFormat::Feather ||
        defaults.chunk_size != (std::size_t{1} << 20)) {
      std::cerr << "missing options file did not give defaults\n";
      return 1;
    }

    write_file(root / "datacat.conf", "# local settings\n"
                                      "\n"
                                      "default_format:  csv\n"
                                      "chunk_size: 4096\r\n"
                                      "log_level: debug\n");
    const auto opts = datacat::load_options(root / "datacat.conf");
    if (opts.default_format != datacat::TableFormat::Csv || opts.chunk_size != 4096 ||
        opts.log_level != "debug") {
      std::cerr << "options file parsed wrong\n";
      return 1;
    }

    datacat::save_options(root / "saved.conf", opts);
    if (datacat::load_options(root / "saved.conf") != opts) {
      std::cerr << "options did not round-trip\n";
      return 1;
    }

    datacat::configure_logging(opts);
    if (spdlog::get_level() != spdlog::level::debug) {
      std::cerr << "configure_logging did not set debug level\n";
      return 1;
    }
    datacat::configure_logging(datacat::Options{});

    for (const char *bad : {"default_format: parquet\n", "chunk_size: 0\n", "chunk_size: big\n",
                            "log_level: loud\n", "colour: blue\n", "no separator here\n"}) {
      write_file(root / "bad.conf", bad);
      bool threw = false;
      try {
        (void)datacat::load_options(root / "bad.conf");
      } catch (const datacat::ConfigError &) {
        threw = true;
      }
      if (!threw) {
        std::cerr << "expected ConfigError for: " << bad;
        return 1;
      }
    }

    std::cout << "options test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
