#include "datacat/errors.hpp"
#include "datacat/hash.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("datacat_md5_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // RFC 1321 test vectors
    if (datacat::to_hex(datacat::md5("")) != "d41d8cd98f00b204e9800998ecf8427e") {
      std::cerr << "md5(\"\") mismatch\n";
      return 1;
    }
    if (datacat::to_hex(datacat::md5("abc")) != "900150983cd24fb0d6963f7d28e17f72") {
      std::cerr << "md5(\"abc\") mismatch\n";
      return 1;
    }

    // Incremental == one-shot
    {
      datacat::Md5 h;
      h.update("a");
      h.update("bc");
      if (h.finish() != datacat::md5("abc")) {
        std::cerr << "incremental digest differs from one-shot\n";
        return 1;
      }
    }

    // Chunk size never changes a file digest
    std::string big;
    for (int i = 0; i < 10000; ++i)
      big += "row " + std::to_string(i) + "\n";
    write_file(root / "big.txt", big);
    const auto whole = datacat::md5(big);
    for (std::size_t chunk : {std::size_t{1}, std::size_t{7}, std::size_t{4096}, std::size_t{1} << 20}) {
      if (datacat::md5_file(root / "big.txt", chunk) != whole) {
        std::cerr << "md5_file differs at chunk size " << chunk << "\n";
        return 1;
      }
    }

    // Missing file -> IoError
    bool threw = false;
    try {
      (void)datacat::md5_file(root / "absent.bin");
    } catch (const datacat::IoError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "md5_file on a missing file did not throw IoError\n";
      return 1;
    }

    std::cout << "md5 test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
