#include "datacat/dataset.hpp"
#include "datacat/errors.hpp"
#include "datacat/hash.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  std::ofstream(p, std::ios::binary | std::ios::trunc) << s;
}

static datacat::Table make_table(const std::string &name, std::int64_t n) {
  datacat::Table t;
  t.meta.short_name = name;
  t.columns.push_back({.name = "n", .data = std::vector<std::int64_t>{n, n * 2}});
  return t;
}

int main() {
  const fs::path base =
      fs::temp_directory_path() / ("datacat_checksum_" + std::to_string(std::random_device{}()));
  fs::create_directories(base);

  try {
    // 1) MD5(MD5(A) ++ MD5(B) ++ MD5(C)) with literal file contents
    {
      const auto ds = datacat::Dataset::create_empty(base / "abc");
      write_file(base / "abc" / "index.json", "A");
      write_file(base / "abc" / "dog.feather", "B");
      write_file(base / "abc" / "dog.meta.json", "C");
      const std::string sum = ds.checksum();
      if (sum != "ee356748d80c7a5b1aff07c60a1ad5a9") {
        std::cerr << "literal checksum mismatch: " << sum << "\n";
        return 1;
      }
    }

    // 2) Two tables, both formats: files fold in sorted filename order
    {
      const auto ds = datacat::Dataset::create_empty(base / "two");
      write_file(base / "two" / "index.json", "index");
      write_file(base / "two" / "dog.feather", "feather");
      write_file(base / "two" / "dog.meta.json", "dogmeta");
      write_file(base / "two" / "cat.csv", "csv");
      write_file(base / "two" / "cat.meta.json", "catmeta");
      write_file(base / "two" / "notes.txt", "ignored");
      const std::string sum = ds.checksum();
      if (sum != "39c7315844f34556007295e190dd0215") {
        std::cerr << "two-table checksum mismatch: " << sum << "\n";
        return 1;
      }

      // Chunk size does not change the digest
      datacat::Options small;
      small.chunk_size = 3;
      if (datacat::Dataset{base / "two", small}.checksum() != sum) {
        std::cerr << "chunk size changed the checksum\n";
        return 1;
      }
    }

    // 3) Empty dataset: digest of the index digest only
    {
      const auto ds = datacat::Dataset::create_empty(base / "empty");
      datacat::Md5 h;
      h.update(datacat::md5_file(base / "empty" / "index.json"));
      if (ds.checksum() != datacat::to_hex(h.finish())) {
        std::cerr << "empty dataset checksum mismatch\n";
        return 1;
      }
      if (ds.checksum().size() != 32) {
        std::cerr << "checksum is not 32 hex chars\n";
        return 1;
      }
    }

    // 4) Insertion order does not matter
    const auto first = datacat::Dataset::create_empty(base / "first");
    first.add(make_table("apple", 1), "csv");
    first.add(make_table("banana", 2), "csv");
    first.add(make_table("cherry", 3), "csv");

    const auto second = datacat::Dataset::create_empty(base / "second");
    second.add(make_table("cherry", 3), "csv");
    second.add(make_table("apple", 1), "csv");
    second.add(make_table("banana", 2), "csv");

    const std::string expected = first.checksum();
    if (second.checksum() != expected) {
      std::cerr << "checksum depends on insertion order\n";
      return 1;
    }
    if (first.checksum() != expected) {
      std::cerr << "checksum not stable across calls\n";
      return 1;
    }

    // 5) Any single-byte change is visible
    for (const char *name : {"index.json", "banana.csv", "cherry.meta.json"}) {
      const fs::path p = base / "second" / name;
      std::string bytes;
      {
        std::ifstream ifs(p, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
      }
      std::string changed = bytes;
      changed[0] = static_cast<char>(changed[0] ^ 0x01);
      write_file(p, changed);
      if (second.checksum() == expected) {
        std::cerr << "byte change in " << name << " not reflected in checksum\n";
        return 1;
      }
      write_file(p, bytes);
    }
    if (second.checksum() != expected) {
      std::cerr << "restoring files did not restore the checksum\n";
      return 1;
    }

    // 6) A table without its sidecar fails the whole checksum
    fs::remove(base / "second" / "banana.meta.json");
    bool threw = false;
    try {
      (void)second.checksum();
    } catch (const datacat::IoError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "missing sidecar did not throw IoError\n";
      return 1;
    }

    std::cout << "dataset checksum test OK: " << base << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(base);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(base, ec);
  return 0;
}
