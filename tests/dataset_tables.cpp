#include "datacat/dataset.hpp"
#include "datacat/errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  std::ofstream(p, std::ios::binary) << s;
}

static datacat::Table make_table(const std::string &name, std::int64_t seed) {
  datacat::Table t;
  t.meta.short_name = name;
  t.meta.title = "Table " + name;
  t.columns.push_back(
      {.name = "country", .data = std::vector<std::string>{"France", "Chile", "Kenya"}});
  t.columns.push_back({.name = "year", .data = std::vector<std::int64_t>{seed, seed + 1, seed + 2}});
  t.columns.push_back({.name = "value", .data = std::vector<double>{0.5, 1.25, -3.0}});
  return t;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("datacat_tables_" + std::to_string(std::random_device{}()));

  try {
    auto ds = datacat::Dataset::create_empty(root);

    // add/get/contains in each format
    const auto dog = make_table("dog", 2000);
    ds.add(dog); // feather by default
    if (!fs::exists(root / "dog.feather") || !fs::exists(root / "dog.meta.json")) {
      std::cerr << "feather add did not write data + sidecar\n";
      return 1;
    }
    if (!ds.contains("dog") || ds.get("dog") != dog) {
      std::cerr << "feather table did not read back equal\n";
      return 1;
    }

    const auto cow = make_table("cow", 1990);
    ds.add(cow, "csv");
    if (!fs::exists(root / "cow.csv") || !ds.contains("cow") || ds.get("cow") != cow) {
      std::cerr << "csv table did not read back equal\n";
      return 1;
    }

    // Absent names
    if (ds.contains("cat")) {
      std::cerr << "contains(\"cat\") on an empty name\n";
      return 1;
    }
    bool threw = false;
    try {
      (void)ds.get("cat");
    } catch (const datacat::NotFoundError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "get of a missing table did not throw NotFoundError\n";
      return 1;
    }

    // Names that are not a single path component never leave the directory
    fs::create_directories(root / "sub");
    write_file(root / "sub" / "hidden.csv", "a\n1\n");
    fs::create_directories(root / "ghost.feather");
    for (const char *name : {"sub/hidden", "../sub/hidden", "ghost", ""}) {
      threw = false;
      try {
        (void)ds.get(name);
      } catch (const datacat::NotFoundError &) {
        threw = true;
      }
      if (ds.contains(name) || !threw) {
        std::cerr << "name '" << name << "' should not resolve to a table\n";
        return 1;
      }
    }
    fs::remove_all(root / "sub");
    fs::remove_all(root / "ghost.feather");

    // Unsupported format: nothing written
    threw = false;
    try {
      ds.add(make_table("pig", 1), "parquet");
    } catch (const datacat::ValidationError &) {
      threw = true;
    }
    if (!threw || ds.contains("pig") || fs::exists(root / "pig.parquet")) {
      std::cerr << "unsupported format should throw ValidationError and write nothing\n";
      return 1;
    }

    // Names must be snake_case
    threw = false;
    try {
      ds.add(make_table("Bad Name", 1));
    } catch (const datacat::ValidationError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "invalid table name accepted\n";
      return 1;
    }

    // Feather shadows csv for the same name
    const auto cat_csv = make_table("cat", 1800);
    const auto cat_feather = make_table("cat", 1900);
    ds.add(cat_csv, datacat::TableFormat::Csv);
    ds.add(cat_feather, datacat::TableFormat::Feather);
    if (ds.get("cat") != cat_feather) {
      std::cerr << "feather copy should win over csv\n";
      return 1;
    }
    fs::remove(root / "cat.feather");
    if (!ds.contains("cat") || ds.get("cat") != cat_csv) {
      std::cerr << "removing feather should expose the csv copy\n";
      return 1;
    }
    // Sidecar is shared and reflects the last write
    ds.add(cat_csv, datacat::TableFormat::Csv);

    // Options pick the default format
    datacat::Options opts;
    opts.default_format = datacat::TableFormat::Csv;
    const datacat::Dataset csv_first{root, opts};
    csv_first.add(make_table("emu", 1));
    if (!fs::exists(root / "emu.csv") || fs::exists(root / "emu.feather")) {
      std::cerr << "options default_format ignored\n";
      return 1;
    }

    // Enumeration: sorted by filename, index and sidecars excluded
    const std::vector<std::string> expected{"cat.csv", "cow.csv", "dog.feather", "emu.csv"};
    std::vector<std::string> names;
    for (const auto &p : ds.data_files())
      names.push_back(p.filename().string());
    if (names != expected || ds.size() != expected.size()) {
      std::cerr << "data_files() not the sorted table files\n";
      return 1;
    }

    std::vector<std::string> iterated;
    for (const auto &t : ds)
      iterated.push_back(*t.meta.short_name);
    if (iterated != std::vector<std::string>{"cat", "cow", "dog", "emu"}) {
      std::cerr << "iteration order wrong\n";
      return 1;
    }

    // Restartable
    std::size_t count = 0;
    for (auto it = ds.begin(); it != ds.end(); ++it)
      ++count;
    if (count != expected.size()) {
      std::cerr << "second pass saw " << count << " tables\n";
      return 1;
    }

    // Lazy: size() does not decode, and a bad file only fails when reached
    write_file(root / "zzz.feather", "not arrow");
    if (ds.size() != expected.size() + 1) {
      std::cerr << "size() should count files without decoding\n";
      return 1;
    }
    auto it = ds.begin();
    for (std::size_t i = 0; i < expected.size(); ++i, ++it)
      (void)*it;
    if (it.file().filename() != "zzz.feather") {
      std::cerr << "iterator not at the corrupt file\n";
      return 1;
    }
    threw = false;
    try {
      (void)*it;
    } catch (const datacat::Error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "decoding a corrupt feather file did not throw\n";
      return 1;
    }
    if (++it != ds.end()) {
      std::cerr << "iterator did not reach end\n";
      return 1;
    }

    std::cout << "dataset tables test OK: " << root << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
