#include "fixtures.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace gambit::fixtures {
namespace {

std::vector<std::string> split(const std::string& line, char delimiter) {
  std::vector<std::string> parts;
  std::string current;
  std::stringstream stream(line);

  while (std::getline(stream, current, delimiter)) {
    parts.push_back(current);
  }

  return parts;
}

std::vector<std::string> read_records(const std::filesystem::path& file) {
  std::ifstream in(file);
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open fixture file: " + file.string());
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    lines.push_back(line);
  }

  if (lines.empty()) {
    throw std::runtime_error("Fixture file is empty: " + file.string());
  }

  return lines;
}

} // namespace

std::filesystem::path fixtures_root() {
#ifdef GAMBIT_FIXTURE_DIR
  return std::filesystem::path{GAMBIT_FIXTURE_DIR};
#else
  return std::filesystem::path{"tests/fixtures"};
#endif
}

std::filesystem::path perft_path() {
  return fixtures_root() / "perft.txt";
}

std::vector<PerftRecord> load_perft(const std::filesystem::path& file) {
  std::vector<PerftRecord> records;
  for (const auto& line : read_records(file)) {
    const auto parts = split(line, '|');
    if (parts.size() != 4) {
      throw std::runtime_error("Invalid perft record: " + line);
    }

    PerftRecord record;
    record.name = parts[0];
    record.fen = parts[1];
    record.depth = std::stoi(parts[2]);
    record.nodes = std::stoull(parts[3]);
    records.push_back(record);
  }

  return records;
}

TempDir::TempDir(const std::string& prefix) {
  static std::atomic<int> counter{0};
  path_ = std::filesystem::temp_directory_path() /
          (prefix + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
  std::filesystem::remove_all(path_);
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempDir::write_file(const std::string& name, const std::string& body) const {
  const auto file = path_ / name;
  std::ofstream out(file, std::ios::trunc);
  out << body;
  if (!out) {
    throw std::runtime_error("Failed to write fixture file: " + file.string());
  }
  return file;
}

std::filesystem::path TempDir::write_script(const std::string& name,
                                            const std::string& body) const {
  const auto file = write_file(name, body);
  std::filesystem::permissions(file,
                               std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec,
                               std::filesystem::perm_options::replace);
  return file;
}

} // namespace gambit::fixtures
