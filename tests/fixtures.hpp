#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gambit::fixtures {

struct PerftRecord {
  std::string name;
  std::string fen;
  int depth{};
  std::uint64_t nodes{};
};

std::filesystem::path fixtures_root();
std::filesystem::path perft_path();

std::vector<PerftRecord> load_perft(const std::filesystem::path& file);

// Fresh, empty directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& prefix);
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  // Writes `body` to `name` inside the directory and returns its path.
  std::filesystem::path write_file(const std::string& name, const std::string& body) const;

  // As write_file, and marks the file executable.
  std::filesystem::path write_script(const std::string& name, const std::string& body) const;

private:
  std::filesystem::path path_;
};

} // namespace gambit::fixtures
