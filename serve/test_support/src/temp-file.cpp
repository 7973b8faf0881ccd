#include "serve/temp-file.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <ios>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

namespace serve::test {

namespace {

std::mt19937_64& ThreadRng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / std::format("{}{:016x}", prefix, dist(ThreadRng()));
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      _dir = std::filesystem::canonical(candidate);
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::exchange(other._dir, {})) {}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::exchange(other._dir, {});
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

std::filesystem::path ScopedTempDir::writeFile(std::string_view relPath, std::string_view content) const {
  const auto path = _dir / relPath;
  std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!ofs) {
    throw std::runtime_error(std::format("ScopedTempDir: unable to write {}", path.string()));
  }
  return path;
}

std::filesystem::path ScopedTempDir::createDir(std::string_view relPath) const {
  const auto path = _dir / relPath;
  std::filesystem::create_directories(path);
  return path;
}

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    _dir.clear();
  }
}

}  // namespace serve::test
