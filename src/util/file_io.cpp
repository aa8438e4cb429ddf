#include "chaosmine/util/file_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace chaosmine {

namespace {

namespace fs = std::filesystem;

struct TempFileCleanup {
  fs::path path;
  bool active{true};
  explicit TempFileCleanup(fs::path p) : path(std::move(p)) {}
  ~TempFileCleanup() {
    if (!active) return;
    std::error_code ec;
    fs::remove(path, ec);
  }
  void release() { active = false; }
};

fs::path resolve_existing_read_path(const fs::path& requested) {
  std::error_code ec;
  if (requested.empty() || requested.is_absolute()) return requested;
  if (fs::exists(requested, ec) && !ec) return requested;

  std::vector<fs::path> roots;
#ifdef CHAOSMINE_SOURCE_DIR
  roots.emplace_back(CHAOSMINE_SOURCE_DIR);
#endif

  ec.clear();
  fs::path cur = fs::current_path(ec);
  if (!ec) {
    for (int depth = 0; depth < 8 && !cur.empty(); ++depth) {
      roots.push_back(cur);
      const auto parent = cur.parent_path();
      if (parent == cur) break;
      cur = parent;
    }
  }

  for (const auto& root : roots) {
    ec.clear();
    const auto candidate = root / requested;
    if (fs::exists(candidate, ec) && !ec) return candidate;
  }
  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path resolved = resolve_existing_read_path(fs::path(path));
  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) throw std::runtime_error("Failed to create directory: " + p.parent_path().string() + " (" + ec.message() + ")");
  }

  fs::path tmp = p;
  tmp += ".tmp";
  TempFileCleanup cleanup(tmp);
  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, p, ec);
  if (ec) {
    std::error_code rm_ec;
    fs::remove(p, rm_ec);
    ec.clear();
    fs::rename(tmp, p, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  cleanup.release();
}

} // namespace chaosmine
