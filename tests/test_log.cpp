#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "chaosmine/util/log.h"

#define CM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_log() {
  using namespace chaosmine;

  const log::Level prev = log::level();
  std::vector<std::pair<log::Level, std::string>> seen;
  log::set_sink([&](log::Level l, const std::string& msg) { seen.emplace_back(l, msg); });

  log::set_level(log::Level::Warn);
  log::debug("d");
  log::info("i");
  log::warn("w");
  log::error("e");
  CM_ASSERT(seen.size() == 2);
  CM_ASSERT(seen[0].first == log::Level::Warn && seen[0].second == "w");
  CM_ASSERT(seen[1].first == log::Level::Error && seen[1].second == "e");

  log::set_level(log::Level::Off);
  log::error("dropped");
  CM_ASSERT(seen.size() == 2);

  log::set_level(log::Level::Debug);
  log::debug("now visible");
  CM_ASSERT(seen.size() == 3);

  CM_ASSERT(std::string(log::level_label(log::Level::Warn)) == "WARN");

  // A sink that logs again does not block; the inner message is still filtered.
  {
    std::vector<std::string> lines;
    bool forwarding = false;
    log::set_sink([&](log::Level l, const std::string& msg) {
      lines.push_back(std::string(log::level_label(l)) + " " + msg);
      if (forwarding) return;
      forwarding = true;
      log::info("forwarded " + msg);
      log::debug("hidden " + msg);
      forwarding = false;
    });
    log::set_level(log::Level::Info);
    log::warn("disk low");
    CM_ASSERT(lines.size() == 2);
    CM_ASSERT(lines[0] == "WARN disk low");
    CM_ASSERT(lines[1] == "INFO forwarded disk low");

    // The sink may also swap itself out.
    log::set_sink([&](log::Level, const std::string& msg) {
      lines.push_back("first " + msg);
      log::set_sink([&](log::Level, const std::string& m) { lines.push_back("second " + m); });
    });
    log::info("a");
    log::info("b");
    CM_ASSERT(lines.size() == 4);
    CM_ASSERT(lines[2] == "first a");
    CM_ASSERT(lines[3] == "second b");
  }

  log::set_sink({});
  log::set_level(prev);
  return 0;
}
