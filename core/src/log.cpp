#include "mdclone/log.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mdclone::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::string g_app_name = "mdclone";

std::tm local_now() {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

std::string timestamp_now() {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string timestamp_for_filename() {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return oss.str();
}

void log_line(const char* level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + timestamp_now() + "][" + level + "] " + std::string(msg);
  // ERROR lines go to stderr.
  if (level[0] == 'E') {
    std::cerr << line << "\n";
  } else {
    std::cout << line << "\n";
  }
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
}
} // namespace

void init(const std::string& app_name, const std::filesystem::path& log_dir) {
  g_app_name = app_name;
  if (!log_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    const std::string file_name = g_app_name + "_" + timestamp_for_filename() + ".log";
    g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
    if (!g_log_file.is_open()) {
      log_line("WARN", "log file unavailable in " + log_dir.string());
    }
  }
  log_line("INFO", "log init: " + g_app_name);
#ifdef MDCLONE_DEBUG
  log_line("INFO", "build: debug");
#else
  log_line("INFO", "build: release");
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown");
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void info(std::string_view msg) {
  log_line("INFO", msg);
}

void warn(std::string_view msg) {
  log_line("WARN", msg);
}

void error(std::string_view msg) {
  log_line("ERROR", msg);
}

} // namespace mdclone::log
