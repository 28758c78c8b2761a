#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace mdclone::log {

void init(const std::string& app_name, const std::filesystem::path& log_dir);
void shutdown();

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

} // namespace mdclone::log
