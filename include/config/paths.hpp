#pragma once

#include <filesystem>

namespace cfi::paths {

std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();

void setConfigPath(const std::filesystem::path& path);
void setLogPathForTesting();

}
