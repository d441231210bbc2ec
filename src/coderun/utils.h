#ifndef CODERUN_UTILS_H_
#define CODERUN_UTILS_H_

#include <string>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <coderun/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// close every descriptor >= minfd; async-signal-safe
int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, spdlog::logger&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&, spdlog::logger&);
// truncates existing files
bool WriteFile(const fs::path&, const std::string& content, spdlog::logger&);

#endif  // CODERUN_UTILS_H_
