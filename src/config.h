#ifndef CONFIG_H_
#define CONFIG_H_

#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

// Read the INI file into the tunables and num_workers. Fails if the file cannot
//  be read or a numeric setting is not positive; nothing is changed then.
bool ParseConfig(const fs::path& conf_path, int& num_workers, spdlog::logger&);

// value of $PORT; nullptr or empty leaves kPort as is
bool ParsePortEnv(const char* env);

#endif  // CONFIG_H_
