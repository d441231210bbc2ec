#include "utils.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <unistd.h>

namespace {

const char kWhitespace[] = " \t\n\v\f\r";

} // namespace

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
int CloseFrom(int minfd) {
  // opendir is not usable between fork and exec
  long maxfd = sysconf(_SC_OPEN_MAX);
  if (maxfd < 0) maxfd = 65536;
  for (long fd = minfd; fd < maxfd; fd++) close(fd);
  return 0;
}
#endif // has_include(<linux/close_range.h>)

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CodeExtension, Language, ENUM_LANGUAGE_)
#undef X

static const char* kLanguageNameTable[] = {
#define X(name, reqname, ext) reqname,
  ENUM_LANGUAGE_
#undef X
};

std::optional<Language> GetLanguage(const std::string& str) {
  std::string lower = str;
  for (auto& c : lower) c = std::tolower(static_cast<unsigned char>(c));
  for (size_t i = 0; i < sizeof(kLanguageNameTable) / sizeof(kLanguageNameTable[0]); i++) {
    if (lower == kLanguageNameTable[i]) return (Language)i;
  }
  return std::nullopt;
}

#define X(...) X_RETURN_ARG1(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictName, Verdict, ENUM_VERDICT_)
#undef X

#define X(...) X_RETURN_ARG2(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(int VerdictHttpStatus, Verdict, ENUM_VERDICT_)
#undef X

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(int VerdictResponseCode, Verdict, ENUM_VERDICT_)
#undef X

#define X(...) X_RETURN_ARG4(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictMessage, Verdict, ENUM_VERDICT_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4

std::string TrimWhitespace(const std::string& str) {
  size_t begin = str.find_first_not_of(kWhitespace);
  if (begin == std::string::npos) return "";
  size_t end = str.find_last_not_of(kWhitespace);
  return str.substr(begin, end - begin + 1);
}

size_t Utf8Length(const std::string& str) {
  size_t ret = 0;
  for (unsigned char c : str) {
    if ((c & 0xc0) != 0x80) ret++;
  }
  return ret;
}

bool CreateDirs(const fs::path& path, spdlog::logger& logger, fs::perms perms) {
  logger.debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  logger.warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path, spdlog::logger& logger) {
  logger.debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  logger.warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, spdlog::logger& logger) {
  logger.debug("Write {} bytes to {}", content.size(), path.c_str());
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout) goto err;
  fout.write(content.data(), content.size());
  fout.close();
  if (!fout) goto err;
  return true;
err:
  logger.warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}
