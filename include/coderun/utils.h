#ifndef INCLUDE_CODERUN_UTILS_H_
#define INCLUDE_CODERUN_UTILS_H_

#include <string>
#include <optional>

#include "language.h"
#include "response.h"

const char* LanguageName(Language);
const char* CodeExtension(Language);
// case-insensitive
std::optional<Language> GetLanguage(const std::string&);

const char* VerdictName(Verdict);
int VerdictHttpStatus(Verdict);
int VerdictResponseCode(Verdict);
const char* VerdictMessage(Verdict);

// strips ASCII whitespace on both ends
std::string TrimWhitespace(const std::string&);
// number of code points of a UTF-8 string
size_t Utf8Length(const std::string&);

#endif  // INCLUDE_CODERUN_UTILS_H_
