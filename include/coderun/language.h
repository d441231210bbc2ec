#ifndef INCLUDE_CODERUN_LANGUAGE_H_
#define INCLUDE_CODERUN_LANGUAGE_H_

// name, request name, source extension
#define ENUM_LANGUAGE_ \
  X(JAVA, "java", ".java") \
  X(PYTHON, "python", ".py") \
  X(JAVASCRIPT, "javascript", ".js") \
  X(C, "c", ".c") \
  X(CPP, "cpp", ".cpp") \
  X(CSHARP, "csharp", ".cs")
enum class Language {
#define X(name, reqname, ext) name,
  ENUM_LANGUAGE_
#undef X
};

#endif  // INCLUDE_CODERUN_LANGUAGE_H_
