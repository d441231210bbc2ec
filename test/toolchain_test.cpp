#include <coderun/pipeline.h>
#include <coderun/utils.h>

#include "utils.h"

// Real compilers and interpreters; a case is skipped if its tools are not installed

namespace {

struct ToolParam {
  std::string name;
  std::vector<std::string> tools;
  std::string language;
  std::string code;
  std::vector<std::string> input;
  Verdict verdict;
  std::string output;
};

std::string ParamName(const ::testing::TestParamInfo<ToolParam>& info) {
  return info.param.name;
}

} // namespace

class ToolchainTest : public WorkspaceRootTest, public testing::WithParamInterface<ToolParam> {};
TEST_P(ToolchainTest, Run) {
  auto& param = GetParam();
  for (auto& tool : param.tools) {
    if (!HasProgram(tool)) GTEST_SKIP() << tool << " not installed";
  }
  Pipeline pipeline(logger, [this](const Command& cmd, const ExecutionLimits& limits) {
    return Execute(cmd, limits, *logger);
  }, root, ExecutionLimits(60'000, 1024));
  Response res = pipeline.Run(RequestBody(param.code, param.language, param.input));
  EXPECT_EQ(res.verdict, param.verdict) << res.output << '\n' << res.error_message;
  if (!param.output.empty()) EXPECT_EQ(res.output, param.output);
}
INSTANTIATE_TEST_SUITE_P(Languages, ToolchainTest,
    testing::Values(
      (ToolParam){"python", {"python3"}, "python", "print(1+1)", {}, Verdict::SUCCESS, "2"},
      (ToolParam){"python_input", {"python3"}, "python",
          "a = int(input())\nb = int(input())\nprint(a * b)", {"6", "7"}, Verdict::SUCCESS, "42"},
      (ToolParam){"python_runtime_error", {"python3"}, "python", "print(1/0)", {},
          Verdict::RUNTIME_ERROR, ""},
      (ToolParam){"javascript", {"node"}, "javascript", "console.log('hi')", {}, Verdict::SUCCESS, "hi"},
      (ToolParam){"c", {"gcc"}, "c",
          "#include <stdio.h>\nint main(){ int a, b; scanf(\"%d %d\", &a, &b); printf(\"%d\\n\", a + b); }",
          {"3 4"}, Verdict::SUCCESS, "7"},
      (ToolParam){"c_compile_error", {"gcc"}, "c", "int main(){ return x; }", {},
          Verdict::COMPILE_ERROR, ""},
      (ToolParam){"c_exit_status", {"gcc"}, "c", "int main(){ return 3; }", {},
          Verdict::RUNTIME_ERROR, ""},
      (ToolParam){"cpp", {"g++"}, "cpp",
          "#include <iostream>\nint main(){ std::string s; while (std::cin >> s) std::cout << s << ' '; }",
          {"a", "b", "c"}, Verdict::SUCCESS, "a b c"},
      (ToolParam){"java", {"javac", "java"}, "java",
          R"(class Hello { public static void main(String[] a){ System.out.println("hi"); } })", {},
          Verdict::SUCCESS, "hi"},
      (ToolParam){"csharp", {"mcs", "mono"}, "csharp",
          "class P { static void Main() { System.Console.WriteLine(\"hi\"); } }", {},
          Verdict::SUCCESS, "hi"}
    ),
    ParamName);

class ToolchainTimeoutTest : public WorkspaceRootTest {};
TEST_F(ToolchainTimeoutTest, InfiniteLoop) {
  if (!HasProgram("python3")) GTEST_SKIP() << "python3 not installed";
  Pipeline pipeline(logger, [this](const Command& cmd, const ExecutionLimits& limits) {
    return Execute(cmd, limits, *logger);
  }, root, ExecutionLimits(1'000, 1024));
  Response res = pipeline.Run(RequestBody("while True: pass", "python"));
  EXPECT_EQ(res.verdict, Verdict::TIMEOUT);
  EXPECT_EQ(res.output, "");
  EXPECT_EQ(res.error_message, "Execution timed out after 1 seconds.");
}
