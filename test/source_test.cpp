#include <fstream>
#include <sstream>

#include <coderun/source.h>
#include <coderun/paths.h>

#include "utils.h"

namespace {

std::string ReadFile(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

} // namespace

TEST(JavaClassNameTest, FirstClass) {
  EXPECT_EQ(JavaClassName("class Hello { public static void main(String[] a){} }"), "Hello");
  EXPECT_EQ(JavaClassName("public class Main {}\nclass Other {}"), "Main");
  EXPECT_EQ(JavaClassName("final class $Weird_1 {}"), "$Weird_1");
  EXPECT_EQ(JavaClassName("class\n\tSpaced{}"), "Spaced");
}

TEST(JavaClassNameTest, Missing) {
  EXPECT_FALSE(JavaClassName("interface Runner {}").has_value());
  EXPECT_FALSE(JavaClassName("class 1Bad {}").has_value());
  EXPECT_FALSE(JavaClassName("classHello {}").has_value());
  EXPECT_FALSE(JavaClassName("").has_value());
}

TEST(SourceFileNameTest, PerLanguage) {
  EXPECT_EQ(SourceFileName(Language::PYTHON, "print(1)"), "Program.py");
  EXPECT_EQ(SourceFileName(Language::JAVASCRIPT, "console.log(1)"), "Program.js");
  EXPECT_EQ(SourceFileName(Language::C, "int main(){}"), "Program.c");
  EXPECT_EQ(SourceFileName(Language::CPP, "int main(){}"), "Program.cpp");
  EXPECT_EQ(SourceFileName(Language::CSHARP, "class P {}"), "Program.cs");
  EXPECT_EQ(SourceFileName(Language::JAVA, "class Hello {}"), "Hello.java");
  EXPECT_FALSE(SourceFileName(Language::JAVA, "enum E {}").has_value());
}

TEST(JoinInputTest, Newlines) {
  EXPECT_EQ(JoinInput({}), "");
  EXPECT_EQ(JoinInput({"1"}), "1");
  EXPECT_EQ(JoinInput({"1 2", "", "3"}), "1 2\n\n3");
}

class MaterializeTest : public WorkspaceRootTest {};

TEST_F(MaterializeTest, CodeAndInput) {
  Workspace workspace(logger, root);
  ASSERT_TRUE(workspace.Valid());
  std::string code = "a = input()\nprint(a)\n";
  auto files = MaterializeSource(workspace, "Program.py", code, {"x", "y"}, *logger);
  ASSERT_TRUE(files.has_value());
  EXPECT_EQ(files->source, workspace.Path() / "Program.py");
  EXPECT_EQ(ReadFile(files->source), code);
  ASSERT_TRUE(files->input.has_value());
  EXPECT_EQ(*files->input, WorkspaceInput(workspace.Path()));
  EXPECT_EQ(ReadFile(*files->input), "x\ny");
}

TEST_F(MaterializeTest, NoInputFileWithoutInput) {
  Workspace workspace(logger, root);
  auto files = MaterializeSource(workspace, "Program.c", "int main(){}", {}, *logger);
  ASSERT_TRUE(files.has_value());
  EXPECT_FALSE(files->input.has_value());
  EXPECT_FALSE(fs::exists(WorkspaceInput(workspace.Path())));
  EXPECT_EQ(CountEntries(workspace.Path()), 1u);
}

TEST_F(MaterializeTest, EmptyLineIsInput) {
  Workspace workspace(logger, root);
  auto files = MaterializeSource(workspace, "Program.c", "int main(){}", {""}, *logger);
  ASSERT_TRUE(files.has_value());
  ASSERT_TRUE(files->input.has_value());
  EXPECT_EQ(fs::file_size(*files->input), 0u);
}

TEST_F(MaterializeTest, InvalidWorkspace) {
  Workspace workspace(logger, root);
  workspace.Destroy();
  EXPECT_FALSE(MaterializeSource(workspace, "Program.c", "int main(){}", {}, *logger).has_value());
}
