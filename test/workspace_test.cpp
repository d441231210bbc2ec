#include <thread>
#include <fstream>
#include <unordered_set>
#include <unistd.h>

#include <coderun/workspace.h>

#include "utils.h"

class WorkspaceTest : public WorkspaceRootTest {};

TEST_F(WorkspaceTest, CreateAndDestroy) {
  Workspace workspace(logger, root);
  ASSERT_TRUE(workspace.Valid());
  EXPECT_TRUE(fs::is_directory(workspace.Path()));
  EXPECT_EQ(workspace.Path().parent_path(), fs::absolute(root));
  EXPECT_EQ(workspace.Path().filename(), workspace.Token());
  std::ofstream(workspace.Path() / "file") << "data";
  fs::create_directories(workspace.Path() / "nested" / "dir");
  EXPECT_TRUE(workspace.Destroy());
  EXPECT_FALSE(fs::exists(workspace.Path()));
  EXPECT_FALSE(workspace.Valid());
}

TEST_F(WorkspaceTest, DestroyOnlyOnce) {
  Workspace workspace(logger, root);
  ASSERT_TRUE(workspace.Valid());
  ASSERT_TRUE(workspace.Destroy());
  // a directory reappearing under the same name is not touched again
  fs::create_directories(workspace.Path());
  EXPECT_TRUE(workspace.Destroy());
  EXPECT_TRUE(fs::exists(workspace.Path()));
  fs::remove_all(workspace.Path());
}

TEST_F(WorkspaceTest, FailedDestroyIsReported) {
  if (geteuid() == 0) GTEST_SKIP() << "directory permissions do not bind root";
  Workspace workspace(logger, root);
  ASSERT_TRUE(workspace.Valid());
  std::ofstream(workspace.Path() / "Program.py") << "print(1)";
  fs::permissions(root, fs::perms::owner_read | fs::perms::owner_exec);
  bool removed = true;
  EXPECT_NO_THROW(removed = workspace.Destroy());
  EXPECT_FALSE(removed);
  // a failed removal is not retried
  EXPECT_FALSE(workspace.Valid());
  EXPECT_TRUE(workspace.Destroy());
  fs::permissions(root, fs::perms::owner_all);
  EXPECT_TRUE(fs::exists(workspace.Path()));
  fs::remove_all(workspace.Path());
}

TEST_F(WorkspaceTest, DestructorRemoves) {
  fs::path path;
  {
    Workspace workspace(logger, root);
    path = workspace.Path();
    EXPECT_TRUE(fs::exists(path));
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST_F(WorkspaceTest, CreatesMissingRoot) {
  fs::path nested = root / "a" / "b";
  {
    Workspace workspace(logger, nested);
    EXPECT_TRUE(workspace.Valid());
  }
  EXPECT_EQ(CountEntries(nested), 0u);
  fs::remove_all(root / "a");
}

TEST_F(WorkspaceTest, UnusableRoot) {
  fs::path file = root / "not_a_dir";
  std::ofstream(file) << "x";
  {
    Workspace workspace(logger, file);
    EXPECT_FALSE(workspace.Valid());
    EXPECT_TRUE(workspace.Path().empty());
    EXPECT_TRUE(workspace.Destroy());
  }
  fs::remove(file);
}

TEST_F(WorkspaceTest, UniqueTokensAcrossThreads) {
  constexpr int kThreads = 8, kPerThread = 50;
  std::vector<std::vector<std::string>> tokens(kThreads);
  {
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; i++) {
      threads.emplace_back([&, i] {
        std::vector<std::unique_ptr<Workspace>> held;
        for (int j = 0; j < kPerThread; j++) {
          held.push_back(std::make_unique<Workspace>(logger, root));
          tokens[i].push_back(held.back()->Token());
        }
      });
    }
    for (auto& i : threads) i.join();
  }
  std::unordered_set<std::string> unique;
  for (auto& i : tokens) {
    for (auto& j : i) {
      EXPECT_FALSE(j.empty());
      unique.insert(j);
    }
  }
  EXPECT_EQ(unique.size(), (size_t)kThreads * kPerThread);
}
