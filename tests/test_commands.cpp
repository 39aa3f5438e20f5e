#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>

#include "acp/commands.hpp"

using namespace piacp;
using namespace piacp::acp;

namespace fs = std::filesystem;

class FileCommandsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    base_ = fs::temp_directory_path() / ("pi_acp_commands_" + std::to_string(::getpid()));
    fs::remove_all(base_);
    agent_dir_ = base_ / "agent";
    cwd_ = base_ / "project";
    fs::create_directories(agent_dir_ / "prompts");
    fs::create_directories(cwd_ / ".pi" / "prompts");
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(base_, ec);
  }

  void write(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
  }

  fs::path base_;
  fs::path agent_dir_;
  fs::path cwd_;
};

// --- BuiltinCommandsTest ---

TEST(BuiltinCommandsTest, SteeringAndName) {
  auto commands = builtin_commands();
  ASSERT_EQ(commands.size(), 2u);
  EXPECT_EQ(commands[0].name, "steering");
  EXPECT_FALSE(commands[0].to_json().contains("input"));
  EXPECT_EQ(commands[1].name, "name");
  EXPECT_EQ(commands[1].to_json()["input"]["hint"], "<name>");
}

// --- FileCommandsTest ---

TEST_F(FileCommandsTest, GlobalAndProjectTemplates) {
  write(agent_dir_ / "prompts" / "review.md", "---\ndescription: \"Review the diff\"\n---\nReview $ARGUMENTS\n");
  write(agent_dir_ / "prompts" / "explain.md", "# Explain some code\n\nExplain it.\n");
  write(cwd_ / ".pi" / "prompts" / "review.md", "Project review rules\n");
  write(cwd_ / ".pi" / "prompts" / "notes.txt", "not a template");

  auto commands = load_file_commands(agent_dir_, cwd_);
  ASSERT_EQ(commands.size(), 2u);

  EXPECT_EQ(commands[0].name, "explain");
  EXPECT_EQ(commands[0].description, "Explain some code");
  EXPECT_EQ(commands[0].input_hint, "arguments");

  // The project template replaces the global one
  EXPECT_EQ(commands[1].name, "review");
  EXPECT_EQ(commands[1].description, "Project review rules");
}

TEST_F(FileCommandsTest, FrontmatterDescription) {
  write(agent_dir_ / "prompts" / "fix.md", "---\nmodel: x\ndescription: Fix failing tests\n---\nBody\n");
  auto commands = load_file_commands(agent_dir_, cwd_);
  ASSERT_EQ(commands.size(), 1u);
  EXPECT_EQ(commands[0].description, "Fix failing tests");
}

TEST_F(FileCommandsTest, BuiltinNamesAreNotShadowed) {
  write(agent_dir_ / "prompts" / "name.md", "Rename\n");
  write(agent_dir_ / "prompts" / "steering.md", "Steer\n");
  EXPECT_TRUE(load_file_commands(agent_dir_, cwd_).empty());
}

TEST_F(FileCommandsTest, MissingDirectories) {
  EXPECT_TRUE(load_file_commands(base_ / "nowhere", base_ / "nothing").empty());
}

TEST_F(FileCommandsTest, ToJson) {
  write(agent_dir_ / "prompts" / "a.md", "Alpha\n");
  auto list = commands_to_json(load_file_commands(agent_dir_, cwd_));
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0]["name"], "a");
  EXPECT_EQ(list[0]["description"], "Alpha");
  EXPECT_EQ(list[0]["input"]["hint"], "arguments");
}

// --- SlashCommandTest ---

TEST(SlashCommandTest, Parse) {
  auto cmd = parse_slash_command(json::parse(R"([{"type":"text","text":"/name   My Session  "}])"));
  ASSERT_TRUE(cmd.has_value());
  EXPECT_EQ(cmd->name, "name");
  EXPECT_EQ(cmd->args, "My Session");

  auto bare = parse_slash_command(json::parse(R"([{"type":"text","text":"/steering"}])"));
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->name, "steering");
  EXPECT_TRUE(bare->args.empty());
}

TEST(SlashCommandTest, NotACommand) {
  EXPECT_FALSE(parse_slash_command(json::parse(R"([{"type":"text","text":"hello /name"}])")).has_value());
  EXPECT_FALSE(parse_slash_command(json::parse(R"([{"type":"text","text":"/"}])")).has_value());
  EXPECT_FALSE(parse_slash_command(json::parse(R"([{"type":"image","data":"x"}])")).has_value());
  EXPECT_FALSE(parse_slash_command(json::array()).has_value());
}
