#include "heartbeat/commands.h"
#include "heartbeat/status.h"

#include <gtest/gtest.h>
#include <sstream>

namespace heartbeat {

class CommandRunnerTest : public ::testing::Test {
protected:
  CommandRunnerTest() : logger_(log_), runner_(logger_, false) {}

  void SetUp() override {
    ASSERT_TRUE(store_.add({"backup", "Backups were last run %s ago",
                            "Backups have never been run", 3600}).ok());
    ASSERT_TRUE(store_.add({"gym", "Gym %s ago", "Never been to the gym", 0}).ok());
    ASSERT_TRUE(store_.ping("backup", kNow - 3724).ok());
    store_.mark_clean();
  }

  Result<void> run(Command command, std::string_view code = {}, const std::string& input = "") {
    Config config;
    config.command = command;
    config.code = code;
    std::istringstream in(input);
    return runner_.run(config, store_, kNow, in, out_);
  }

  static constexpr EpochSeconds kNow = 1700000000;

  std::stringstream log_;
  Logger logger_;
  CommandRunner runner_;
  RecordStore store_;
  std::ostringstream out_;
};

TEST_F(CommandRunnerTest, MotdShowsHeadingAndEveryRecord) {
  ASSERT_TRUE(run(Command::Motd).ok());
  EXPECT_EQ(out_.str(),
            "Heartbeats\n"
            "==========\n"
            "\n"
            "* Backups were last run 1 hour, 2 minutes and 4 seconds ago\n"
            "* Never been to the gym\n");
  EXPECT_FALSE(store_.dirty());
}

TEST_F(CommandRunnerTest, MotdOnEmptyStorePrintsNothing) {
  store_ = RecordStore{};
  ASSERT_TRUE(run(Command::Motd).ok());
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(CommandRunnerTest, ListShowsCodes) {
  ASSERT_TRUE(run(Command::List).ok());
  EXPECT_EQ(out_.str(),
            "backup: Backups were last run 1 hour, 2 minutes and 4 seconds ago\n"
            "gym: Never been to the gym\n");
}

TEST_F(CommandRunnerTest, PingMarksDirty) {
  ASSERT_TRUE(run(Command::Ping, "gym").ok());
  EXPECT_TRUE(store_.dirty());
  EXPECT_EQ(store_.render("gym", kNow).value(), "Gym 0 seconds ago");
}

TEST_F(CommandRunnerTest, PingUnknownCode) {
  auto result = run(Command::Ping, "swim");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::NotFound);
  EXPECT_FALSE(store_.dirty());
}

TEST_F(CommandRunnerTest, RemoveKeepsOthers) {
  ASSERT_TRUE(run(Command::Remove, "backup").ok());
  EXPECT_TRUE(store_.dirty());
  EXPECT_EQ(store_.find("backup"), nullptr);
  EXPECT_NE(store_.find("gym"), nullptr);
}

TEST_F(CommandRunnerTest, RemoveUnknownCode) {
  auto result = run(Command::Remove, "swim");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(CommandRunnerTest, AddFromPrompts) {
  ASSERT_TRUE(run(Command::Add, {}, "swim\nSwam %s ago\nNever swam\n86400\n").ok());
  EXPECT_EQ(out_.str(), "Code: Last line: Never line: Leniency (seconds): ");

  const HeartbeatRecord* record = store_.find("swim");
  ASSERT_NE(record, nullptr);
  EXPECT_EQ(record->last_message_template, "Swam %s ago");
  EXPECT_EQ(record->never_message, "Never swam");
  EXPECT_EQ(record->leniency_seconds, 86400u);
  EXPECT_TRUE(store_.dirty());
}

TEST_F(CommandRunnerTest, AddDuplicateCode) {
  auto result = run(Command::Add, {}, "gym\nx %s\ny\n\n");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::DuplicateCode);
  EXPECT_EQ(store_.find("gym")->last_message_template, "Gym %s ago");
  EXPECT_FALSE(store_.dirty());
}

TEST_F(CommandRunnerTest, NoCommandIsAnError) {
  auto result = run(Command::Help);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
  EXPECT_TRUE(out_.str().empty());
}

TEST(PromptSpecTest, EmptyLeniencyIsZero) {
  std::istringstream in("swim\nSwam %s ago\nNever swam\n\n");
  std::ostringstream out;
  auto spec = CommandRunner::prompt_spec(in, out);
  ASSERT_TRUE(spec.ok());
  EXPECT_EQ(spec.value().leniency_seconds, 0u);
}

TEST(PromptSpecTest, BadLeniency) {
  std::istringstream in("swim\nSwam %s ago\nNever swam\nsoon\n");
  std::ostringstream out;
  auto spec = CommandRunner::prompt_spec(in, out);
  ASSERT_FALSE(spec.ok());
  EXPECT_EQ(spec.error().code, ErrorCode::MalformedRecord);
}

TEST(PromptSpecTest, NegativeLeniency) {
  std::istringstream in("swim\nSwam %s ago\nNever swam\n-5\n");
  std::ostringstream out;
  EXPECT_EQ(CommandRunner::prompt_spec(in, out).error().code, ErrorCode::MalformedRecord);
}

TEST(PromptSpecTest, TemplateWithoutPlaceholder) {
  std::istringstream in("swim\nSwam recently\nNever swam\n10\n");
  std::ostringstream out;
  EXPECT_EQ(CommandRunner::prompt_spec(in, out).error().code, ErrorCode::MalformedRecord);
}

TEST(PromptSpecTest, InputEndsEarly) {
  std::istringstream in("swim\n");
  std::ostringstream out;
  auto spec = CommandRunner::prompt_spec(in, out);
  ASSERT_FALSE(spec.ok());
  EXPECT_EQ(spec.error().code, ErrorCode::InvalidArgument);
}

TEST(StatusReporterTest, HighlightsOverdueAndNever) {
  RecordStore store;
  ASSERT_TRUE(store.add({"late", "late %s", "never late", 60}).ok());
  ASSERT_TRUE(store.add({"fresh", "fresh %s", "never fresh", 60}).ok());
  ASSERT_TRUE(store.add({"new", "new %s", "never new", 60}).ok());
  ASSERT_TRUE(store.ping("late", 1000).ok());
  ASSERT_TRUE(store.ping("fresh", 1090).ok());

  std::ostringstream out;
  StatusReporter(true).list(store, 1100, out);
  EXPECT_EQ(out.str(),
            "late: \033[31mlate 1 minute and 40 seconds\033[0m\n"
            "fresh: fresh 10 seconds\n"
            "new: \033[31mnever new\033[0m\n");
}

TEST(StatusReporterTest, NoEscapesWithoutColor) {
  RecordStore store;
  ASSERT_TRUE(store.add({"new", "new %s", "never new", 60}).ok());
  std::ostringstream out;
  StatusReporter(false).motd(store, 0, out);
  EXPECT_EQ(out.str().find('\033'), std::string::npos);
}

} // namespace heartbeat
