#include "app/runner.hpp"
#include "test_util.hpp"
#include <fstream>
#include <gtest/gtest.h>

using testutil::At;

namespace {

app::Options OptionsFor(const std::string &file, std::string command,
                        std::vector<std::string> args = {}) {
  app::Options opt;
  opt.data_file = file;
  opt.command = std::move(command);
  opt.args = std::move(args);
  return opt;
}

} // namespace

TEST(Runner, StartStopExitCodes) {
  testutil::TempDir dir;
  const auto file = dir.File("s.json");
  EXPECT_EQ(app::Run(OptionsFor(file, "start", {"write", "tests"})),
            app::kExitOk);
  EXPECT_EQ(app::Run(OptionsFor(file, "start")), app::kExitState);
  EXPECT_EQ(app::Run(OptionsFor(file, "stop")), app::kExitOk);
  EXPECT_EQ(app::Run(OptionsFor(file, "stop")), app::kExitState);

  store::SessionStore st(file);
  auto sessions = st.Load();
  ASSERT_TRUE(sessions.has_value());
  ASSERT_EQ(sessions->size(), 1u);
  EXPECT_EQ((*sessions)[0].note, "write tests");
  EXPECT_FALSE((*sessions)[0].IsRunning());
}

TEST(Runner, ToggleAndDelete) {
  testutil::TempDir dir;
  const auto file = dir.File("s.json");
  EXPECT_EQ(app::Run(OptionsFor(file, "toggle", {"a"})), app::kExitOk);
  EXPECT_EQ(app::Run(OptionsFor(file, "toggle")), app::kExitOk);
  EXPECT_EQ(app::Run(OptionsFor(file, "toggle", {"b"})), app::kExitOk);

  EXPECT_EQ(app::Run(OptionsFor(file, "delete", {"#1"})), app::kExitOk);
  EXPECT_EQ(app::Run(OptionsFor(file, "delete", {"abc"})), app::kExitUsage);
  EXPECT_EQ(app::Run(OptionsFor(file, "delete")), app::kExitUsage);

  store::SessionStore st(file);
  auto sessions = st.Load();
  ASSERT_TRUE(sessions.has_value());
  ASSERT_EQ(sessions->size(), 1u);
  EXPECT_EQ((*sessions)[0].note, "b");
  EXPECT_TRUE((*sessions)[0].IsRunning());
}

TEST(Runner, CorruptPolicy) {
  testutil::TempDir dir;
  const auto file = dir.File("s.json");
  {
    std::ofstream out(file);
    out << "][";
  }
  EXPECT_EQ(app::Run(OptionsFor(file, "status")), app::kExitStorage);

  auto opt = OptionsFor(file, "status");
  opt.on_corrupt = app::CorruptPolicy::archive;
  EXPECT_EQ(app::Run(opt), app::kExitOk);

  store::SessionStore st(file);
  auto sessions = st.Load();
  ASSERT_TRUE(sessions.has_value());
  EXPECT_TRUE(sessions->empty());
}

TEST(Runner, UnknownCommand) {
  testutil::TempDir dir;
  EXPECT_EQ(app::Run(OptionsFor(dir.File("s.json"), "launch")),
            app::kExitUsage);
}

TEST(Runner, StatusLineShowsRunningSessionAndTotals) {
  std::vector<tracker::Session> sessions(2);
  sessions[0].id = 1;
  sessions[0].start = At("2024-01-01T23:30:00-05:00");
  sessions[0].end = At("2024-01-02T00:30:00-05:00");
  sessions[1].id = 2;
  sessions[1].start = At("2024-01-02T11:00:00-05:00");
  sessions[1].note = "focus";
  const auto line =
      app::StatusLine(sessions, At("2024-01-02T12:00:00-05:00"));
  EXPECT_EQ(line, "Running #2 (1:00:00) focus | Today 1:30:00 | All-time "
                  "2:00:00");
}

TEST(Runner, ApplyCommandSerializesThroughStore) {
  testutil::TempDir dir;
  store::SessionStore st(dir.File("s.json"));
  ASSERT_TRUE(st.Load());

  using control::Command;
  using control::CommandKind;
  EXPECT_TRUE(app::ApplyCommand(
      st, Command{.kind = CommandKind::toggle, .note = "from tray"}));
  EXPECT_TRUE(st.IsRunning());
  EXPECT_TRUE(app::ApplyCommand(st, Command{.kind = CommandKind::start}));
  EXPECT_EQ(st.List().size(), 1u);
  EXPECT_TRUE(app::ApplyCommand(st, Command{.kind = CommandKind::toggle}));
  EXPECT_FALSE(st.IsRunning());
  EXPECT_TRUE(app::ApplyCommand(st, Command{.kind = CommandKind::refresh}));
  EXPECT_FALSE(app::ApplyCommand(st, Command{.kind = CommandKind::quit}));
  EXPECT_EQ(st.List()[0].note, "from tray");
}
