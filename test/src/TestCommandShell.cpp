#include <atomic>
#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "CommandShell.hpp"
#include "ScriptedServer.hpp"

using json = nlohmann::json;
using testing::ElementsAre;
using testing::HasSubstr;

class CommandShellTest : public testing::Test {
 protected:
  std::string run(const std::string& line) {
    out.str("");
    lastResult = shell.execute(line);
    return out.str();
  }

  void connectAndStart() {
    server.playScripts.push_back({{serverMsg({{"msg", "ui-state"}, {"type", "newgame-choice"}})}});
    server.onKey("b", {serverMsg({{"msg", "ui-state"}, {"type", "newgame-choice"}})});
    server.onKey("f", {serverMsg({{"msg", "ui-state"}, {"type", "newgame-choice"}})});
    server.onKey("b", {playerUpdate(json::parse(R"({"hp":9,"hp_max":9,"place":"Dungeon","depth":1})")),
                       mapUpdate(json::parse(R"([{"x":0,"y":0,"g":"@"}])")), inputMode(1)});
    run("connect");
    run("start_game");
  }

  ScriptedServer server;
  GameClient client{server.factory(), fastDispatch(), fastTiming()};
  std::ostringstream out;
  CommandShell shell{client, ClientConfig{}, out};
  bool lastResult = true;
};

TEST_F(CommandShellTest, testSplitWords) {
  EXPECT_THAT(splitWords("  move   n \t"), ElementsAre("move", "n"));
  EXPECT_TRUE(splitWords("   ").empty());
}

TEST_F(CommandShellTest, testBlankAndCommentLines) {
  EXPECT_EQ("", run(""));
  EXPECT_EQ("", run("# a comment"));
  EXPECT_TRUE(lastResult);
}

TEST_F(CommandShellTest, testQuit) {
  run("quit");
  EXPECT_FALSE(lastResult);
  run("exit");
  EXPECT_FALSE(lastResult);
}

TEST_F(CommandShellTest, testHelpListsCommands) {
  const std::string help = run("help");
  EXPECT_THAT(help, HasSubstr("  move DIR\n"));
  EXPECT_THAT(help, HasSubstr("  select_menu_item KEY\n"));
  EXPECT_THAT(help, HasSubstr("  auto_play [MAX_ACTIONS]\n"));
}

TEST_F(CommandShellTest, testUnknownCommand) {
  EXPECT_EQ("Unknown command 'fly'. Type 'help' for the list.\n", run("fly away"));
}

TEST_F(CommandShellTest, testMissingArguments) {
  EXPECT_EQ("Usage: throw SLOT DIR\n", run("throw a"));
}

TEST_F(CommandShellTest, testTransportErrorIsReported) {
  EXPECT_EQ("Transport error: Not connected to server. Reconnect with 'connect'.\n", run("move n"));
  EXPECT_TRUE(lastResult);
}

TEST_F(CommandShellTest, testSessionErrorIsReported) {
  server.acceptRegister = false;
  server.acceptLogin = false;
  EXPECT_EQ("Session error: Login failed\n", run("connect"));
}

TEST_F(CommandShellTest, testConnectUsesConfigDefaults) {
  EXPECT_THAT(run("connect"), HasSubstr("Connected. Status: In lobby"));
  EXPECT_THAT(server.state->urls, ElementsAre("ws://localhost:8080/socket"));
  EXPECT_EQ("dcssai", server.state->sent.at(0).value("username", ""));
}

TEST_F(CommandShellTest, testGameCommands) {
  connectAndStart();
  EXPECT_THAT(run("get_stats"), HasSubstr("HP: 9/9"));
  EXPECT_EQ("No enemies in sight.\n", run("get_nearby_enemies"));
  EXPECT_EQ("No menu or popup is currently open.\n", run("read_ui"));

  server.onKey("key_dir_n", {playerUpdate({{"turn", 1}}), gameMessages({"You walk north."}), inputMode(1)});
  EXPECT_EQ("You walk north.\n", run("move n"));

  server.onKey(".", {playerUpdate({{"turn", 2}}), inputMode(1)});
  EXPECT_EQ("(no new messages)\n", run("wait"));
}

TEST_F(CommandShellTest, testSaveGame) {
  connectAndStart();
  server.onKey("key_ctrl_s", {serverMsg({{"msg", "go_lobby"}})});
  EXPECT_EQ("Game saved.\n", run("save_game"));
  EXPECT_FALSE(client.session().inGame());
  EXPECT_EQ("Not in game\n", run("wait"));
}

TEST_F(CommandShellTest, testNotesThroughShell) {
  connectAndStart();
  EXPECT_EQ("Note saved to [threats] (1 notes on this page, 1 total).\n", run("write_note @threats avoid the ogre"));
  EXPECT_EQ("Note saved to [Dungeon:1] (1 notes on this page, 2 total).\n", run("write_note stairs are west"));
  EXPECT_EQ("[threats]\n- avoid the ogre\n", run("read_notes threats"));
  EXPECT_EQ("Ripped out [threats] (1 notes removed).\n", run("rip_page threats"));
}

TEST_F(CommandShellTest, testRunStopsAtQuit) {
  std::istringstream in("status\nquit\nstatus\n");
  std::atomic<bool> cancel{false};
  shell.run(in, cancel);
  const std::string text = out.str();
  ASSERT_NE(std::string::npos, text.find("Status: Idle"));
  EXPECT_EQ(text.find("Status:"), text.rfind("Status:"));
}
