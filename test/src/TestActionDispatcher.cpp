#include <chrono>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "ScriptedServer.hpp"

using json = nlohmann::json;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::StartsWith;

namespace {
ServerMessage pickupMenu() {
  return serverMsg(json::parse(R"({"msg":"menu","tag":"pickup","title":{"text":"Pick up what?"},"items":[]})"));
}
}  // namespace

class ActionDispatcherTest : public testing::Test {
 protected:
  ActionDispatcherTest() {
    session.connect("ws://test/socket", "bot", "pw");
    session.setInGame(true);
    server.clearSent();
  }

  ScriptedServer server;
  ProtocolSession session{server.factory(), fastTiming()};
  StateMirror mirror;
  UiOverlayTracker ui;
  ActionDispatcher dispatcher{session, mirror, ui, fastDispatch()};
};

TEST_F(ActionDispatcherTest, testReadyReturnsNewMessages) {
  server.onKey("o", {gameMessages({"You start exploring."}), inputMode(1)});
  EXPECT_THAT(dispatcher.dispatch({"o"}), ElementsAre("You start exploring."));
  EXPECT_THAT(server.sentKeys(), ElementsAre("o"));
  EXPECT_EQ(0, dispatcher.consecutiveTimeouts());
}

TEST_F(ActionDispatcherTest, testStrayMessagesAreAppliedFirst) {
  server.queue({playerUpdate({{"hp", 7}})});
  server.onKey("o", {inputMode(1)});
  dispatcher.dispatch({"o"});
  EXPECT_EQ(7, mirror.player().hp);
}

TEST_F(ActionDispatcherTest, testTargetingModesCountAsReady) {
  for (const int mode : {2, 3, 4}) {
    server.onKey("z", {inputMode(mode)});
    dispatcher.dispatch({"z"});
    EXPECT_EQ(0, dispatcher.consecutiveTimeouts()) << "mode " << mode;
  }
}

TEST_F(ActionDispatcherTest, testMorePromptIsPagedThrough) {
  server.onKey("o", {gameMessages({"first"}), inputMode(5)});
  server.onKey(" ", {gameMessages({"second"}), inputMode(1)});
  EXPECT_THAT(dispatcher.dispatch({"o"}), ElementsAre("first", "second"));
  EXPECT_THAT(server.sentKeys(), ElementsAre("o", " "));
}

TEST_F(ActionDispatcherTest, testTextPromptIsEscaped) {
  server.onKey("x", {inputMode(7)});
  server.onKey("key_esc", {inputMode(1)});
  dispatcher.dispatch({"x"});
  EXPECT_THAT(server.sentKeys(), ElementsAre("x", "key_esc"));
  EXPECT_FALSE(dispatcher.statPromptPending());
}

TEST_F(ActionDispatcherTest, testUnknownModeIsEscaped) {
  server.onKey("x", {inputMode(9)});
  server.onKey("key_esc", {inputMode(1)});
  dispatcher.dispatch({"x"});
  EXPECT_THAT(server.sentKeys(), ElementsAre("x", "key_esc"));
}

TEST_F(ActionDispatcherTest, testStatPromptLatchesUntilChosen) {
  server.onKey("o", {gameMessages({"Increase (S)trength, (I)ntelligence, or (D)exterity?"}), inputMode(7)});
  dispatcher.dispatch({"o"});
  EXPECT_TRUE(dispatcher.statPromptPending());
  EXPECT_THAT(server.sentKeys(), ElementsAre("o"));

  const auto refused = dispatcher.dispatch({"o"});
  ASSERT_EQ(1u, refused.size());
  EXPECT_THAT(refused[0], StartsWith("[ERROR: Stat increase prompt is waiting!"));
  EXPECT_EQ(1, server.countSent("o"));

  EXPECT_THAT(dispatcher.chooseStat("x"), ElementsAre(HasSubstr("Invalid stat")));
  server.onKey("S", {gameMessages({"You feel stronger."}), inputMode(1)});
  EXPECT_THAT(dispatcher.chooseStat("s"), ElementsAre("You feel stronger."));
  EXPECT_FALSE(dispatcher.statPromptPending());
  EXPECT_THAT(dispatcher.chooseStat("s"), ElementsAre("[No stat increase prompt pending.]"));
}

TEST_F(ActionDispatcherTest, testEscapeClearsStatLatch) {
  server.onKey("o", {gameMessages({"(S)trength?"}), inputMode(7)});
  dispatcher.dispatch({"o"});
  ASSERT_TRUE(dispatcher.statPromptPending());
  server.onKey("key_esc", {inputMode(1)});
  dispatcher.escape();
  EXPECT_FALSE(dispatcher.statPromptPending());
}

TEST_F(ActionDispatcherTest, testOpenMenuBlocksGameKeys) {
  dispatcher.route(pickupMenu());
  const auto result = dispatcher.dispatch({"o"});
  ASSERT_EQ(1u, result.size());
  EXPECT_EQ(
      "[ERROR: Pick up what? is still open. Use read_ui() to see it, select_menu_item() to interact, or dismiss() "
      "to close it first.]",
      result[0]);
  EXPECT_TRUE(server.sentKeys().empty());
}

TEST_F(ActionDispatcherTest, testOpenPopupBlocksGameKeys) {
  dispatcher.route(serverMsg({{"msg", "ui-push"}, {"type", "msgwin"}}));
  EXPECT_THAT(dispatcher.dispatch({"o"}), ElementsAre(StartsWith("[ERROR: A popup is still open.")));
}

TEST_F(ActionDispatcherTest, testMenuOpeningEndsExchange) {
  server.onKey(",", {pickupMenu()});
  dispatcher.dispatch({","});
  EXPECT_TRUE(ui.hasMenu());
  EXPECT_EQ(0, dispatcher.consecutiveTimeouts());
}

TEST_F(ActionDispatcherTest, testNarrationRequiredEveryInterval) {
  DispatcherConfig config = fastDispatch();
  config.narrateInterval = 2;
  ActionDispatcher narrated{session, mirror, ui, config};
  server.defaultKeyReply = {inputMode(1)};

  narrated.dispatch({"."});
  narrated.dispatch({"."});
  EXPECT_THAT(narrated.dispatch({"."}), ElementsAre(StartsWith("[ERROR: You must call narrate() before continuing.")));
  EXPECT_EQ(2, server.countSent("."));

  // Menu traffic is never counted or refused.
  narrated.respond("yes");
  EXPECT_EQ(1, server.countSent("Y"));

  narrated.markNarrated();
  narrated.dispatch({"."});
  EXPECT_EQ(3, server.countSent("."));
}

TEST_F(ActionDispatcherTest, testUnknownCommandHint) {
  server.onKey("Q", {gameMessages({"Unknown command."}), inputMode(1)});
  const auto result = dispatcher.dispatch({"Q"});
  ASSERT_EQ(2u, result.size());
  EXPECT_THAT(result[1], StartsWith("[HINT: 'Unknown command'"));
}

TEST_F(ActionDispatcherTest, testNotInGame) {
  session.setInGame(false);
  EXPECT_THAT(dispatcher.dispatch({"o"}), ElementsAre("Not in game"));
  EXPECT_TRUE(server.sentKeys().empty());
}

TEST_F(ActionDispatcherTest, testDisconnectedSessionThrows) {
  session.disconnect();
  EXPECT_THROW(dispatcher.dispatch({"o"}), NotConnectedError);
}

TEST_F(ActionDispatcherTest, testCloseMeansDeath) {
  server.onKey("o", {gameMessages({"You die..."}), serverMsg({{"msg", "close"}})});
  EXPECT_THAT(dispatcher.dispatch({"o"}), ElementsAre("You die..."));
  EXPECT_TRUE(mirror.player().dead);
  EXPECT_FALSE(session.inGame());
  EXPECT_EQ(1, session.record().deaths);
  EXPECT_EQ(0, dispatcher.consecutiveTimeouts());
}

TEST_F(ActionDispatcherTest, testTimeoutIsBounded) {
  const auto start = std::chrono::steady_clock::now();
  dispatcher.dispatch({"o"}, std::chrono::milliseconds(30));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(30));
  EXPECT_LT(elapsed, std::chrono::milliseconds(500));
  EXPECT_EQ(1, dispatcher.consecutiveTimeouts());
}

TEST_F(ActionDispatcherTest, testRecoveryAfterThirdTimeout) {
  dispatcher.dispatch({"o"});
  dispatcher.dispatch({"o"});
  EXPECT_EQ(2, dispatcher.consecutiveTimeouts());
  EXPECT_EQ(0, dispatcher.recoveryCount());
  EXPECT_EQ(0, server.countSent("key_ctrl_r"));

  dispatcher.dispatch({"o"});
  EXPECT_EQ(0, dispatcher.consecutiveTimeouts());
  EXPECT_EQ(1, dispatcher.recoveryCount());
  EXPECT_THAT(server.sentKeys(), ElementsAre("o", "o", "o", "key_esc", "key_esc", "key_esc", "key_ctrl_r"));
}

TEST_F(ActionDispatcherTest, testReadyResetsTimeoutCount) {
  dispatcher.dispatch({"o"});
  dispatcher.dispatch({"o"});
  server.onKey("o", {inputMode(1)});
  dispatcher.dispatch({"o"});
  dispatcher.dispatch({"o"});
  EXPECT_EQ(1, dispatcher.consecutiveTimeouts());
  EXPECT_EQ(0, dispatcher.recoveryCount());
}

TEST_F(ActionDispatcherTest, testRecoveryClosesPhantomOverlays) {
  dispatcher.route(pickupMenu());
  dispatcher.route(serverMsg({{"msg", "ui-push"}, {"type", "msgwin"}}));
  for (int i = 0; i < 3; ++i) {
    dispatcher.dispatch({"key_esc"}, std::nullopt, true);
  }
  EXPECT_EQ(1, dispatcher.recoveryCount());
  EXPECT_FALSE(ui.hasMenu());
  EXPECT_FALSE(ui.hasPopup());
}

TEST_F(ActionDispatcherTest, testRecoveryKeepsRepushedMenu) {
  dispatcher.route(pickupMenu());
  server.onKey("key_ctrl_r", {pickupMenu(), inputMode(1)});
  for (int i = 0; i < 3; ++i) {
    dispatcher.dispatch({"x"}, std::nullopt, true);
  }
  EXPECT_EQ(1, dispatcher.recoveryCount());
  EXPECT_TRUE(ui.hasMenu());
}

TEST_F(ActionDispatcherTest, testSelectMenuItem) {
  EXPECT_EQ("No menu is currently open.", dispatcher.selectMenuItem("a"));
  dispatcher.route(pickupMenu());
  server.onKey("a", {serverMsg({{"msg", "close_menu"}})});
  EXPECT_EQ("Menu closed after pressing 'a'.", dispatcher.selectMenuItem("a"));
  EXPECT_FALSE(ui.hasMenu());
}

TEST_F(ActionDispatcherTest, testSelectMenuItemKeepsMenuOpen) {
  dispatcher.route(pickupMenu());
  EXPECT_EQ("Pressed 'b'. Menu still open. Use read_ui() to see updated state.", dispatcher.selectMenuItem("b"));
}

TEST_F(ActionDispatcherTest, testDismiss) {
  dispatcher.route(pickupMenu());
  EXPECT_EQ("Menu closed.", dispatcher.dismiss());
  EXPECT_FALSE(ui.hasMenu());
  dispatcher.route(serverMsg({{"msg", "ui-push"}, {"type", "msgwin"}}));
  EXPECT_EQ("Popup dismissed.", dispatcher.dismiss());
  EXPECT_EQ("Escape pressed.", dispatcher.dismiss());
  EXPECT_EQ(3, server.countSent("key_esc"));
}

TEST_F(ActionDispatcherTest, testInterlevelTravel) {
  server.onKey("G", {inputMode(7)});
  server.onKey("key_enter", {playerUpdate({{"depth", 2}}), inputMode(1)});
  const auto result = dispatcher.interlevelTravel(">");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(2, mirror.player().depth);
  EXPECT_EQ(0, dispatcher.consecutiveTimeouts());
  EXPECT_THAT(server.sentKeys(), ElementsAre("G", ">", "key_enter"));
}

TEST_F(ActionDispatcherTest, testInterlevelTravelWithoutPrompt) {
  EXPECT_FALSE(dispatcher.interlevelTravel(">").has_value());
  EXPECT_THAT(server.sentKeys(), ElementsAre("G", "key_esc"));
}
