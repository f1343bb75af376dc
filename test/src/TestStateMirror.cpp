#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "ScriptedServer.hpp"
#include "StateMirror.hpp"

using json = nlohmann::json;
using testing::ElementsAre;
using testing::HasSubstr;

class StateMirrorTest : public testing::Test {
 protected:
  void placePlayer(int x, int y) { mirror.apply(playerUpdate({{"pos", {{"x", x}, {"y", y}}}})); }

  StateMirror mirror;
};

TEST_F(StateMirrorTest, testPlayerDiffMergesFields) {
  mirror.apply(playerUpdate({{"hp", 10}, {"hp_max", 20}, {"species", "Minotaur"}}));
  mirror.apply(playerUpdate({{"hp", 8}}));
  EXPECT_EQ(8, mirror.player().hp);
  EXPECT_EQ(20, mirror.player().maxHp);
  EXPECT_EQ("Minotaur", mirror.player().species);
}

TEST_F(StateMirrorTest, testApplyingSameBatchTwiceIsIdempotent) {
  const Batch batch{
      playerUpdate({{"hp", 15}, {"pos", {{"x", 5}, {"y", 5}}}}),
      mapUpdate(json::parse(R"([{"x":5,"y":5,"g":"@"},{"g":"g","mon":{"id":3,"name":"goblin","threat":1}}])")),
  };
  for (const auto& msg : batch) {
    mirror.apply(msg);
  }
  const auto cells = mirror.cells();
  const auto monsters = mirror.monsters();
  for (const auto& msg : batch) {
    mirror.apply(msg);
  }
  EXPECT_EQ(cells.size(), mirror.cells().size());
  EXPECT_EQ(monsters.size(), mirror.monsters().size());
  EXPECT_EQ(15, mirror.player().hp);
}

TEST_F(StateMirrorTest, testImplicitCursorAdvances) {
  mirror.apply(mapUpdate(json::parse(R"([{"x":10,"y":3,"g":"#"},{"g":"."},{"g":"."},{"y":4,"g":">"}])")));
  ASSERT_NE(nullptr, mirror.cellAt({10, 3}));
  EXPECT_EQ("#", mirror.cellAt({10, 3})->glyph);
  EXPECT_EQ(".", mirror.cellAt({11, 3})->glyph);
  EXPECT_EQ(".", mirror.cellAt({12, 3})->glyph);
  ASSERT_NE(nullptr, mirror.cellAt({13, 4}));
  EXPECT_EQ(">", mirror.cellAt({13, 4})->glyph);
}

TEST_F(StateMirrorTest, testCellsBeforeCursorIsKnownAreSkipped) {
  mirror.apply(mapUpdate(json::parse(R"([{"g":"#"},{"x":1,"g":"."},{"y":2,"g":"+"}])")));
  ASSERT_EQ(1u, mirror.cells().size());
  ASSERT_NE(nullptr, mirror.cellAt({1, 2}));
  EXPECT_EQ("+", mirror.cellAt({1, 2})->glyph);
}

TEST_F(StateMirrorTest, testMonsterThatMovesLeavesNoGhost) {
  mirror.apply(mapUpdate(json::parse(R"([{"x":1,"y":1,"g":"g","mon":{"id":9,"name":"goblin","threat":1}}])")));
  ASSERT_NE(nullptr, mirror.monsterAt({1, 1}));
  // The monster steps east: the old cell comes without "mon", the new one
  // with an id only.
  mirror.apply(mapUpdate(json::parse(R"([{"x":1,"y":1,"g":"."},{"g":"g","mon":{"id":9}}])")));
  EXPECT_EQ(nullptr, mirror.monsterAt({1, 1}));
  ASSERT_NE(nullptr, mirror.monsterAt({2, 1}));
  EXPECT_EQ("goblin", mirror.monsterAt({2, 1})->name);
  EXPECT_EQ(1u, mirror.monsters().size());
}

TEST_F(StateMirrorTest, testNullMonsterClearsCell) {
  mirror.apply(mapUpdate(json::parse(R"([{"x":4,"y":4,"mon":{"id":1,"name":"rat"}}])")));
  mirror.apply(mapUpdate(json::parse(R"([{"x":4,"y":4,"mon":null}])")));
  EXPECT_TRUE(mirror.monsters().empty());
}

TEST_F(StateMirrorTest, testMonsterKeptOnlyWhereBatchIsSilent) {
  mirror.apply(mapUpdate(json::parse(R"([{"x":1,"y":1,"mon":{"id":1,"name":"rat"}},
                                         {"x":8,"y":8,"mon":{"id":2,"name":"bat"}}])")));
  mirror.apply(mapUpdate(json::parse(R"([{"x":1,"y":1,"g":"."}])")));
  EXPECT_EQ(nullptr, mirror.monsterAt({1, 1}));
  ASSERT_NE(nullptr, mirror.monsterAt({8, 8}));
  EXPECT_EQ("bat", mirror.monsterAt({8, 8})->name);
}

TEST_F(StateMirrorTest, testResentMonsterKeepsUnsentFields) {
  placePlayer(5, 5);
  mirror.apply(mapUpdate(json::parse(R"([{"x":6,"y":5,"g":"H","mon":{"id":7,"name":"hill giant","threat":2}}])")));
  mirror.apply(mapUpdate(json::parse(R"([{"x":6,"y":5,"fg":1073741824,"mon":{"id":7}}])")));

  const Monster* giant = mirror.monsterAt({6, 5});
  ASSERT_NE(nullptr, giant);
  EXPECT_EQ("hill giant", giant->name);
  EXPECT_EQ(kThreatDangerous, giant->threat);

  const auto enemies = mirror.nearbyEnemies();
  ASSERT_EQ(1u, enemies.size());
  EXPECT_EQ(kThreatDangerous, enemies[0].threat);
  EXPECT_EQ("dangerous", enemies[0].threatLabel);
  EXPECT_EQ("lightly wounded", enemies[0].status);
}

TEST_F(StateMirrorTest, testMovedMonsterKeepsThreat) {
  mirror.apply(mapUpdate(json::parse(R"([{"x":1,"y":1,"mon":{"id":4,"name":"ogre","threat":2}}])")));
  mirror.apply(mapUpdate(json::parse(R"([{"x":1,"y":1,"g":"."},{"g":"O","mon":{"id":4}}])")));
  ASSERT_NE(nullptr, mirror.monsterAt({2, 1}));
  EXPECT_EQ(kThreatDangerous, mirror.monsterAt({2, 1})->threat);
}

TEST_F(StateMirrorTest, testResentMonsterTakesChangedFields) {
  mirror.apply(mapUpdate(json::parse(R"([{"x":3,"y":3,"mon":{"id":5,"name":"jackal","threat":1}}])")));
  mirror.apply(mapUpdate(json::parse(R"([{"x":3,"y":3,"mon":{"id":5,"threat":0}}])")));
  ASSERT_NE(nullptr, mirror.monsterAt({3, 3}));
  EXPECT_EQ(kThreatTrivial, mirror.monsterAt({3, 3})->threat);
  EXPECT_EQ("jackal", mirror.monsterAt({3, 3})->name);
}

TEST_F(StateMirrorTest, testOverlaysAreReplacedEachUpdate) {
  mirror.apply(mapUpdate(json::parse(R"([{"x":0,"y":0,"g":".","silenced":true}])")));
  EXPECT_TRUE(mirror.overlaysAt({0, 0}) & kOverlaySilenced);
  mirror.apply(mapUpdate(json::parse(R"([{"x":0,"y":0}])")));
  EXPECT_EQ(0, mirror.overlaysAt({0, 0}));
  EXPECT_EQ(".", mirror.cellAt({0, 0})->glyph);
}

TEST_F(StateMirrorTest, testMessageRingKeepsNewest) {
  for (int i = 0; i < 201; ++i) {
    mirror.apply(gameMessages({"message " + std::to_string(i)}));
  }
  const auto recent = mirror.recentMessages(1000);
  ASSERT_EQ(StateMirror::kMessageKeep, recent.size());
  EXPECT_EQ("message 101", recent.front());
  EXPECT_EQ("message 200", recent.back());
}

TEST_F(StateMirrorTest, testMessagesSinceSequence) {
  mirror.apply(gameMessages({"old"}));
  const auto mark = mirror.messageSequence();
  mirror.apply(gameMessages({"<red>new</red>", "   "}));
  EXPECT_THAT(mirror.messagesSince(mark), ElementsAre("new"));
}

TEST_F(StateMirrorTest, testInventorySlotsAndEquipment) {
  mirror.apply(playerUpdate(json::parse(R"({"weapon_index":0,"inv":{
      "0":{"name":"a +0 hand axe","quantity":1},
      "27":{"name":"potions of curing","quantity":3,"inscription":"heal"},
      "3":{"name":"?"}}})")));
  const auto items = mirror.inventory();
  ASSERT_EQ(2u, items.size());
  EXPECT_EQ('a', items[0].letter);
  EXPECT_EQ("weapon", items[0].equipped);
  EXPECT_EQ('B', items[1].letter);
  EXPECT_EQ(3, items[1].quantity);
  EXPECT_EQ("a) a +0 hand axe (wielded)\nB) potions of curing (x3) {heal}", mirror.inventoryText());
}

TEST_F(StateMirrorTest, testInventoryPartialUpdateAndRemoval) {
  mirror.apply(playerUpdate(json::parse(R"({"inv":{"1":{"name":"darts","quantity":10}}})")));
  mirror.apply(playerUpdate(json::parse(R"({"inv":{"1":{"quantity":7}}})")));
  ASSERT_EQ(1u, mirror.inventory().size());
  EXPECT_EQ("darts", mirror.inventory()[0].name);
  EXPECT_EQ(7, mirror.inventory()[0].quantity);
  mirror.apply(playerUpdate(json::parse(R"({"inv":{"1":{}}})")));
  EXPECT_TRUE(mirror.inventory().empty());
  EXPECT_EQ("Inventory is empty.", mirror.inventoryText());
}

TEST_F(StateMirrorTest, testMonsterStatusDecoding) {
  mirror.apply(mapUpdate(json::parse(R"([{"x":2,"y":0,"fg":[1048576,1],"mon":{"id":1,"name":"orc"}}])")));
  EXPECT_EQ("sleeping, severely wounded", mirror.monsterStatus({2, 0}));
  EXPECT_EQ("", mirror.monsterStatus({9, 9}));
}

TEST_F(StateMirrorTest, testNearbyEnemiesSortedAndFiltered) {
  placePlayer(10, 10);
  mirror.apply(mapUpdate(json::parse(R"([
      {"x":13,"y":10,"mon":{"id":1,"name":"jackal","threat":0}},
      {"x":11,"y":9,"mon":{"id":2,"name":"Ogre","threat":1}},
      {"x":10,"y":12,"mon":{"id":3,"name":"plant"}},
      {"x":30,"y":10,"mon":{"id":4,"name":"dragon","threat":3}}])")));
  const auto enemies = mirror.nearbyEnemies();
  ASSERT_EQ(2u, enemies.size());
  EXPECT_EQ("Ogre", enemies[0].name);
  EXPECT_EQ("ne", enemies[0].direction);
  EXPECT_EQ(1, enemies[0].distance);
  EXPECT_EQ(kThreatDangerous, enemies[0].threat);
  EXPECT_EQ("dangerous", enemies[0].threatLabel);
  EXPECT_EQ("jackal", enemies[1].name);
  EXPECT_EQ("e", enemies[1].direction);
  EXPECT_EQ(3, enemies[1].distance);
}

TEST_F(StateMirrorTest, testMapTextCentersOnPlayer) {
  placePlayer(1, 1);
  mirror.apply(mapUpdate(json::parse(R"([{"x":0,"y":0,"g":"#"},{"g":"#"},{"g":"#"},
                                         {"x":0,"y":1,"g":"."},{"g":"."},{"g":">"}])")));
  EXPECT_EQ("###\n.@>\n   ", mirror.mapText(1));
}

TEST_F(StateMirrorTest, testNoMapData) {
  EXPECT_EQ("No map data available", mirror.mapText());
  EXPECT_EQ("No map data available", mirror.tacticalText());
  EXPECT_EQ("No landmarks discovered yet.", mirror.landmarksText());
}

TEST_F(StateMirrorTest, testLandmarksListStairsBeforeDoors) {
  placePlayer(0, 0);
  mirror.apply(mapUpdate(json::parse(R"([{"x":1,"y":0,"g":"+"},{"x":0,"y":3,"g":">"}])")));
  EXPECT_EQ("downstairs (>) — S, 3 tiles away (dx=0, dy=3)", mirror.landmarksText());
}

TEST_F(StateMirrorTest, testStatsLine) {
  mirror.apply(playerUpdate(json::parse(R"({"species":"Minotaur","title":"the Skirmisher","hp":18,"hp_max":20,
      "mp":1,"mp_max":1,"ac":4,"ac_mod":1,"ev":9,"sh":0,"str":18,"int":5,"dex":11,"xl":2,"progress":40,
      "gold":12,"place":"Dungeon","depth":2,"god":"Trog","piety_rank":2,"turn":300,
      "status":[{"light":"Berserk"}]})")));
  EXPECT_EQ(
      "Character: Minotaur the Skirmisher | HP: 18/20 | MP: 1/1 | AC: 4 (+1) EV: 9 SH: 0 | Str: 18 Int: 5 Dex: 11"
      " | XL: 2 (40%) | Gold: 12 | Place: Dungeon:2 | God: Trog [★★☆☆☆☆] | Status: Berserk | Turn: 300",
      mirror.statsLine());
}

TEST_F(StateMirrorTest, testStateTextShowsDeath) {
  mirror.markDead();
  EXPECT_THAT(mirror.stateText(), HasSubstr("YOU ARE DEAD"));
}

TEST_F(StateMirrorTest, testResetForgetsEverything) {
  placePlayer(3, 3);
  mirror.apply(mapUpdate(json::parse(R"([{"x":1,"y":1,"g":".","mon":{"id":1,"name":"rat"}}])")));
  mirror.apply(gameMessages({"hello"}));
  mirror.reset();
  EXPECT_TRUE(mirror.cells().empty());
  EXPECT_TRUE(mirror.monsters().empty());
  EXPECT_TRUE(mirror.recentMessages().empty());
  EXPECT_EQ((Position{0, 0}), mirror.player().pos);
}

TEST(DirectionLabelTest, testCompassLabels) {
  EXPECT_EQ("N", directionLabel(0, -2));
  EXPECT_EQ("SW", directionLabel(-1, 4));
  EXPECT_EQ("here", directionLabel(0, 0));
}
