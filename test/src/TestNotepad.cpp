#include <gtest/gtest.h>

#include "Notepad.hpp"
#include "StateMirror.hpp"

class NotepadTest : public testing::Test {
 protected:
  NotepadTest() {
    player.place = "Dungeon";
    player.depth = 3;
  }

  Notepad notepad;
  PlayerState player;
};

TEST_F(NotepadTest, testEmpty) {
  EXPECT_EQ("Notepad is empty.", notepad.read());
  EXPECT_EQ(0u, notepad.totalNotes());
}

TEST_F(NotepadTest, testDefaultPageIsCurrentLevel) {
  EXPECT_EQ("Note saved to [Dungeon:3] (1 notes on this page, 1 total).", notepad.write("altar to Trog", "", player));
  EXPECT_EQ("general", Notepad::defaultPage(PlayerState{}));
}

TEST_F(NotepadTest, testPagesKeepCreationOrder) {
  notepad.write("stairs north", "", player);
  notepad.write("avoid Sigmund", "threats", player);
  notepad.write("shop east", "", player);
  EXPECT_EQ("[Dungeon:3]\n  - stairs north\n  - shop east\n[threats]\n  - avoid Sigmund", notepad.read());
  EXPECT_EQ("[threats]\n- avoid Sigmund", notepad.read("threats"));
  EXPECT_EQ(3u, notepad.totalNotes());
}

TEST_F(NotepadTest, testMissingPage) {
  notepad.write("x", "a", player);
  EXPECT_EQ("No notes on page [b].", notepad.read("b"));
  EXPECT_EQ("No page [b] to rip out.", notepad.remove("b"));
}

TEST_F(NotepadTest, testRemovePage) {
  notepad.write("x", "a", player);
  notepad.write("y", "a", player);
  EXPECT_EQ("Ripped out [a] (2 notes removed).", notepad.remove("a"));
  EXPECT_EQ("Notepad is empty.", notepad.read());
}
