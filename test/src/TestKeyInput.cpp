#include <gtest/gtest.h>

#include "KeyInput.hpp"

using json = nlohmann::json;

TEST(KeyInputTest, testEscapeAndTabAreKeycodes) {
  EXPECT_EQ((json{{"msg", "key"}, {"keycode", 27}}), encodeKey(kKeyEscape));
  EXPECT_EQ((json{{"msg", "key"}, {"keycode", 9}}), encodeKey(kKeyTab));
}

TEST(KeyInputTest, testControlLetters) {
  EXPECT_EQ((json{{"msg", "key"}, {"keycode", 18}}), encodeKey(kKeyRedraw));
  EXPECT_EQ((json{{"msg", "key"}, {"keycode", 17}}), encodeKey(kKeyQuit));
  EXPECT_EQ((json{{"msg", "key"}, {"keycode", 19}}), encodeKey(kKeySave));
}

TEST(KeyInputTest, testEnterIsCarriageReturn) {
  EXPECT_EQ((json{{"msg", "input"}, {"text", "\r"}}), encodeKey(kKeyEnter));
}

TEST(KeyInputTest, testDirectionsUseNumpadDigits) {
  EXPECT_EQ((json{{"msg", "input"}, {"text", "8"}}), encodeKey("key_dir_n"));
  EXPECT_EQ((json{{"msg", "input"}, {"text", "3"}}), encodeKey("key_dir_se"));
  EXPECT_EQ((json{{"msg", "input"}, {"text", "7"}}), encodeKey("key_dir_nw"));
}

TEST(KeyInputTest, testPlainTextPassesThrough) {
  EXPECT_EQ((json{{"msg", "input"}, {"text", "o"}}), encodeKey("o"));
  EXPECT_EQ((json{{"msg", "input"}, {"text", "key_unknown"}}), encodeKey("key_unknown"));
}

TEST(KeyInputTest, testDirectionKey) {
  EXPECT_EQ("key_dir_ne", directionKey("NE").value_or(""));
  EXPECT_EQ("key_dir_w", directionKey("w").value_or(""));
  EXPECT_FALSE(directionKey("up").has_value());
  EXPECT_FALSE(directionKey("").has_value());
}
