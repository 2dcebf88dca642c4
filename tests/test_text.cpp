#include "chatsan/core/text.h"

#include <catch2/catch.hpp>

using namespace chatsan;

TEST_CASE("trim and lower-casing", "[core][text]") {
  CHECK(core::trim("  padded \t\n") == "padded");
  CHECK(core::trim("   ").empty());
  CHECK(core::normalize_ascii_lower("PrIvAcY") == "privacy");
  // Non-ASCII bytes pass through untouched.
  CHECK(core::normalize_ascii_lower("ÄB") == "Äb");
}

TEST_CASE("join", "[core][text]") {
  CHECK(core::join({}, ", ").empty());
  CHECK(core::join({"a"}, ", ") == "a");
  CHECK(core::join({"a", "b", "c"}, " | ") == "a | b | c");
}

TEST_CASE("UTF-8 aware length and prefix", "[core][text]") {
  CHECK(core::utf8_length("héllo") == 5);
  CHECK(core::utf8_prefix("héllo", 2) == "hé");
  CHECK(core::utf8_prefix("short", 10) == "short");
  CHECK(core::utf8_prefix("👍👍👍", 1) == "👍");
}

TEST_CASE("clean_filename makes chat names safe", "[core][text]") {
  CHECK(core::clean_filename("Weekend Plans") == "Weekend_Plans");
  CHECK(core::clean_filename("Chat: A/B") == "Chat_AB");
  CHECK(core::clean_filename("  many   spaces -- here  ") == "many_spaces_here");
  CHECK(core::clean_filename("../../etc/passwd") == "etcpasswd");
  CHECK(core::clean_filename("Семья") == "Семья");
  CHECK(core::clean_filename("  --  ") == "chat");
  CHECK(core::clean_filename("") == "chat");
}
