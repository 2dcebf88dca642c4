#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

// Sample chat exports shared by the test suite.
namespace chatsan::test_fixtures {

// Three messages out of timestamp order; Carol answers a message that is not
// in the export.
inline constexpr std::string_view kSmallExport = R"({
  "name": "Test Chat",
  "type": "private_group",
  "id": 777,
  "messages": [
    {"id": 1, "type": "message", "date_unixtime": "10", "from": "Alice", "from_id": "user1", "text": "hi"},
    {"id": 2, "type": "message", "date_unixtime": "11", "from": "Bob", "from_id": "user2",
     "reply_to_message_id": 1, "text": "hey"},
    {"id": 3, "type": "message", "date_unixtime": "9", "from": "Carol", "from_id": "user3",
     "reply_to_message_id": 99, "text": "early"}
  ]
})";

// A weekend-planning chat exercising reactions, links, media, edits,
// forwards, a service event, a tombstone and a reply to the tombstone.
//
// Reply forest: 10 -> 11 -> 12, 15 -> 16; 13 and 14 are roots.
inline constexpr std::string_view kRichExport = R"({
  "name": "Weekend Plans",
  "type": "private_group",
  "id": 4242,
  "messages": [
    {"id": 10, "type": "message", "date": "2023-11-14T22:13:20", "date_unixtime": "1700000000",
     "from": "Alice", "from_id": "user1", "text": "Anyone up for hiking?",
     "reactions": [{"type": "emoji", "count": 2, "emoji": "👍",
                    "recent": [{"from": "Bob", "from_id": "user2"},
                               {"from": "Carol", "from_id": "user3"}]}]},
    {"id": 11, "type": "message", "date_unixtime": "1700000060", "from": "Bob", "from_id": "user2",
     "reply_to_message_id": 10,
     "text": ["Yes! See ", {"type": "link", "text": "https://trails.example"}],
     "text_entities": [{"type": "plain", "text": "Yes! See "},
                       {"type": "link", "text": "https://trails.example"}],
     "edited": "2023-11-14T22:20:00", "edited_unixtime": "1700000400"},
    {"id": 12, "type": "message", "date_unixtime": "1700000120", "from": "Carol", "from_id": "user3",
     "reply_to_message_id": 11, "text": "Count me in",
     "file": "voice.ogg", "media_type": "voice_message", "mime_type": "audio/ogg",
     "duration_seconds": 7},
    {"id": 13, "type": "service", "date_unixtime": "1700000180", "actor": "Alice",
     "actor_id": "user1", "action": "pin_message", "text": ""},
    {"id": 14, "type": "message", "date_unixtime": "1700000240", "from": "Dave", "from_id": "user4",
     "text": "Trail tip: start early, bring water", "forwarded_from": "Trail News"},
    {"id": 15, "type": "deleted", "date_unixtime": "1700000300", "text": ""},
    {"id": 16, "type": "message", "date_unixtime": "1700000360", "from": "Alice", "from_id": "user1",
     "reply_to_message_id": 15, "text": "What was deleted?"}
  ]
})";

// Fresh, empty directory under the system temp path.
inline std::filesystem::path make_temp_dir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / ("chatsan_test_" + name);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline void write_file(const std::filesystem::path& path, const std::string_view content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

}  // namespace chatsan::test_fixtures
