#pragma once

// cmd_clean: sanitize one export file.
// Usage: chatsan_cli clean <export.json> [--approach A] [--level N] [--format F]
//                          [--salt S] [--persist-salt] [--out-dir DIR | --stdout]
//                          [--metadata <path>] [--db <path>]
int cmd_clean(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
