#pragma once

// cmd_batch: sanitize every *.json export in a directory.
// Usage: chatsan_cli batch <input-dir> [--workers N] [policy options]
int cmd_batch(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
