#pragma once

// cmd_analyze: sanitize one export and run an analysis plugin over the text projection.
// Usage: chatsan_cli analyze <export.json> --plugin <name> [--param key=value]...
//                            [policy options]
int cmd_analyze(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_plugins: list registered analysis plugins.
int cmd_plugins();
