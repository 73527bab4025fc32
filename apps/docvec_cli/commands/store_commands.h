#pragma once

// Table maintenance subcommands. Each returns the process exit code.
//
//   init        --config <store.json>
//   write       --config <store.json> --input <docs.jsonl> [--policy fail|skip|overwrite]
//   count       --config <store.json> [--filter <json>]
//   filter      --config <store.json> [--filter <json>]
//   delete      --config <store.json> --id <id> [--id <id> ...]
//   index-text  --config <store.json> --field <field> [--replace]
//
// All accept --log-level.
int cmd_init(int argc, char* argv[]);        // NOLINT(modernize-avoid-c-arrays)
int cmd_write(int argc, char* argv[]);       // NOLINT(modernize-avoid-c-arrays)
int cmd_count(int argc, char* argv[]);       // NOLINT(modernize-avoid-c-arrays)
int cmd_filter(int argc, char* argv[]);      // NOLINT(modernize-avoid-c-arrays)
int cmd_delete(int argc, char* argv[]);      // NOLINT(modernize-avoid-c-arrays)
int cmd_index_text(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
