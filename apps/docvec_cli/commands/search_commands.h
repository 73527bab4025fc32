#pragma once

// Retrieval subcommands; print one JSON document per line, best match first.
//
//   search       --config <store.json> --vector <json array> [--top-k N]
//                [--metric l2|cosine|dot] [--filter <json>]
//   text-search  --config <store.json> --query <text> [--field content] [--top-k N]
//                [--filter <json>]
int cmd_search(int argc, char* argv[]);       // NOLINT(modernize-avoid-c-arrays)
int cmd_text_search(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
