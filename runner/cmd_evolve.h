#pragma once

// hive_cli evolve <status|pending|apply-swap|discard-swap|vote|clear-overrides|log> ...
int cmd_evolve(int argc, char** argv);

// hive_cli send <to> <message> [--from <id>]
int cmd_send(int argc, char** argv);
