#pragma once

// hive_cli worker --id <id> [--config <path>]
int cmd_worker(int argc, char** argv);
