#pragma once

// hive_cli task <create|list|show|cancel|pause|resume|retry|flag|clear> ...
int cmd_task(int argc, char** argv);
