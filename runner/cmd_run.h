#pragma once

// hive_cli run [--config <path>] [--until-idle]
int cmd_run(int argc, char** argv);
