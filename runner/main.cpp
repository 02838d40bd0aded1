#include "cmd_evolve.h"
#include "cmd_run.h"
#include "cmd_task.h"
#include "cmd_worker.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "hive_cli <run|worker|task|evolve|send> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "worker") return cmd_worker(argc, argv);
    if (cmd == "task") return cmd_task(argc, argv);
    if (cmd == "evolve") return cmd_evolve(argc, argv);
    if (cmd == "send") return cmd_send(argc, argv);

    std::cerr << "unknown cmd: " << cmd << "\n";
    return 2;
}
