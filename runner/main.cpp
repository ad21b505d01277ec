#include "cmd_evolve.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) return cmd_evolve(argc, argv, 1);

    std::string cmd = argv[1];
    if (cmd == "evolve") return cmd_evolve(argc, argv, 2);
    if (cmd == "tasks") return cmd_tasks(argc, argv);
    if (cmd == "score") return cmd_score(argc, argv);
    if (!cmd.empty() && cmd[0] == '-') return cmd_evolve(argc, argv, 1);

    std::cerr << "evosynth_cli <evolve|tasks|score> ...\n";
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
