#pragma once

int cmd_evolve(int argc, char** argv, int first_arg);
int cmd_tasks(int argc, char** argv);
int cmd_score(int argc, char** argv);
