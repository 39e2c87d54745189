#pragma once

// dat-reader dump <path> [--preview <n>] [--report-skipped]
int cmd_dump(int argc, char** argv);
