#pragma once

// dat-reader export <path> [--out <path>] [--report-skipped]
int cmd_export(int argc, char** argv);
