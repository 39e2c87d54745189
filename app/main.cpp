#include "commands/dump.hpp"
#include "commands/export.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  dat-reader dump <path> [args]\n"
        << "  dat-reader export <path> [args]\n"
        << "  dat-reader help\n";
    return 1;
}

static int print_dump_help() {
    std::cerr
        << "usage:\n"
        << "  dat-reader dump <path> [options]\n"
        << "\n"
        << "input is a UTF-8 dat file (convert Shift_JIS first: iconv -f CP932 -t UTF-8)\n"
        << "\n"
        << "options:\n"
        << "  --preview <n>                body characters shown per post, default: 40\n"
        << "  --report-skipped             warn about lines with fewer than 4 fields\n";
    return 0;
}

static int print_export_help() {
    std::cerr
        << "usage:\n"
        << "  dat-reader export <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 default: out/thread.json\n"
        << "  --report-skipped             warn about and record lines with fewer than 4 fields\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "dump"   && (argc >= 3 && std::string(argv[2]) == "--help")) return print_dump_help();
    if (cmd == "export" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_export_help();

    if (cmd == "dump")   return cmd_dump(argc - 1, argv + 1);
    if (cmd == "export") return cmd_export(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
