#include "commands/export.hpp"

#include "dat/DatFile.hpp"
#include "dat/ThreadArtifact.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int export_usage() {
    std::cerr
        << "usage:\n"
        << "  dat-reader export <path> [--out <path>] [--report-skipped]\n";
    return 1;
}

int cmd_export(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        std::cerr << "error: missing dat file path\n";
        return export_usage();
    }

    const std::string path = argv[1];
    const std::string out_path = get_arg(argc, argv, "--out", (fs::path("out") / "thread.json").string());

    dat::ParseOptions opts;
    if (has_flag(argc, argv, "--report-skipped")) opts.malformed = dat::MalformedLinePolicy::SkipWithDiagnostic;

    dat::ThreadArtifact art;
    art.source_path = path;
    try {
        art.thread = dat::DatThread::parse(dat::load_dat_lines(path), opts);
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load dat: " << e.what() << "\n";
        return 1;
    }

    for (const auto& s : art.thread.skipped()) {
        std::cerr << "[warn] line " << (s.line_index + 1) << ": " << s.reason << "\n";
    }

    try {
        art.write_to(fs::path(out_path));
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to write thread: " << e.what() << "\n";
        return 1;
    }

    std::cout << "POSTS: " << art.thread.size() << "\n";
    std::cout << "OUT_THREAD: " << out_path << "\n";
    return 0;
}
