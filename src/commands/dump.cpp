#include "commands/dump.hpp"

#include "dat/DatFile.hpp"
#include "dat/DatThread.hpp"
#include "dat/TextUtil.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

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

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoi(s); } catch (const std::exception&) { return def; }
}

static int dump_usage() {
    std::cerr
        << "usage:\n"
        << "  dat-reader dump <path> [--preview <n>] [--report-skipped]\n";
    return 1;
}

static void print_reply_targets(const std::vector<long long>& targets) {
    std::cout << "  replies to: ";
    for (size_t i = 0; i < targets.size(); ++i) {
        if (i) std::cout << ", ";
        std::cout << ">>" << targets[i];
    }
    std::cout << "\n";
}

int cmd_dump(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        std::cerr << "error: missing dat file path\n";
        return dump_usage();
    }
    const std::string path = argv[1];

    int preview = get_arg_int(argc, argv, "--preview", 40);
    if (preview < 0) preview = 40;

    dat::ParseOptions opts;
    if (has_flag(argc, argv, "--report-skipped")) opts.malformed = dat::MalformedLinePolicy::SkipWithDiagnostic;

    dat::DatThread thread;
    try {
        thread = dat::DatThread::parse(dat::load_dat_lines(path), opts);
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load dat: " << e.what() << "\n";
        return 1;
    }

    for (const auto& s : thread.skipped()) {
        std::cerr << "[warn] line " << (s.line_index + 1) << ": " << s.reason << "\n";
    }

    if (auto title = thread.title()) {
        std::cout << "=== thread title: " << *title << " ===\n";
    }

    const auto& posts = thread.posts();
    for (size_t i = 0; i < posts.size(); ++i) {
        const dat::DatEntry& e = posts[i];

        std::cout << "[post " << (i + 1) << "]\n";
        std::cout << "  name: " << e.name << "\n";
        std::cout << "  date: " << e.date_time << "\n";
        if (e.user_id && !e.user_id->empty()) std::cout << "  ID: " << *e.user_id << "\n";
        if (e.be_id && !e.be_id->empty()) std::cout << "  BE: " << *e.be_id << "\n";

        const size_t limit = static_cast<size_t>(preview);
        std::string shown = e.body;
        if (textutil::utf8_length(e.body) > limit) shown = textutil::utf8_prefix(e.body, limit) + "...";
        std::cout << "  body:\n" << shown << "\n";

        if (!e.reply_targets.empty()) print_reply_targets(e.reply_targets);
        std::cout << "\n";
    }

    return 0;
}
