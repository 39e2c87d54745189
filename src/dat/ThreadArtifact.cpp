#include "dat/ThreadArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace dat {

static nlohmann::json optional_to_json(const std::optional<std::string>& v) {
    if (!v) return nullptr;
    return *v;
}

static nlohmann::json entry_to_json(size_t number, const DatEntry& e) {
    nlohmann::json j;

    j["number"] = number;
    j["name"] = e.name;
    j["email"] = e.email;
    j["date_time"] = e.date_time;
    j["user_id"] = optional_to_json(e.user_id);
    j["be_id"] = optional_to_json(e.be_id);
    j["body"] = e.body;
    j["title"] = optional_to_json(e.title);
    j["reply_targets"] = e.reply_targets;
    j["deleted"] = e.is_deleted();

    return j;
}

nlohmann::json ThreadArtifact::to_json() const {
    nlohmann::json j;
    j["source_path"] = source_path;
    j["num_posts"] = thread.size();
    j["title"] = optional_to_json(thread.title());

    nlohmann::json posts = nlohmann::json::array();
    const auto& entries = thread.posts();
    for (size_t i = 0; i < entries.size(); ++i) {
        posts.push_back(entry_to_json(i + 1, entries[i]));
    }
    j["posts"] = posts;

    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& s : thread.skipped()) {
        skipped.push_back({
            {"line_index", s.line_index},
            {"field_count", s.field_count},
            {"reason", s.reason}
        });
    }
    j["skipped_lines"] = skipped;

    return j;
}

void ThreadArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    // bodies of badly converted files may hold invalid UTF-8
    out << to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}  // namespace dat
