// include/dat/ThreadArtifact.hpp
#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "dat/DatThread.hpp"

namespace dat {

struct ThreadArtifact {
    std::string source_path;
    DatThread thread;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace dat
