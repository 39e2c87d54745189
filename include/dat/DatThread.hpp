#pragma once
#include "dat/DatEntry.hpp"
#include "dat/LineTokenizer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dat {

enum class MalformedLinePolicy {
    Skip,               // drop lines with fewer than four fields silently
    SkipWithDiagnostic, // drop them and record a SkippedLine
};

struct ParseOptions {
    MalformedLinePolicy malformed = MalformedLinePolicy::Skip;
};

struct SkippedLine {
    size_t line_index = 0;   // 0-based index into the input lines
    size_t field_count = 0;
    std::string reason;
};

// Builds the entry for one tokenized line (deleted-post lines included).
DatEntry assemble_entry(const LineFields& fields);

// tokenize_line + assemble_entry; nullopt for malformed lines
std::optional<DatEntry> parse_line(const std::string& line);

// The posts of one dat file, in file order. Post numbers are 1-based
// positions; entries are only reachable through const accessors.
class DatThread {
public:
    static DatThread parse(const std::vector<std::string>& lines, const ParseOptions& opts = ParseOptions{});

    const std::vector<DatEntry>& posts() const { return m_posts; }
    const std::vector<SkippedLine>& skipped() const { return m_skipped; }

    size_t size() const { return m_posts.size(); }
    bool empty() const { return m_posts.empty(); }

    // 1-based; throws std::out_of_range outside [1, size()]
    const DatEntry& post(size_t number) const;

    // title carried by the first post, nullopt when absent or empty
    std::optional<std::string> title() const;

private:
    std::vector<DatEntry> m_posts;
    std::vector<SkippedLine> m_skipped;
};

}
