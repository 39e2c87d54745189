#include "dat/DatThread.hpp"
#include "dat/BodyParser.hpp"
#include "dat/DateField.hpp"

#include <sstream>
#include <stdexcept>

namespace dat {

static DatEntry deleted_entry(const LineFields& f) {
    DatEntry e;
    e.name = kDeletedMarker;
    e.email = kDeletedMarker;
    e.date_time = kDeletedMarker;
    e.deleted = true;
    if (f.title && *f.title != kDeletedMarker) e.title = f.title;
    return e;
}

DatEntry assemble_entry(const LineFields& fields) {
    if (is_deleted_line(fields)) return deleted_entry(fields);

    DateFieldParts date = split_date_field(fields.date_field);
    ParsedBody body = parse_body(fields.raw_body);

    DatEntry e;
    e.name = fields.name;
    e.email = fields.email;
    e.date_time = std::move(date.date_time);
    e.user_id = std::move(date.user_id);
    e.be_id = std::move(date.be_id);
    e.body = std::move(body.body);
    e.title = fields.title;
    e.reply_targets = std::move(body.reply_targets);
    return e;
}

std::optional<DatEntry> parse_line(const std::string& line) {
    auto fields = tokenize_line(line);
    if (!fields) return std::nullopt;
    return assemble_entry(*fields);
}

DatThread DatThread::parse(const std::vector<std::string>& lines, const ParseOptions& opts) {
    DatThread t;
    t.m_posts.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        size_t field_count = 0;
        auto fields = tokenize_line(lines[i], &field_count);
        if (!fields) {
            if (opts.malformed == MalformedLinePolicy::SkipWithDiagnostic) {
                std::ostringstream oss;
                oss << "expected at least 4 fields separated by \"" << kFieldDelimiter
                    << "\", found " << field_count;
                t.m_skipped.push_back({i, field_count, oss.str()});
            }
            continue;
        }
        t.m_posts.push_back(assemble_entry(*fields));
    }

    return t;
}

const DatEntry& DatThread::post(size_t number) const {
    if (number == 0 || number > m_posts.size()) {
        std::ostringstream oss;
        oss << "post number out of range: " << number << " (thread has " << m_posts.size() << " posts)";
        throw std::out_of_range(oss.str());
    }
    return m_posts[number - 1];
}

std::optional<std::string> DatThread::title() const {
    if (m_posts.empty()) return std::nullopt;
    const auto& first = m_posts.front().title;
    if (!first || first->empty()) return std::nullopt;
    return first;
}

}  // namespace dat
