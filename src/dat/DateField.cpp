#include "dat/DateField.hpp"
#include "dat/TextUtil.hpp"

namespace dat {

static const std::string kIdMarker = " ID:";
static const std::string kBeMarker = " BE:";

DateFieldParts split_date_field(const std::string& field) {
    DateFieldParts out;

    size_t id_pos = field.find(kIdMarker);
    if (id_pos != std::string::npos) {
        out.date_time = textutil::strip(field.substr(0, id_pos));

        const std::string rest = field.substr(id_pos + kIdMarker.size());
        size_t be_pos = rest.find(kBeMarker);
        if (be_pos != std::string::npos) {
            out.user_id = textutil::strip(rest.substr(0, be_pos));
            out.be_id = textutil::strip(rest.substr(be_pos + kBeMarker.size()));
        } else {
            out.user_id = textutil::strip(rest);
        }
        return out;
    }

    size_t be_pos = field.find(kBeMarker);
    if (be_pos != std::string::npos) {
        out.date_time = textutil::strip(field.substr(0, be_pos));
        out.be_id = textutil::strip(field.substr(be_pos + kBeMarker.size()));
        return out;
    }

    out.date_time = textutil::strip(field);
    return out;
}

}  // namespace dat
