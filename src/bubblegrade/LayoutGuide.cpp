#include "bubblegrade/LayoutGuide.hpp"
#include "bubblegrade/Errors.hpp"

#include <set>
#include <sstream>

using json = nlohmann::json;

namespace bubblegrade {

namespace {

std::string indexed(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

void requireObject(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw MalformedLayoutError(where + " must be an object");
    }
}

const json& requireField(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw MalformedLayoutError(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

const json& requireArray(const json& j, const char* key, const std::string& where) {
    const json& arr = requireField(j, key, where);
    if (!arr.is_array()) {
        throw MalformedLayoutError(where + "." + std::string(key) + " must be an array");
    }
    return arr;
}

double requireNumber(const json& j, const char* key, const std::string& where) {
    const json& v = requireField(j, key, where);
    if (!v.is_number()) {
        throw MalformedLayoutError(where + "." + std::string(key) + " must be a number");
    }
    return v.get<double>();
}

int requireInteger(const json& v, const std::string& where) {
    if (!v.is_number_integer()) {
        throw MalformedLayoutError(where + " must be an integer");
    }
    return v.get<int>();
}

// Option tokens are normally strings; generators sometimes emit digit values as numbers.
std::string requireLabel(const json& j, const char* key, const std::string& where) {
    const json& v = requireField(j, key, where);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    throw MalformedLayoutError(where + "." + std::string(key) + " must be a string or integer");
}

std::vector<BubbleDef> parseBubbles(const json& owner,
                                    const char* labelKey,
                                    const std::string& where) {
    const json& arr = requireArray(owner, "bubbles", where);
    if (arr.empty()) {
        throw MalformedLayoutError(where + ".bubbles must not be empty");
    }

    std::vector<BubbleDef> out;
    out.reserve(arr.size());
    std::set<std::string> seen;

    for (size_t i = 0; i < arr.size(); ++i) {
        const std::string path = indexed(where, "bubbles", i);
        const json& b = arr.at(i);
        requireObject(b, path);

        BubbleDef def;
        def.label  = requireLabel(b, labelKey, path);
        def.x      = requireNumber(b, "x", path);
        def.y      = requireNumber(b, "y", path);
        def.radius = requireNumber(b, "radius", path);

        if (def.radius < 0.0) {
            throw MalformedLayoutError(path + ".radius must not be negative");
        }
        if (!seen.insert(def.label).second) {
            throw MalformedLayoutError(path + " duplicates label '" + def.label + "'");
        }
        out.push_back(def);
    }
    return out;
}

int parseDigitIndex(const json& col, const std::string& where) {
    std::optional<int> fromIndex;
    std::optional<int> fromDigit;
    if (col.contains("digit_index")) fromIndex = requireInteger(col.at("digit_index"), where + ".digit_index");
    if (col.contains("digit"))       fromDigit = requireInteger(col.at("digit"), where + ".digit");

    if (fromIndex && fromDigit && *fromIndex != *fromDigit) {
        throw MalformedLayoutError(where + " has conflicting digit_index and digit");
    }
    if (fromIndex) return *fromIndex;
    if (fromDigit) return *fromDigit;
    throw MalformedLayoutError(where + " missing required field: digit_index");
}

} // namespace

std::optional<double> LayoutGuide::margin() const {
    if (!metadata.is_object() || !metadata.contains("margin")) return std::nullopt;
    return metadata.at("margin").get<double>();
}

LayoutGuide loadLayoutGuide(const json& doc) {
    requireObject(doc, "root");

    LayoutGuide layout;

    const json& dims = requireField(doc, "dimensions", "root");
    requireObject(dims, "root.dimensions");
    layout.width  = requireNumber(dims, "width", "root.dimensions");
    layout.height = requireNumber(dims, "height", "root.dimensions");
    if (layout.width <= 0.0 || layout.height <= 0.0) {
        throw MalformedLayoutError("root.dimensions must be positive");
    }

    const json& questions = requireArray(doc, "questions", "root");
    std::set<int> numbers;
    for (size_t i = 0; i < questions.size(); ++i) {
        const std::string path = indexed("root", "questions", i);
        const json& q = questions.at(i);
        requireObject(q, path);

        QuestionDef def;
        def.number  = requireInteger(requireField(q, "number", path), path + ".number");
        def.bubbles = parseBubbles(q, "option", path);
        if (!numbers.insert(def.number).second) {
            throw MalformedLayoutError(path + " duplicates question number " + std::to_string(def.number));
        }
        layout.questions.push_back(std::move(def));
    }

    const json& columns = requireArray(doc, "student_id", "root");
    std::set<int> digits;
    for (size_t i = 0; i < columns.size(); ++i) {
        const std::string path = indexed("root", "student_id", i);
        const json& c = columns.at(i);
        requireObject(c, path);

        StudentIdColumn col;
        col.digitIndex = parseDigitIndex(c, path);
        col.bubbles    = parseBubbles(c, "value", path);
        if (!digits.insert(col.digitIndex).second) {
            throw MalformedLayoutError(path + " duplicates digit_index " + std::to_string(col.digitIndex));
        }
        layout.studentIdColumns.push_back(std::move(col));
    }

    if (doc.contains("alignment_markers")) {
        const json& markers = requireArray(doc, "alignment_markers", "root");
        if (markers.size() > 4) {
            throw MalformedLayoutError("root.alignment_markers holds more than 4 markers");
        }
        for (size_t i = 0; i < markers.size(); ++i) {
            const std::string path = indexed("root", "alignment_markers", i);
            const json& m = markers.at(i);
            requireObject(m, path);

            AlignmentMarker marker;
            marker.x = requireNumber(m, "x", path);
            marker.y = requireNumber(m, "y", path);
            if (m.contains("size")) marker.size = requireNumber(m, "size", path);
            if (m.contains("type")) {
                if (!m.at("type").is_string()) {
                    throw MalformedLayoutError(path + ".type must be a string");
                }
                marker.type = m.at("type").get<std::string>();
            }
            layout.alignmentMarkers.push_back(marker);
        }
    }

    if (doc.contains("metadata") && !doc.at("metadata").is_null()) {
        const json& meta = doc.at("metadata");
        requireObject(meta, "root.metadata");
        if (meta.contains("margin") && !meta.at("margin").is_number()) {
            throw MalformedLayoutError("root.metadata.margin must be a number");
        }
        layout.metadata = meta;
    }

    return layout;
}

LayoutGuide parseLayoutGuide(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedLayoutError(std::string("failed to parse JSON: ") + e.what());
    }
    return loadLayoutGuide(doc);
}

}
