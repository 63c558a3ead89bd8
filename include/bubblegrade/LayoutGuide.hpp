#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bubblegrade {

struct BubbleDef {
    std::string label;   // answer option or digit value
    double x = 0.0;      // logical centre, origin bottom-left
    double y = 0.0;
    double radius = 0.0;
};

struct QuestionDef {
    int number = 0;
    std::vector<BubbleDef> bubbles;
};

struct StudentIdColumn {
    int digitIndex = 0;
    std::vector<BubbleDef> bubbles;
};

// x/y is the marker's lower-left corner; the centre sits at +size/2.
struct AlignmentMarker {
    double x = 0.0;
    double y = 0.0;
    double size = 0.0;
    std::string type = "square";

    double centerX() const { return x + size / 2.0; }
    double centerY() const { return y + size / 2.0; }
};

struct LayoutGuide {
    double width = 0.0;
    double height = 0.0;
    std::vector<QuestionDef> questions;
    std::vector<StudentIdColumn> studentIdColumns;
    std::vector<AlignmentMarker> alignmentMarkers;
    nlohmann::json metadata = nlohmann::json::object();

    // metadata.margin, when the sheet was printed with a border frame.
    std::optional<double> margin() const;
};

// Strict parse of a stored layout document. Throws MalformedLayoutError.
LayoutGuide loadLayoutGuide(const nlohmann::json& doc);
LayoutGuide parseLayoutGuide(const std::string& text);

}
