#include "ptr_reader.hpp"

#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <tinyxml2.h>

#include "exception/exception.hpp"

namespace tessera::ptr {

namespace {

constexpr size_t ROWS_PER_POINT = 3;

std::string trimmed(const char* text) {
    if (text == nullptr) {
        return {};
    }
    std::string value(text);
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

tinyxml2::XMLElement* requireChild(tinyxml2::XMLElement* parent,
                                   const char* name) {
    auto* child = parent->FirstChildElement(name);
    if (child == nullptr) {
        THROW_PTR_PARSE_ERROR("Missing <", name, "> inside <", parent->Name(),
                              ">");
    }
    return child;
}

tools::TimePoint requireTime(tinyxml2::XMLElement* element) {
    const auto text = trimmed(element->GetText());
    try {
        return tools::parseIsoTime(text);
    } catch (const InvalidParameter&) {
        THROW_PTR_PARSE_ERROR("Bad time in <", element->Name(), ">: ", text);
    }
}

double parseNumber(const std::string& text, const char* element) {
    try {
        size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            THROW_PTR_PARSE_ERROR("Trailing characters in <", element, ">: ",
                                  text);
        }
        return value;
    } catch (const std::invalid_argument&) {
        THROW_PTR_PARSE_ERROR("Not a number in <", element, ">: ", text);
    } catch (const std::out_of_range&) {
        THROW_PTR_PARSE_ERROR("Number out of range in <", element, ">: ", text);
    }
}

std::vector<double> parseTable(tinyxml2::XMLElement* element) {
    std::vector<double> values;
    std::istringstream stream(trimmed(element->GetText()));
    std::string token;
    while (stream >> token) {
        values.push_back(parseNumber(token, element->Name()));
    }
    return values;
}

}  // namespace

double PtrBlock::value(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        THROW_PTR_PARSE_ERROR("Block has no field ", name);
    }
    return it->second;
}

std::vector<geometry::Point> PtrBlock::customPoints() const {
    if (xAngles.size() != yAngles.size() ||
        xAngles.size() % ROWS_PER_POINT != 0) {
        THROW_PTR_PARSE_ERROR("Custom angle tables have mismatched sizes ",
                              xAngles.size(), " and ", yAngles.size());
    }
    std::vector<geometry::Point> points;
    for (size_t i = 0; i < xAngles.size(); i += ROWS_PER_POINT) {
        points.push_back({xAngles[i], yAngles[i]});
    }
    return points;
}

PtrBlock parseBlock(std::string_view text) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(text.data(), text.size()) != tinyxml2::XML_SUCCESS) {
        THROW_PTR_PARSE_ERROR("Malformed PTR: ", doc.ErrorStr());
    }

    auto* block = doc.FirstChildElement("block");
    if (block == nullptr) {
        THROW_PTR_PARSE_ERROR("Missing <block> element");
    }

    PtrBlock result;
    result.startTime = requireTime(requireChild(block, "startTime"));
    result.endTime = requireTime(requireChild(block, "endTime"));

    auto* attitude = requireChild(block, "attitude");
    const char* target = requireChild(attitude, "target")->Attribute("ref");
    if (target == nullptr) {
        THROW_PTR_PARSE_ERROR("<target> has no ref attribute");
    }
    result.target = target;

    auto* offset = requireChild(attitude, "offsetAngles");
    const char* ref = offset->Attribute("ref");
    if (ref == nullptr) {
        THROW_PTR_PARSE_ERROR("<offsetAngles> has no ref attribute");
    }
    result.offsetRef = ref;

    for (auto* field = offset->FirstChildElement(); field != nullptr;
         field = field->NextSiblingElement()) {
        const std::string name = field->Name();
        if (name == "startTime") {
            result.offsetStartTime = requireTime(field);
        } else if (name == "deltaTimes") {
            result.deltaTimes = parseTable(field);
        } else if (name == "xAngles") {
            result.xAngles = parseTable(field);
            for (double& x : result.xAngles) {
                x = -x;
            }
        } else if (name == "yAngles") {
            result.yAngles = parseTable(field);
        } else if (name == "xRates" || name == "yRates" ||
                   name == "lineAxis" || name == "keepLineDir") {
            continue;
        } else {
            result.values[name] = parseNumber(trimmed(field->GetText()),
                                              field->Name());
            if (const char* units = field->Attribute("units")) {
                result.units[name] = units;
            }
        }
    }

    if (result.offsetRef == "scan") {
        for (const char* name : {"xStart", "lineDelta"}) {
            if (auto it = result.values.find(name); it != result.values.end()) {
                it->second = -it->second;
            }
        }
    }

    SPDLOG_DEBUG("Parsed PTR block: target={}, offset={}, {} fields",
                 result.target, result.offsetRef, result.values.size());
    return result;
}

}  // namespace tessera::ptr
