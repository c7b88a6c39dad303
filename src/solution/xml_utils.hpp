#pragma once

#include <dv_alm/core/result.hpp>

#include <tinyxml2.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace dv_alm::xml_utils {

inline std::string Attr(const tinyxml2::XMLElement* element, const char* name) {
    if (!element || !name) {
        return {};
    }
    const char* value = element->Attribute(name);
    return value ? value : "";
}

inline std::string ChildText(const tinyxml2::XMLElement* parent,
                             const char* child_name) {
    if (!parent) return "";
    const auto* child = parent->FirstChildElement(child_name);
    if (!child) return "";
    const char* text = child->GetText();
    return text ? text : "";
}

// Dataverse treats schema names case-insensitively; unpacked files mix
// "Account" and "account" for the same entity.
inline std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::optional<std::string> ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

// Load and parse an XML file. Err carries the tinyxml2 error text.
inline Result<void, Error> LoadXmlFile(tinyxml2::XMLDocument& doc,
                                       const std::filesystem::path& path,
                                       const std::string& operation,
                                       ErrorCategory category) {
    auto content = ReadFile(path);
    if (!content.has_value()) {
        return Result<void, Error>::Err(Error{
            operation, path.string(), std::nullopt, "Cannot read file",
            std::nullopt, category});
    }
    auto err = doc.Parse(content->data(), content->size());
    if (err != tinyxml2::XML_SUCCESS) {
        return Result<void, Error>::Err(Error{
            operation, path.string(), std::nullopt,
            std::string("XML parse error: ") + doc.ErrorStr(),
            std::nullopt, category});
    }
    return Result<void, Error>::Ok();
}

} // namespace dv_alm::xml_utils
