#ifndef CIFTIAXES_XML_UTILS_H_
#define CIFTIAXES_XML_UTILS_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <tinyxml2.h>

namespace ciftiaxes {
namespace xml {

/// Text
std::string textAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);
std::optional<std::string> textAttribute(const tinyxml2::XMLElement* elem, const char* attr);
std::string childTextRequired(const tinyxml2::XMLElement* elem, const char* child);

/// Numbers
double doubleAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);
std::optional<double> doubleAttribute(const tinyxml2::XMLElement* elem, const char* attr);
std::int64_t int64AttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);
std::optional<std::int64_t> int64Attribute(const tinyxml2::XMLElement* elem, const char* attr);
int intAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);
std::optional<int> intAttribute(const tinyxml2::XMLElement* elem, const char* attr);

/// Whitespace and/or comma separated lists, e.g. "0,1" or "1 2 3\n4 5 6".
std::vector<int> parseIntList(const char* text, const tinyxml2::XMLElement* elem);
std::vector<double> parseDoubleList(const char* text, const tinyxml2::XMLElement* elem);

std::string formatIntList(const std::vector<int>& values, const char* separator = " ");

// 17 significant digits, so that parsing gives back the same double
std::string formatDouble(double value);

}  // namespace xml
}  // namespace ciftiaxes

#endif  // CIFTIAXES_XML_UTILS_H_
