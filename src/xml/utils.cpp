#include <ciftiaxes/xml/utils.h>

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ciftiaxes {
namespace xml {

namespace {

std::string where(const tinyxml2::XMLElement* elem)
{
  if (!elem)
    return "<unknown>";
  return "<" + std::string(elem->Name()) + "> at line " + std::to_string(elem->GetLineNum());
}

void checkQuery(tinyxml2::XMLError err, const tinyxml2::XMLElement* elem, const char* attr)
{
  if (err == tinyxml2::XML_NO_ATTRIBUTE)
    throw std::runtime_error(std::string("Missing required attribute '") + attr + "' in " + where(elem));
  if (err != tinyxml2::XML_SUCCESS)
    throw std::runtime_error(std::string("Malformed attribute '") + attr + "' in " + where(elem));
}

template <class T>
std::vector<T> parseList(const char* text, const tinyxml2::XMLElement* elem)
{
  std::vector<T> out;
  if (!text)
    return out;

  std::string s(text);
  for (auto& c : s)
    if (c == ',')
      c = ' ';

  std::istringstream iss(s);
  T value;
  while (iss >> std::ws, !iss.eof())
  {
    // also catches values out of range for T
    if (!(iss >> value))
      throw std::runtime_error("Malformed number list in " + where(elem));
    out.push_back(value);
  }
  return out;
}

}  // namespace

std::string textAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const char* value = elem->Attribute(attr);
  if (!value)
    throw std::runtime_error(std::string("Missing required attribute '") + attr + "' in " + where(elem));
  return value;
}

std::optional<std::string> textAttribute(const tinyxml2::XMLElement* elem, const char* attr)
{
  if (const char* value = elem->Attribute(attr))
    return std::string(value);
  return std::nullopt;
}

std::string childTextRequired(const tinyxml2::XMLElement* elem, const char* child)
{
  const tinyxml2::XMLElement* child_elem = elem->FirstChildElement(child);
  if (!child_elem)
    throw std::runtime_error(std::string("Missing required <") + child + "> in " + where(elem));
  const char* text = child_elem->GetText();
  return text ? text : "";
}

double doubleAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  double value = 0.0;
  checkQuery(elem->QueryDoubleAttribute(attr, &value), elem, attr);
  return value;
}

std::optional<double> doubleAttribute(const tinyxml2::XMLElement* elem, const char* attr)
{
  if (!elem->Attribute(attr))
    return std::nullopt;
  return doubleAttributeRequired(elem, attr);
}

std::int64_t int64AttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  int64_t value = 0;
  checkQuery(elem->QueryInt64Attribute(attr, &value), elem, attr);
  return value;
}

std::optional<std::int64_t> int64Attribute(const tinyxml2::XMLElement* elem, const char* attr)
{
  if (!elem->Attribute(attr))
    return std::nullopt;
  return int64AttributeRequired(elem, attr);
}

int intAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  int value = 0;
  checkQuery(elem->QueryIntAttribute(attr, &value), elem, attr);
  return value;
}

std::optional<int> intAttribute(const tinyxml2::XMLElement* elem, const char* attr)
{
  if (!elem->Attribute(attr))
    return std::nullopt;
  return intAttributeRequired(elem, attr);
}

std::vector<int> parseIntList(const char* text, const tinyxml2::XMLElement* elem)
{
  return parseList<int>(text, elem);
}

std::vector<double> parseDoubleList(const char* text, const tinyxml2::XMLElement* elem)
{
  return parseList<double>(text, elem);
}

std::string formatIntList(const std::vector<int>& values, const char* separator)
{
  std::ostringstream oss;
  for (std::size_t i = 0; i < values.size(); ++i)
  {
    if (i)
      oss << separator;
    oss << values[i];
  }
  return oss.str();
}

std::string formatDouble(double value)
{
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
  return oss.str();
}

}  // namespace xml
}  // namespace ciftiaxes
