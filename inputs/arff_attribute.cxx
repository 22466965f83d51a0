#include "arff_attribute.hxx"

#include <cstring>

#include <boost/algorithm/string.hpp>

#include "../utils/date_format.hxx"
#include "../utils/errors.hxx"
#include "../utils/string.hxx"


namespace arffdigger {


const char* KEYWORD_RELATION = "@relation";
const char* KEYWORD_ATTRIBUTE = "@attribute";
const char* KEYWORD_DATA = "@data";


Attribute parse_attribute(const std::string& line)
{
  Attribute attribute;
  std::string current = boost::algorithm::trim_copy(boost::algorithm::replace_all_copy(line, "\t", " "));
  std::string rest;

  if(!boost::algorithm::istarts_with(current, KEYWORD_ATTRIBUTE)) {
    throw UnsupportedAttributeType("Not an attribute declaration: " + line);
  }
  current = boost::algorithm::trim_copy(current.substr(std::strlen(KEYWORD_ATTRIBUTE)));
  if(current.empty()) throw UnsupportedAttributeType("Missing attribute name: " + line);

  // name is either quoted or ends with the first whitespace
  if(current[0] == '\'' || current[0] == '"') {
    size_t end = current.find(current[0], 1);
    if(end == std::string::npos) throw UnsupportedAttributeType("Unterminated attribute name: " + line);
    attribute.name = boost::algorithm::trim_copy(current.substr(1, end - 1));
    rest = current.substr(end + 1);
  } else {
    size_t end = current.find(' ');
    if(end == std::string::npos) throw UnsupportedAttributeType("Missing attribute type: " + line);
    attribute.name = current.substr(0, end);
    rest = current.substr(end);
  }
  boost::algorithm::trim(rest);

  std::string lower = boost::algorithm::to_lower_copy(rest);
  if(startswith(lower, "numeric") || startswith(lower, "real") || startswith(lower, "integer"))
    attribute.type = NUMERIC;
  else if(startswith(lower, "string"))
    attribute.type = STRING;
  else if(startswith(lower, "date"))
    attribute.type = DATE;
  else if(startswith(lower, "{"))
    attribute.type = NOMINAL;
  else
    throw UnsupportedAttributeType("Unsupported attribute: " + rest);

  if(attribute.type == DATE) {
    std::string format = boost::algorithm::trim_copy(rest.substr(4));
    if(startswith(format, "'"))
      format = unquote(format, '\'');
    else if(startswith(format, "\""))
      format = unquote(format, '"');
    if(format.empty()) format = DateFormat::DEFAULT_PATTERN;
    // compiling the pattern validates it
    DateFormat validated {format};
    attribute.date_format = validated.pattern();
  }

  return attribute;
}


}
