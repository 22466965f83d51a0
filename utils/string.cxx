#include "string.hxx"
#include "errors.hxx"
#include "../arffdigger.hxx"

#include <array>
#include <utility>


namespace arffdigger {


namespace {

// `\\` must stay a candidate so an escaped backslash is never split up
const std::array<std::pair<const char*, char>, 6> ESCAPES {{
	{"\\\\", '\\'},
	{"\\'",  '\''},
	{"\\t",  '\t'},
	{"\\n",  '\n'},
	{"\\r",  '\r'},
	{"\\\"", '"'}
}};

}


bool endswith(const std::string& str, const std::string& end)
{
	if( str.length() < end.length()) return false;
	return str.compare(str.length() - end.length(), end.length(), end) == 0;
}


bool startswith(const std::string& str, const std::string& start)
{
	if( str.length() < start.length()) return false;
	return str.compare(0, start.length(), start) == 0;
}


std::string unquote(const std::string& str, char quote)
{
	if(str.length() < 2 || str.front() != quote || str.back() != quote) return str;

	std::string inner = str.substr(1, str.length() - 2);
	for(const auto& escape: ESCAPES) {
		if(inner.find(escape.first) != std::string::npos) return unescape(inner);
	}
	return inner;
}


std::string unescape(const std::string& str)
{
	std::string result;
	size_t start = 0;

	result.reserve(str.length());
	while(start < str.length())
	{
		// find the closest escape sequence
		size_t closest = std::string::npos;
		char replacement = 0;
		for(const auto& escape: ESCAPES) {
			size_t pos = str.find(escape.first, start);
			if(pos < closest) {
				closest = pos;
				replacement = escape.second;
			}
		}
		if(closest == std::string::npos) {
			result.append(str, start, std::string::npos);
			break;
		}
		result.append(str, start, closest - start);
		result.push_back(replacement);
		start = closest + 2;  // every escape sequence is two characters long
	}
	return result;
}


std::vector<std::string> split(const std::string& line, char delimiter, bool unquote,
                               char quote, bool escaped)
{
	std::vector<std::string> result;
	std::string current;
	bool quoted = false;
	bool backslash = false;

	for(char c: line)
	{
		if(c == quote) {
			if(!backslash) quoted = !quoted;
			current.push_back(c);
		} else if(c == delimiter) {
			if(quoted) {
				current.push_back(c);
			} else {
				result.push_back(unquote ? arffdigger::unquote(current, quote) : current);
				current.clear();
			}
		} else {
			current.push_back(c);
		}
		if(escaped) backslash = (c == '\\');
	}
	// a trailing delimiter doesn't produce an empty last field
	if(!current.empty()) {
		result.push_back(unquote ? arffdigger::unquote(current, quote) : current);
	}
	return result;
}


std::string typeToString(AttributeType type)
{
	switch(type)
	{
		case NUMERIC: return std::string("NUMERIC");
		case NOMINAL: return std::string("NOMINAL");
		case STRING: return std::string("STRING");
		case DATE: return std::string("DATE");
	}
	return std::string("UNKNOWN");
}


AttributeType typeFromString(const std::string& name)
{
	if(name == "NUMERIC") return NUMERIC;
	if(name == "NOMINAL") return NOMINAL;
	if(name == "STRING") return STRING;
	if(name == "DATE") return DATE;
	throw ConfigurationError("Unknown attribute type: " + name);
}


std::string roleToString(ColumnRole role)
{
	switch(role)
	{
		case FEATURE: return std::string("feature");
		case LABEL: return std::string("label");
		case IGNORED: return std::string("ignored");
	}
	return std::string("unknown");
}


}
