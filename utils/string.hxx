#ifndef ARFFDIGGER_STRING
#define ARFFDIGGER_STRING

#include <string>
#include <vector>


namespace arffdigger {

	bool endswith(const std::string& str, const std::string& end);

	bool startswith(const std::string& str, const std::string& start);

	/**
	* Removes the surrounding quote characters (only if both are present) and
	* decodes backslash escapes of the interior if it contains any.
	*/
	std::string unquote(const std::string& str, char quote = '\'');

	/**
	* Decodes the escape sequences \\ \' \t \n \r \" in one left-to-right pass.
	*/
	std::string unescape(const std::string& str);

	/**
	* Splits a line at delimiters that are not inside quotes. A quote preceded
	* by a backslash doesn't toggle quoting if `escaped` is set. An empty field
	* at the end of the line is not returned.
	*/
	std::vector<std::string> split(const std::string& line, char delimiter, bool unquote,
	                               char quote, bool escaped);

}

#endif
