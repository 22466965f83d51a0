#ifndef ARFFDIGGER_ARFF_ATTRIBUTE
#define ARFFDIGGER_ARFF_ATTRIBUTE

#include <string>

#include "../arffdigger.hxx"


namespace arffdigger {


	// keywords are matched case-insensitively
	extern const char* KEYWORD_RELATION;
	extern const char* KEYWORD_ATTRIBUTE;
	extern const char* KEYWORD_DATA;


	struct Attribute {
		std::string name;
		AttributeType type;
		std::string date_format;  // only for DATE attributes
	};


	/**
	* Decodes one `@attribute` declaration into name, type and date format.
	* Throws UnsupportedAttributeType or InvalidDateFormat.
	*/
	Attribute parse_attribute(const std::string& line);

}


#endif
