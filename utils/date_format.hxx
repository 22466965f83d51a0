#ifndef ARFFDIGGER_DATE_FORMAT
#define ARFFDIGGER_DATE_FORMAT

#include <cstdint>
#include <string>
#include <vector>


namespace arffdigger {


/**
 * Date pattern in the notation of ARFF date attributes (SimpleDateFormat letters).
 * All SimpleDateFormat letters are accepted. G y Y M L D d H k K h m s S a z Z X determine the
 * time; E w W F u are read and ignored. Text after the last field is ignored.
 * Dates are interpreted in UTC unless the pattern parses a time zone.
 */
class DateFormat {

	struct Field {
		char letter;          // 0 for literal text
		size_t count;         // number of repeated pattern letters
		std::string literal;
	};

	std::string pattern_;
	std::vector<Field> fields_;

	void compile();

public:
	static const char* DEFAULT_PATTERN;

	// throws InvalidDateFormat
	explicit DateFormat(const std::string& pattern);

	// Milliseconds since 1970-01-01T00:00:00Z; throws FormatError
	int64_t parse(const std::string& text) const;

	const std::string& pattern() const {return this->pattern_;}
};


}

#endif
