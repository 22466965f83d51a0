#include "date_format.hxx"
#include "errors.hxx"

#include <cctype>
#include <stdexcept>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
namespace bg = boost::gregorian;
namespace bpx = boost::posix_time;


namespace arffdigger {


namespace {

const std::string SUPPORTED_LETTERS = "GyYMLwWDdFEuaHkKhmsSzZX";
const std::string NUMERIC_LETTERS = "yYMLwWDdFuHkKhmsS";

const char* MONTHS[] = {"january", "february", "march", "april", "may", "june", "july",
                        "august", "september", "october", "november", "december"};
const char* DAYS[] = {"monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"};
const char* ERAS[] = {"bc", "ad"};

// general time zone names, minutes east of UTC
const struct {
	const char* name;
	int minutes;
} ZONES[] = {
	{"UTC", 0}, {"GMT", 0}, {"UT", 0},
	{"EST", -300}, {"EDT", -240}, {"CST", -360}, {"CDT", -300},
	{"MST", -420}, {"MDT", -360}, {"PST", -480}, {"PDT", -420},
	{"CET", 60}, {"CEST", 120}, {"EET", 120}, {"EEST", 180},
};


bool is_numeric(char letter, size_t count)
{
	if(letter == 'M' || letter == 'L') return count < 3;
	return letter != 0 && NUMERIC_LETTERS.find(letter) != std::string::npos;
}


// reads at most `width` digits (any number if width is 0)
bool read_number(const std::string& text, size_t& pos, size_t width, int& value, size_t& digits)
{
	size_t limit = width == 0 ? 9 : width;
	value = 0;
	digits = 0;
	while(pos < text.length() && digits < limit && std::isdigit(static_cast<unsigned char>(text[pos])))
	{
		value = value * 10 + (text[pos] - '0');
		++pos;
		++digits;
	}
	return digits > 0;
}


// matches a full or a three letter abbreviated name, returns its index or -1
int read_name(const std::string& text, size_t& pos, const char* const names[], size_t size)
{
	std::string rest = text.substr(pos);
	for(size_t i = 0; i < size; ++i) {
		std::string full {names[i]};
		if(boost::algorithm::istarts_with(rest, full)) {
			pos += full.length();
			return static_cast<int>(i);
		}
	}
	for(size_t i = 0; i < size; ++i) {
		std::string abbr = std::string(names[i]).substr(0, 3);
		if(boost::algorithm::istarts_with(rest, abbr)) {
			pos += abbr.length();
			return static_cast<int>(i);
		}
	}
	return -1;
}


// parses "Z", "+hh", "+hhmm" or "+hh:mm" into minutes east of UTC
bool read_offset(const std::string& text, size_t& pos, int& minutes)
{
	if(pos >= text.length()) return false;
	if(text[pos] == 'Z') {
		++pos;
		minutes = 0;
		return true;
	}
	if(text[pos] != '+' && text[pos] != '-') return false;
	int sign = text[pos] == '-' ? -1 : 1;
	int hours = 0, mins = 0;
	size_t digits = 0;
	++pos;
	if(!read_number(text, pos, 2, hours, digits) || digits != 2) return false;
	if(pos < text.length() && text[pos] == ':') ++pos;
	if(pos < text.length() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
		if(!read_number(text, pos, 2, mins, digits) || digits != 2) return false;
	}
	minutes = sign * (hours * 60 + mins);
	return true;
}


// general time zone: a zone name optionally followed by an offset ("GMT+01:00"), or an offset alone
bool read_zone(const std::string& text, size_t& pos, int& minutes)
{
	std::string rest = text.substr(pos);
	size_t longest = 0;
	for(const auto& zone: ZONES) {
		std::string name {zone.name};
		if(name.length() > longest && boost::algorithm::starts_with(rest, name)) {
			longest = name.length();
			minutes = zone.minutes;
		}
	}
	if(longest == 0) return read_offset(text, pos, minutes);

	pos += longest;
	if(minutes == 0 && pos < text.length() && (text[pos] == '+' || text[pos] == '-')) {
		return read_offset(text, pos, minutes);
	}
	return true;
}

}


const char* DateFormat::DEFAULT_PATTERN = "yyyy-MM-dd'T'HH:mm:ss";


DateFormat::DateFormat(const std::string& pattern) : pattern_(pattern)
{
	this->compile();
}


void DateFormat::compile()
{
	if(this->pattern_.empty()) throw InvalidDateFormat("Invalid date format: empty pattern");

	std::string literal;
	size_t i = 0;
	while(i < this->pattern_.length())
	{
		char c = this->pattern_[i];
		if(c == '\'') {
			// '' is a quote, anything else up to the next quote is literal text
			if(i + 1 < this->pattern_.length() && this->pattern_[i + 1] == '\'') {
				literal.push_back('\'');
				i += 2;
				continue;
			}
			size_t end = i + 1;
			bool closed = false;
			while(end < this->pattern_.length()) {
				if(this->pattern_[end] == '\'') {
					if(end + 1 < this->pattern_.length() && this->pattern_[end + 1] == '\'') {
						literal.push_back('\'');
						end += 2;
						continue;
					}
					closed = true;
					break;
				}
				literal.push_back(this->pattern_[end]);
				++end;
			}
			if(!closed) throw InvalidDateFormat("Invalid date format: unterminated quote in " + this->pattern_);
			i = end + 1;
		} else if(std::isalpha(static_cast<unsigned char>(c))) {
			if(SUPPORTED_LETTERS.find(c) == std::string::npos) {
				throw InvalidDateFormat(std::string("Invalid date format: unsupported letter '") + c +
				                        "' in " + this->pattern_);
			}
			if(!literal.empty()) {
				this->fields_.push_back(Field {0, 0, literal});
				literal.clear();
			}
			size_t count = 0;
			while(i < this->pattern_.length() && this->pattern_[i] == c) {
				++count;
				++i;
			}
			this->fields_.push_back(Field {c, count, std::string()});
		} else {
			literal.push_back(c);
			++i;
		}
	}
	if(!literal.empty()) this->fields_.push_back(Field {0, 0, literal});
}


int64_t DateFormat::parse(const std::string& text) const
{
	int year = 1970, month = 1, day = 1, hour = 0, minute = 0, second = 0, millis = 0;
	int day_of_year = 0;
	bool has_day = false, bc = false;
	int offset = 0;
	char hour_letter = 'H';
	bool pm = false;
	size_t pos = 0;

	for(size_t f = 0; f < this->fields_.size(); ++f)
	{
		const Field& field = this->fields_[f];
		if(field.letter == 0) {
			if(text.compare(pos, field.literal.length(), field.literal) != 0) {
				throw FormatError("Unparseable date: \"" + text + "\" (pattern " + this->pattern_ + ")");
			}
			pos += field.literal.length();
			continue;
		}

		bool ok = true;
		if(is_numeric(field.letter, field.count)) {
			// adjacent numeric fields are separated by their pattern width
			size_t width = 0;
			if(f + 1 < this->fields_.size() &&
			   is_numeric(this->fields_[f + 1].letter, this->fields_[f + 1].count)) {
				width = field.count;
			}
			int value = 0;
			size_t digits = 0;
			ok = read_number(text, pos, width, value, digits);
			switch(field.letter) {
				case 'y': case 'Y':
					// two digit years fall into 1970..2069
					if(field.count == 2 && digits == 2) value += value < 70 ? 2000 : 1900;
					year = value;
					break;
				case 'M': case 'L': month = value; break;
				case 'd':
					day = value;
					has_day = true;
					break;
				case 'D': day_of_year = value; break;
				case 'H': case 'k': case 'K': case 'h':
					hour = value;
					hour_letter = field.letter;
					break;
				case 'm': minute = value; break;
				case 's': second = value; break;
				case 'S': millis = value; break;
				default: break;  // w W F u don't determine the date
			}
		} else if(field.letter == 'M' || field.letter == 'L') {
			int index = read_name(text, pos, MONTHS, 12);
			ok = index >= 0;
			month = index + 1;
		} else if(field.letter == 'E') {
			ok = read_name(text, pos, DAYS, 7) >= 0;
		} else if(field.letter == 'G') {
			int index = read_name(text, pos, ERAS, 2);
			ok = index >= 0;
			bc = index == 0;
		} else if(field.letter == 'z') {
			ok = read_zone(text, pos, offset);
		} else if(field.letter == 'a') {
			std::string rest = text.substr(pos);
			if(boost::algorithm::istarts_with(rest, "am")) {
				pm = false;
				pos += 2;
			} else if(boost::algorithm::istarts_with(rest, "pm")) {
				pm = true;
				pos += 2;
			} else {
				ok = false;
			}
		} else {
			ok = read_offset(text, pos, offset);
		}
		if(!ok) throw FormatError("Unparseable date: \"" + text + "\" (pattern " + this->pattern_ + ")");
	}
	// text after the last field is ignored

	switch(hour_letter) {
		case 'k': if(hour == 24) hour = 0; break;
		case 'K': if(pm) hour += 12; break;
		case 'h': if(hour == 12) hour = 0; if(pm) hour += 12; break;
		default: break;
	}
	if(hour > 23 || minute > 59 || second > 59) {
		throw FormatError("Unparseable date: \"" + text + "\" (time out of range)");
	}

	try {
		static const bpx::ptime epoch {bg::date(1970, 1, 1)};
		if(bc) year = 1 - year;
		bg::date date = day_of_year > 0 && !has_day
		                ? bg::date(year, 1, 1) + bg::days(day_of_year - 1)
		                : bg::date(year, month, day);
		if(date.year() != year) {
			throw FormatError("Unparseable date: \"" + text + "\" (day of year out of range)");
		}
		bpx::ptime time {date,
		                 bpx::hours(hour) + bpx::minutes(minute) + bpx::seconds(second) +
		                 bpx::milliseconds(millis)};
		return (time - epoch).total_milliseconds() - int64_t(offset) * 60 * 1000;
	} catch (const std::out_of_range& ex) {
		throw FormatError("Unparseable date: \"" + text + "\" (" + ex.what() + ")");
	}
}


}
