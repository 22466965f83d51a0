#ifndef ARFFDIGGER_ERRORS
#define ARFFDIGGER_ERRORS

#include <cstddef>
#include <exception>
#include <string>


namespace arffdigger {


/**
 * Base of all errors raised while configuring, reading or parsing a dataset.
 * Errors raised inside a parse carry the 1-based line number (0 if unknown).
 */
class Error : public std::exception {

	std::string message_;
	std::string what_;
	size_t line_ = 0;

public:
	explicit Error(const std::string& message) : message_(message), what_(message) {}
	Error(const std::string& message, size_t line) : message_(message), what_(message)
	{
		this->line(line);
	}

	virtual ~Error() noexcept {}

	virtual const char* what() const noexcept {return this->what_.c_str();}

	const std::string& message() const noexcept {return this->message_;}
	size_t line() const noexcept {return this->line_;}

	void line(size_t line)
	{
		this->line_ = line;
		this->what_ = this->message_ + " (line #" + std::to_string(line) + ")";
	}
};


// bad source address, unresolved class column, unknown column, bad schema record
class ConfigurationError : public Error {
public:
	using Error::Error;
};


class FormatError : public Error {
public:
	using Error::Error;
};


class UnsupportedAttributeType : public FormatError {
public:
	using FormatError::FormatError;
};


class InvalidDateFormat : public FormatError {
public:
	using FormatError::FormatError;
};


// a data cell that can't be coerced to its attribute's type
class MalformedRow : public FormatError {
public:
	using FormatError::FormatError;
};


class IOError : public Error {
public:
	using Error::Error;
};


}

#endif
