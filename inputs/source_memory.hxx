#ifndef ARFFDIGGER_SOURCE_MEMORY

#define ARFFDIGGER_SOURCE_MEMORY

#include "source.hxx"

#include <sstream>


namespace arffdigger {


/**
 * ARFF text kept in memory. Each open() starts a new stream over the same text.
 */
class SourceMemory : public Source {

	std::string text_;
	std::string name_;

public:
	explicit SourceMemory(const std::string& text, const std::string& name = "memory") : Source(), text_(text), name_(name) {}

	virtual std::unique_ptr<std::istream> open()
	{
		return std::unique_ptr<std::istream>(new std::istringstream(this->text_));
	}

	virtual std::string location() const {return this->name_;}

	virtual ~SourceMemory() noexcept = default;
};


}

#endif
