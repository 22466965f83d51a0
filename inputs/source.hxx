#ifndef ARFFDIGGER_SOURCE

#define ARFFDIGGER_SOURCE

#include <istream>
#include <memory>
#include <string>

#include "../arffdigger.hxx"


namespace arffdigger {


/**
 * An abstract class representing a re-openable resource holding ARFF text. So in practice it
 * can be a file, a gzipped file or a string in memory.
 *
 * A dataset reads its source twice: the builder reads the header while it is configured
 * and the dataset parses everything when prepared. Every call to open() must therefore
 * return a fresh stream positioned at the beginning.
 */
class Source {

protected:
    Source() = default; // it's an abstract class - disallow public construction

    Source(const Source&) = delete;      // we will NOT define copy constructor
    Source(Source&&)      = delete;      // we will NOT define move constructor

public:

    virtual ~Source() noexcept    = default;

    // throws IOError if the resource can't be opened
    virtual std::unique_ptr<std::istream> open() = 0;

    virtual std::string location() const = 0;
};


// namespace arffdigger end
}


#endif
