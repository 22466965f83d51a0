#ifndef ARFFDIGGER_SOURCE_FACTORY

#define ARFFDIGGER_SOURCE_FACTORY


#include "source.hxx"
#include "source_file.hxx"


namespace arffdigger {

/**Factory pattern constructor which decides what type of location is given and wraps it.
 * Throws ConfigurationError if no source can handle the location.
*/
Source* source_factory(const std::string&);


// namespace arffdigger end
}


#endif
