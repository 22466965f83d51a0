#include "source_factory.hxx"

#include "source_file.hxx"
#include "../utils/errors.hxx"


namespace arffdigger {


Source* source_factory(const std::string& location) {
	if(SourceFile::handles(location)) return new SourceFile(location);
	throw ConfigurationError("Invalid source location: '" + location + "'");
}


}
