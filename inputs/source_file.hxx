#ifndef ARFFDIGGER_SOURCE_FILE

#define ARFFDIGGER_SOURCE_FILE

#include "source.hxx"

#include <boost/filesystem.hpp>
namespace bfs = boost::filesystem;


namespace arffdigger {


/**
 * ARFF file on a local filesystem. Files ending with ".gz" are decompressed on the fly.
 */
class SourceFile : public Source {

	bfs::path path_;

public:
	SourceFile(const std::string&);

	virtual std::unique_ptr<std::istream> open();
	virtual std::string location() const;

	virtual ~SourceFile() noexcept = default;

	bool compressed() const;

	/**
	* Function returns true if can handle specified pathname (plain path or file:// URL)
	*/
	static bool handles(const std::string&);
};


}

#endif
