#include "source_file.hxx"

#include <fstream>
#include <utility>

#include <glog/logging.h>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
namespace bio = boost::iostreams;

#include "../utils/errors.hxx"
#include "../utils/string.hxx"

namespace arffdigger {


namespace {

const std::string FILE_SCHEME = "file://";

}


SourceFile::SourceFile(const std::string& location) : Source()
{
  std::string path = startswith(location, FILE_SCHEME) ? location.substr(FILE_SCHEME.length()) : location;
  if(path.empty()) throw ConfigurationError("Invalid file path: " + location);
  try
  {
    this->path_ = bfs::absolute(bfs::path(path));
  }
  catch (const bfs::filesystem_error& ex)
  {
    throw ConfigurationError(std::string("Invalid file path: ") + location + " (" + ex.what() + ")");
  }
}


bool SourceFile::handles(const std::string& location)
{
  if(location.empty()) return false;
  if(startswith(location, FILE_SCHEME)) return true;
  // any other URL scheme needs a network client
  return location.find("://") == std::string::npos;
}


bool SourceFile::compressed() const
{
  return endswith(this->path_.string(), ".gz");
}


std::string SourceFile::location() const
{
  return this->path_.string();
}


std::unique_ptr<std::istream> SourceFile::open()
{
  boost::system::error_code ec;
  if(!bfs::is_regular_file(this->path_, ec)) {
    throw IOError("File '" + this->path_.string() + "' doesn't exist or isn't a regular file");
  }

  if(this->compressed()) {
    LOG(INFO) << "Reading gzipped " << this->path_.string();
    std::unique_ptr<bio::filtering_istream> stream {new bio::filtering_istream()};
    stream->push(bio::gzip_decompressor());
    stream->push(bio::file_source(this->path_.string(), std::ios::in | std::ios::binary));
    return std::unique_ptr<std::istream>(std::move(stream));
  }

  std::unique_ptr<std::ifstream> stream {new std::ifstream(this->path_.string(), std::ios::in)};
  if(!stream->is_open()) throw IOError("Can't open file '" + this->path_.string() + "'");
  return std::unique_ptr<std::istream>(std::move(stream));
}


}
