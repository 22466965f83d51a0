#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/optional/optional_io.hpp>
namespace bfs = boost::filesystem;
namespace bio = boost::iostreams;

#include "inputs/arff_parser.hxx"
#include "inputs/source_factory.hxx"
#include "inputs/source_file.hxx"
#include "inputs/source_memory.hxx"
#include "utils/errors.hxx"
#include "fixtures.hxx"

using namespace arffdigger;
using arffdigger::testing::data_file;


namespace {

std::string slurp(std::istream& stream)
{
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}


class SourceFileTest : public ::testing::Test {
protected:
    bfs::path dir_;

    virtual void SetUp()
    {
        this->dir_ = bfs::temp_directory_path() / bfs::unique_path("arffdigger-%%%%-%%%%");
        bfs::create_directories(this->dir_);
    }

    virtual void TearDown()
    {
        boost::system::error_code ec;
        bfs::remove_all(this->dir_, ec);
    }

    std::string gzip(const std::string& source, const std::string& name)
    {
        std::string target = (this->dir_ / name).string();
        std::ifstream input {source, std::ios::binary};
        bio::filtering_ostream output;
        output.push(bio::gzip_compressor());
        output.push(bio::file_sink(target, std::ios::out | std::ios::binary));
        output << input.rdbuf();
        output.reset();  // flushes and closes the file
        return target;
    }
};

}


TEST_F(SourceFileTest, OpensTwice) {
    SourceFile source {data_file("iris.arff")};
    std::unique_ptr<std::istream> first = source.open();
    std::unique_ptr<std::istream> second = source.open();
    std::string text = slurp(*first);
    EXPECT_FALSE(text.empty());
    EXPECT_EQ(slurp(*second), text);
    EXPECT_FALSE(source.compressed());
}

TEST_F(SourceFileTest, DecompressesGzip) {
    std::string gz = this->gzip(data_file("iris.arff"), "iris.arff.gz");
    SourceFile source {gz};
    EXPECT_TRUE(source.compressed());

    ArffParser plain, compressed;
    std::ifstream stream {data_file("iris.arff")};
    plain.parse(stream);
    std::unique_ptr<std::istream> unzipped = source.open();
    compressed.parse(*unzipped);

    EXPECT_EQ(compressed.relation_name(), plain.relation_name());
    EXPECT_EQ(compressed.names(), plain.names());
    EXPECT_EQ(compressed.data(), plain.data());
}

TEST_F(SourceFileTest, CorruptGzipIsIOError) {
    std::string fake = (this->dir_ / "fake.arff.gz").string();
    {
        std::ofstream output {fake};
        output << "@relation not-compressed\n@attribute a numeric\n@data\n1\n";
    }
    SourceFile source {fake};
    ArffParser parser;
    std::unique_ptr<std::istream> stream = source.open();
    EXPECT_THROW(parser.parse(*stream), IOError);
}

TEST_F(SourceFileTest, MissingFileIsIOError) {
    SourceFile source {(this->dir_ / "missing.arff").string()};
    EXPECT_THROW(source.open(), IOError);
}

TEST(SourceFactoryTest, PathsAndFileUrls) {
    std::unique_ptr<Source> path {source_factory(data_file("iris.arff"))};
    std::unique_ptr<Source> url {source_factory("file://" + data_file("iris.arff"))};
    EXPECT_EQ(url->location(), path->location());
    EXPECT_TRUE(bfs::path(path->location()).is_absolute());
}

TEST(SourceFactoryTest, RejectsUnsupportedLocations) {
    EXPECT_THROW(source_factory(""), ConfigurationError);
    EXPECT_THROW(source_factory("http://example.com/iris.arff"), ConfigurationError);
    EXPECT_THROW(source_factory("file://"), ConfigurationError);
}

TEST(SourceMemoryTest, Reopens) {
    SourceMemory source {"@relation r\n", "inline"};
    EXPECT_EQ(source.location(), "inline");
    std::unique_ptr<std::istream> first = source.open();
    EXPECT_EQ(slurp(*first), "@relation r\n");
    std::unique_ptr<std::istream> second = source.open();
    EXPECT_EQ(slurp(*second), "@relation r\n");
}
