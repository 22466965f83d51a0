#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "inputs/arff_attribute.hxx"
#include "inputs/arff_parser.hxx"
#include "utils/date_format.hxx"
#include "utils/errors.hxx"
#include "fixtures.hxx"

using namespace arffdigger;
using arffdigger::testing::data_file;


namespace {

void parse_text(ArffParser& parser, const std::string& text)
{
    std::istringstream stream {text};
    parser.parse(stream);
}

}


TEST(AttributeTest, BareName) {
    Attribute attribute = parse_attribute("@attribute width numeric");
    EXPECT_EQ(attribute.name, "width");
    EXPECT_EQ(attribute.type, NUMERIC);
    EXPECT_TRUE(attribute.date_format.empty());
}

TEST(AttributeTest, QuotedNames) {
    EXPECT_EQ(parse_attribute("@attribute 'my name' real").name, "my name");
    EXPECT_EQ(parse_attribute("@attribute \"other name\" {a,b}").name, "other name");
}

TEST(AttributeTest, TabsAndCase) {
    Attribute attribute = parse_attribute("@ATTRIBUTE\tcount\tINTEGER");
    EXPECT_EQ(attribute.name, "count");
    EXPECT_EQ(attribute.type, NUMERIC);
    EXPECT_EQ(parse_attribute("@Attribute s STRING").type, STRING);
    EXPECT_EQ(parse_attribute("@attribute c {x, y, z}").type, NOMINAL);
}

TEST(AttributeTest, DateFormats) {
    Attribute quoted = parse_attribute("@attribute d date 'yyyy-MM-dd'");
    EXPECT_EQ(quoted.type, DATE);
    EXPECT_EQ(quoted.date_format, "yyyy-MM-dd");
    EXPECT_EQ(parse_attribute("@attribute d date \"dd/MM/yyyy\"").date_format, "dd/MM/yyyy");
    EXPECT_EQ(parse_attribute("@attribute d date yyyyMMdd").date_format, "yyyyMMdd");
    EXPECT_EQ(parse_attribute("@attribute d date").date_format, DateFormat::DEFAULT_PATTERN);
}

TEST(AttributeTest, Errors) {
    EXPECT_THROW(parse_attribute("@attribute x relational"), UnsupportedAttributeType);
    EXPECT_THROW(parse_attribute("@attribute x"), UnsupportedAttributeType);
    EXPECT_THROW(parse_attribute("@attribute 'x numeric"), UnsupportedAttributeType);
    EXPECT_THROW(parse_attribute("@attribute d date 'yyyy-qq'"), InvalidDateFormat);
}

TEST(ArffParserTest, ParsesIris) {
    ArffParser parser;
    std::ifstream stream {data_file("iris.arff")};
    ASSERT_TRUE(stream.good());
    parser.parse(stream);

    EXPECT_EQ(parser.relation_name(), "iris");
    std::vector<std::string> names {"sepallength", "sepalwidth", "petallength", "petalwidth", "class"};
    EXPECT_EQ(parser.names(), names);
    std::vector<AttributeType> types {NUMERIC, NUMERIC, NUMERIC, NUMERIC, NOMINAL};
    EXPECT_EQ(parser.types(), types);
    EXPECT_EQ(parser.index_of("petallength"), 2u);

    ASSERT_EQ(parser.data().size(), 6u);
    EXPECT_EQ(*parser.data()[0][0], "5.1");
    EXPECT_EQ(*parser.data()[0][4], "Iris-setosa");
    EXPECT_EQ(*parser.data()[5][3], "1.9");
}

TEST(ArffParserTest, HeaderOnlyStopsAtData) {
    ArffParser parser;
    std::ifstream stream {data_file("iris.arff")};
    parser.parse_header(stream);

    EXPECT_EQ(parser.attributes().size(), 5u);
    EXPECT_TRUE(parser.data().empty());
}

TEST(ArffParserTest, HeaderOnlyIgnoresBrokenData) {
    ArffParser parser;
    std::ifstream stream {data_file("malformed.arff")};
    EXPECT_NO_THROW(parser.parse_header(stream));
    EXPECT_EQ(parser.attributes().size(), 2u);
}

TEST(ArffParserTest, ReuseDoesNotAccumulate) {
    ArffParser parser;
    std::ifstream iris {data_file("iris.arff")};
    parser.parse(iris);
    std::ifstream airline {data_file("airline.arff")};
    parser.parse_header(airline);

    EXPECT_EQ(parser.relation_name(), "airline passengers");
    EXPECT_EQ(parser.attributes().size(), 4u);
    EXPECT_FALSE(parser.has_attribute("sepallength"));
    EXPECT_TRUE(parser.data().empty());
}

TEST(ArffParserTest, DecodesTypedCells) {
    ArffParser parser;
    std::ifstream stream {data_file("airline.arff")};
    parser.parse(stream);

    EXPECT_EQ(parser.attributes()[0].type, DATE);
    EXPECT_EQ(parser.attributes()[2].name, "carrier name");
    ASSERT_EQ(parser.data().size(), 4u);

    EXPECT_EQ(*parser.data()[0][0], "-662688000000");
    EXPECT_EQ(*parser.data()[0][1], "112");
    EXPECT_EQ(*parser.data()[0][2], "Pan Am");
    EXPECT_EQ(*parser.data()[1][2], "Trans World's");
    EXPECT_FALSE(parser.data()[2][1]);
    EXPECT_EQ(*parser.data()[2][2], "Eastern, Inc.");
    EXPECT_FALSE(parser.data()[3][2]);
    EXPECT_EQ(*parser.data()[3][3], "spring");
}

TEST(ArffParserTest, QuestionMarkIsMissingForEveryType) {
    ArffParser parser;
    parse_text(parser,
               "@relation missing\n"
               "@attribute n numeric\n"
               "@attribute c {a,b}\n"
               "@attribute s string\n"
               "@attribute d date yyyy-MM-dd\n"
               "@data\n"
               "?,?,?,?\n"
               " ? , ? ,'?',?\n");

    ASSERT_EQ(parser.data().size(), 2u);
    for(const Cell& cell: parser.data()[0]) EXPECT_FALSE(cell);
    EXPECT_FALSE(parser.data()[1][0]);
    EXPECT_FALSE(parser.data()[1][1]);
    // a quoted question mark is a value
    ASSERT_TRUE(parser.data()[1][2]);
    EXPECT_EQ(*parser.data()[1][2], "?");
}

TEST(ArffParserTest, CommentsBlankLinesAndCase) {
    ArffParser parser;
    parse_text(parser,
               "% leading comment\n"
               "\n"
               "@RELATION \"quoted relation\"\n"
               "   \n"
               "@Attribute x NUMERIC\n"
               "% comment between attributes\n"
               "@DATA\n"
               "% comment in data\n"
               "\n"
               "1\n"
               "  2  \r\n");

    EXPECT_EQ(parser.relation_name(), "quoted relation");
    ASSERT_EQ(parser.data().size(), 2u);
    EXPECT_EQ(*parser.data()[1][0], "2");
}

TEST(ArffParserTest, LastRelationWins) {
    ArffParser parser;
    parse_text(parser, "@relation first\n@relation second\n@attribute x numeric\n@data\n");
    EXPECT_EQ(parser.relation_name(), "second");
}

TEST(ArffParserTest, RowLengthMismatch) {
    ArffParser parser;
    parse_text(parser,
               "@relation r\n"
               "@attribute a numeric\n"
               "@attribute b {x,y}\n"
               "@data\n"
               "1,x,surplus,more\n"
               "2\n"
               "3,y,\n");

    ASSERT_EQ(parser.data().size(), 3u);
    EXPECT_EQ(parser.data()[0].size(), 2u);
    EXPECT_EQ(parser.data()[1].size(), 1u);
    EXPECT_EQ(parser.data()[2].size(), 2u);
}

TEST(ArffParserTest, QuotedNumericValue) {
    ArffParser parser;
    parse_text(parser, "@relation r\n@attribute a numeric\n@data\n'5'\n1e3\n-0.5\n");
    EXPECT_EQ(*parser.data()[0][0], "5");
    EXPECT_EQ(*parser.data()[1][0], "1e3");
    EXPECT_EQ(*parser.data()[2][0], "-0.5");
}

TEST(ArffParserTest, DuplicateNameShadowsEarlierColumn) {
    ArffParser parser;
    parse_text(parser, "@relation r\n@attribute a numeric\n@attribute a {x}\n@data\n1,x\n");

    EXPECT_EQ(parser.attributes().size(), 2u);
    EXPECT_EQ(parser.index_of("a"), 1u);
    EXPECT_EQ(parser.lookup().size(), 1u);
    EXPECT_EQ(*parser.data()[0][0], "1");
}

TEST(ArffParserTest, MalformedNumericReportsLine) {
    ArffParser parser;
    std::ifstream stream {data_file("malformed.arff")};
    try {
        parser.parse(stream);
        FAIL() << "expected MalformedRow";
    } catch (const MalformedRow& ex) {
        EXPECT_EQ(ex.line(), 8u);
        EXPECT_NE(std::string(ex.what()).find("line #8"), std::string::npos);
        EXPECT_NE(ex.message().find("abc"), std::string::npos);
    }
}

TEST(ArffParserTest, MalformedNumericIsFormatError) {
    ArffParser parser;
    EXPECT_THROW(parse_text(parser, "@relation r\n@attribute a numeric\n@data\nabc\n"), FormatError);
}

TEST(ArffParserTest, MalformedDateReportsLine) {
    ArffParser parser;
    try {
        parse_text(parser, "@relation r\n@attribute d date yyyy-MM-dd\n@data\n2020-01-02\n02.01.2020\n");
        FAIL() << "expected MalformedRow";
    } catch (const MalformedRow& ex) {
        EXPECT_EQ(ex.line(), 5u);
    }
}

TEST(ArffParserTest, HeaderErrorsReportLine) {
    ArffParser parser;
    try {
        parse_text(parser, "@relation r\n@attribute x relational\n@data\n");
        FAIL() << "expected UnsupportedAttributeType";
    } catch (const UnsupportedAttributeType& ex) {
        EXPECT_EQ(ex.line(), 2u);
    }
    EXPECT_THROW(parse_text(parser, "@relation r\n@attribute d date 'yyyy-qq'\n@data\n"), InvalidDateFormat);
}

TEST(ArffParserTest, FailedParseKeepsNoRows) {
    ArffParser parser;
    EXPECT_THROW(parse_text(parser, "@relation r\n@attribute a numeric\n@data\n1\n2\nabc\n"), MalformedRow);
    EXPECT_TRUE(parser.data().empty());
    EXPECT_TRUE(parser.attributes().empty());
    EXPECT_FALSE(parser.has_attribute("a"));

    std::ifstream stream {data_file("malformed.arff")};
    EXPECT_THROW(parser.parse(stream), MalformedRow);
    EXPECT_TRUE(parser.data().empty());
    std::istringstream empty {""};
    parser.parse(empty);
    EXPECT_TRUE(parser.data().empty());
    EXPECT_TRUE(parser.attributes().empty());
}

TEST(ArffParserTest, BrokenStreamIsIOError) {
    ArffParser parser;
    std::istringstream stream {"@relation r\n"};
    stream.setstate(std::ios::badbit);
    EXPECT_THROW(parser.parse(stream), IOError);
    EXPECT_TRUE(parser.relation_name().empty());
}

TEST(ArffParserTest, DatesWithTimeZones) {
    ArffParser parser;
    parse_text(parser,
               "@relation r\n"
               "@attribute stamp date \"yyyy-MM-dd HH:mm:ss z\"\n"
               "@attribute day date yyyy-DDD\n"
               "@data\n"
               "'1970-01-01 01:00:00 GMT+01:00',1970-002\n");
    ASSERT_EQ(parser.data().size(), 1u);
    EXPECT_EQ(*parser.data()[0][0], "0");
    EXPECT_EQ(*parser.data()[0][1], "86400000");
}

TEST(ArffParserTest, UnknownColumn) {
    ArffParser parser;
    parse_text(parser, "@relation r\n@attribute a numeric\n@data\n");
    EXPECT_THROW(parser.index_of("b"), ConfigurationError);
}
