#ifndef ARFFDIGGER_ARFF_PARSER
#define ARFFDIGGER_ARFF_PARSER

#include <istream>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "arff_attribute.hxx"
#include "../utils/date_format.hxx"
#include "../arffdigger.hxx"


namespace arffdigger {


// an empty cell is a missing value ("?")
typedef boost::optional<std::string> Cell;
typedef std::vector<Cell> Row;


/**
 * Reads ARFF text into a header (relation, attributes) and a table of decoded
 * cells. Every parse starts from scratch, so one parser can be reused.
 *
 * NUMERIC cells keep their text once it is validated as a number; DATE cells
 * are stored as epoch milliseconds (UTC unless the pattern holds an offset).
 */
class ArffParser {

	enum State {IN_HEADER=0, IN_DATA};

	bool only_header_ = false;
	std::string relation_name_;
	std::vector<Attribute> attributes_;
	std::map<std::string, size_t> lookup_;
	std::vector<Row> data_;

	void reset();
	void add_attribute(const Attribute& attribute);
	void do_parse(std::istream& stream);
	Row parse_row(const std::string& line, const std::map<size_t, DateFormat>& formats) const;

public:
	ArffParser() = default;

	ArffParser(const ArffParser&) = delete;
	ArffParser& operator=(const ArffParser&) = delete;

	// stops at the @data marker
	void parse_header(std::istream& stream);
	void parse(std::istream& stream);

	const std::string& relation_name() const {return this->relation_name_;}
	const std::vector<Attribute>& attributes() const {return this->attributes_;}
	const std::map<std::string, size_t>& lookup() const {return this->lookup_;}
	const std::vector<Row>& data() const {return this->data_;}

	std::vector<std::string> names() const;
	std::vector<AttributeType> types() const;

	bool has_attribute(const std::string& name) const;

	// throws ConfigurationError for unknown names
	size_t index_of(const std::string& name) const;
};


}

#endif
