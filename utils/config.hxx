#ifndef ARFFDIGGER_CONFIG

#define ARFFDIGGER_CONFIG


#include <iostream>
#include <string>
#include <memory>
#include <boost/program_options.hpp>
namespace bpo = boost::program_options;

#include <boost/property_tree/ptree.hpp>
namespace bpt = boost::property_tree;

#include "../arffdigger.hxx"
#include "../inputs/dataset_builder.hxx"


namespace arffdigger {

	// false for --help or when neither SOURCE nor a config file is given
	bool is_valid_args(boost::program_options::variables_map&) noexcept;

	// Parses the command line, prints the usage and returns an empty map if there is nothing to do.
	boost::program_options::variables_map parse_cmd_args(int, const char**) noexcept;

	// JSON config file, empty ptree if it can't be parsed or is inconsistent
	boost::property_tree::ptree parse_config_file(std::istream*) noexcept;

	// Reads a schema record written by DatasetBuilder::to_schema_record (throws ConfigurationError)
	boost::property_tree::ptree read_schema_record(const std::string& filename);

	/**
	* Writes a schema record as JSON with real booleans for the options and arrays for the
	* features and labels, even when those are empty.
	*/
	void write_schema_record(std::ostream& output, const bpt::ptree& record);

	/**
	* Applies the selection from a config file to the builder: options first, then ignored
	* columns, the class column(s) and finally the features. A `data.schema` record replaces
	* all of that.
	*/
	void builder_from_config(DatasetBuilder&, const bpt::ptree&);
}

#endif
