#ifndef ARFFDIGGER_DATASET_BUILDER
#define ARFFDIGGER_DATASET_BUILDER

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
namespace bpt = boost::property_tree;

#include "arff_parser.hxx"
#include "dataset.hxx"
#include "featurizer.hxx"
#include "source.hxx"
#include "../arffdigger.hxx"


namespace arffdigger {


/**
 * Selects which columns of an ARFF file become features, labels or get ignored.
 *
 * Column names and types come from a header-only parse of the source, done at most once
 * per source. If that parse fails the builder simply knows no columns. All calls are
 * order sensitive: ignoring a column or changing a policy only affects later selections.
 */
class DatasetBuilder {

	std::shared_ptr<Source> source_;
	std::unique_ptr<ArffParser> parser_;  // cached header
	bool header_read_ = false;

	std::set<std::string> class_columns_;
	std::set<std::string> ignored_columns_;
	std::set<std::string> matching_features_added_;
	bool all_features_added_ = false;
	bool date_as_numeric_ = false;
	bool string_as_nominal_ = false;

	std::vector<Feature> features_;
	std::vector<Feature> labels_;

	DatasetBuilder(const DatasetBuilder&) = delete;
	DatasetBuilder(DatasetBuilder&&) = delete;

	// nullptr if the header isn't available
	const ArffParser* header();
	const ArffParser& require_header(const std::string& purpose);

	bool is_class_column(const std::string& name) const;
	bool is_selected(const std::string& name) const;
	// encoder for the type under the current options, none if the column stays ignored
	boost::optional<Feature> encode_column(const std::string& name, AttributeType type) const;
	void add_column(const std::string& name, AttributeType type);
	// declared type of an explicitly added column, throws ConfigurationError if the header lacks it
	AttributeType explicit_type(const std::string& name, AttributeType fallback);
	void select(const Feature& column);
	void add_feature(const Feature& feature);
	void add_label(const Feature& label);

public:
	DatasetBuilder() = default;

	// file path, file:// URL, optionally gzipped
	DatasetBuilder& source(const std::string& location);
	DatasetBuilder& source(std::shared_ptr<Source> source);

	DatasetBuilder& ignore_column(const std::string& name);
	DatasetBuilder& ignore_columns(const std::vector<std::string>& names);
	DatasetBuilder& ignore_matching(const std::string& regex);

	DatasetBuilder& class_column(const std::string& name);
	DatasetBuilder& class_columns(const std::vector<std::string>& names);
	DatasetBuilder& class_index(int index);
	DatasetBuilder& class_is_first();
	DatasetBuilder& class_is_last();

	DatasetBuilder& date_as_numeric();
	DatasetBuilder& string_as_nominal();

	DatasetBuilder& add_all_features();
	DatasetBuilder& add_matching_features(const std::string& regex);

	DatasetBuilder& add_numeric_feature(const std::string& name);
	DatasetBuilder& add_categorical_feature(const std::string& name);
	DatasetBuilder& add_numeric_label(const std::string& name);
	DatasetBuilder& add_categorical_label(const std::string& name);

	/**
	* {source, options: {dateAsNumeric, stringAsNominal}, features: [{name, type}], labels: [...]}
	*/
	bpt::ptree to_schema_record() const;

	/**
	* Replays an exported selection. Every listed column must exist in the source's header
	* with the same type. The record's source is used only if none is set yet.
	*/
	DatasetBuilder& from_schema_record(const bpt::ptree& record);

	std::vector<std::string> column_names();
	boost::optional<AttributeType> column_type(const std::string& name);
	ColumnRole role(const std::string& name) const;

	const std::vector<Feature>& features() const {return this->features_;}
	const std::vector<Feature>& labels() const {return this->labels_;}
	std::shared_ptr<Source> source() const {return this->source_;}

	std::shared_ptr<Dataset> build() const;
};


}

#endif
