#ifndef ARFFDIGGER_DATASET
#define ARFFDIGGER_DATASET

#include <memory>
#include <string>
#include <vector>

#include "arff_parser.hxx"
#include "featurizer.hxx"
#include "source.hxx"
#include "../arffdigger.hxx"


namespace arffdigger {


/**
 * Read-only view of a parsed ARFF file and the features/labels selected on it.
 * Created by DatasetBuilder::build(); the data is read by prepare().
 */
class Dataset {

	std::shared_ptr<Source> source_;
	std::vector<Feature> features_;
	std::vector<Feature> labels_;
	ArffParser parser_;
	bool prepared_ = false;

	Dataset(const Dataset&) = delete;
	Dataset(Dataset&&) = delete;

	std::vector<Cell> column(const std::string& name) const;

public:
	Dataset(std::shared_ptr<Source> source, std::vector<Feature> features, std::vector<Feature> labels);

	/**
	* Parses the whole source and fits the featurizers. Any I/O or format error propagates.
	*/
	void prepare();

	bool prepared() const {return this->prepared_;}

	// 0 until prepare() succeeded
	size_t size() const;

	// throws std::out_of_range for a bad or short row, ConfigurationError for an unknown column
	// or a dataset that isn't prepared
	const Cell& cell(size_t row, const std::string& column) const;

	const std::string& relation_name() const {return this->parser_.relation_name();}
	const std::vector<Feature>& features() const {return this->features_;}
	const std::vector<Feature>& labels() const {return this->labels_;}
	const std::vector<Attribute>& header() const {return this->parser_.attributes();}
	std::vector<std::string> column_names() const {return this->parser_.names();}
	AttributeType column_type(const std::string& name) const;

	std::shared_ptr<Source> source() const {return this->source_;}

	// relation, features and labels with their types and featurizers
	std::string info() const;
};


}

#endif
