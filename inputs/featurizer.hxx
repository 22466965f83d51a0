#ifndef ARFFDIGGER_FEATURIZER
#define ARFFDIGGER_FEATURIZER

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "arff_parser.hxx"
#include "../arffdigger.hxx"


namespace arffdigger {


/**
* Turns the decoded string of one cell into a number the training pipeline can consume.
*/
class Featurizer
{
	Featurizer(const Featurizer&) = delete;
	Featurizer(Featurizer&&) = delete;

	protected:

	Featurizer() = default;

	public:

	virtual std::string name() const = 0;

	/**
	* Learns whatever the encoding needs from all cells of the column.
	*/
	virtual void fit(const std::vector<Cell>& cells) = 0;

	// missing values are encoded as NaN
	virtual float featurize(const Cell& cell) const = 0;

	virtual ~Featurizer() {}
};


class NumericFeaturizer : public Featurizer {

public:
	NumericFeaturizer() = default;

	virtual std::string name() const {return "NumericFeaturizer";}
	virtual void fit(const std::vector<Cell>&) {}
	virtual float featurize(const Cell& cell) const;
};


// index of the value among the sorted distinct values seen by fit()
class CategoricalFeaturizer : public Featurizer {

	std::map<std::string, size_t> indices_;

public:
	CategoricalFeaturizer() = default;

	virtual std::string name() const {return "CategoricalFeaturizer";}
	virtual void fit(const std::vector<Cell>& cells);
	virtual float featurize(const Cell& cell) const;

	size_t size() const {return this->indices_.size();}
};


/**
* A column selected as feature or label, together with its encoder.
*/
struct Feature {
	std::string name;
	AttributeType type;
	std::shared_ptr<Featurizer> featurizer;

	bool numeric() const {return std::dynamic_pointer_cast<NumericFeaturizer>(this->featurizer) != nullptr;}
};


Feature numeric_feature(const std::string& name, AttributeType type);

Feature categorical_feature(const std::string& name, AttributeType type);


}

#endif
