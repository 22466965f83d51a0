#ifndef ARFFDIGGER_FEEDER
#define ARFFDIGGER_FEEDER

#include <string>
#include <memory>
#include <vector>

#include "dataset.hxx"
#include "../arffdigger.hxx"


namespace arffdigger {

/**
* Flattens a prepared dataset into row-major float buffers using the columns' featurizers.
* There is one row per sample and one column per feature (data) or label (labels).
*/
class Feeder
{
	Feeder(const Feeder&) = delete;
	Feeder(Feeder&&) = delete;

	std::shared_ptr<Dataset> dataset_;
	std::vector<float> data_;
	std::vector<float> labels_;
	bool fetched_ = false;

	void prefetch_data();

	public:

	explicit Feeder(std::shared_ptr<Dataset> dataset);

	/**
	* Return data/label/num so it can be fed into a training loop
	*/
	const float* data();
	const float* labels();
	size_t nums(Shape shape = BATCH);
	size_t label_width() const {return this->dataset_->labels().size();}

	virtual ~Feeder() {}

};


}

#endif
