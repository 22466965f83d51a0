#include "feeder.hxx"

#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include "../utils/errors.hxx"


namespace arffdigger {


Feeder::Feeder(std::shared_ptr<Dataset> dataset) : dataset_(std::move(dataset))
{
  if(!this->dataset_) throw ConfigurationError("Feeder needs a dataset");
}


const float* Feeder::data()
{
  if(!this->fetched_) this->prefetch_data();
  return this->data_.data();
}


const float* Feeder::labels()
{
  if(!this->fetched_) this->prefetch_data();
  return this->labels_.data();
}


size_t Feeder::nums(Shape shape)
{
  switch(shape) {
    case BATCH:
      return this->dataset_->size();
    case CHANNEL:
    case HEIGHT:
      return 1;
    case WIDTH:
      return this->dataset_->features().size();
  }
  return 0;
}


void Feeder::prefetch_data()
{
  if(this->fetched_) return;  // data already loaded
  if(!this->dataset_->prepared()) this->dataset_->prepare();

  const std::vector<Feature>& features = this->dataset_->features();
  const std::vector<Feature>& labels = this->dataset_->labels();
  size_t rows = this->dataset_->size();
  size_t incomplete = 0;
  const Cell missing;

  this->data_.clear();
  this->labels_.clear();
  this->data_.reserve(rows * features.size());
  this->labels_.reserve(rows * labels.size());

  // short rows are kept, absent cells encode like missing values
  for(size_t rowi = 0; rowi < rows; ++rowi)
  {
    bool complete = true;
    for(const Feature& feature: features) {
      try {
        this->data_.push_back(feature.featurizer->featurize(this->dataset_->cell(rowi, feature.name)));
      } catch (const std::out_of_range&) {
        this->data_.push_back(feature.featurizer->featurize(missing));
        complete = false;
      }
    }
    for(const Feature& label: labels) {
      try {
        this->labels_.push_back(label.featurizer->featurize(this->dataset_->cell(rowi, label.name)));
      } catch (const std::out_of_range&) {
        this->labels_.push_back(label.featurizer->featurize(missing));
        complete = false;
      }
    }
    if(!complete) ++incomplete;
  }
  this->fetched_ = true;

  LOG(INFO) << "Processed " << features.size() << " feature cols, " << labels.size()
            << " label cols and " << rows << " rows (" << incomplete << " incomplete)";
}


}
