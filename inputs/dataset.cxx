#include "dataset.hxx"

#include <sstream>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include "../utils/errors.hxx"


namespace arffdigger {


Dataset::Dataset(std::shared_ptr<Source> source, std::vector<Feature> features, std::vector<Feature> labels)
  : source_(std::move(source)), features_(std::move(features)), labels_(std::move(labels))
{
  if(!this->source_) throw ConfigurationError("Dataset needs a source");
}


void Dataset::prepare()
{
  this->prepared_ = false;
  std::unique_ptr<std::istream> stream = this->source_->open();
  this->parser_.parse(*stream);

  for(Feature& feature: this->features_) feature.featurizer->fit(this->column(feature.name));
  for(Feature& label: this->labels_) label.featurizer->fit(this->column(label.name));
  this->prepared_ = true;

  LOG(INFO) << "Prepared '" << this->relation_name() << "' from " << this->source_->location()
            << " -- " << this->size() << " rows, " << this->features_.size() << " features, "
            << this->labels_.size() << " labels";
}


size_t Dataset::size() const
{
  return this->prepared_ ? this->parser_.data().size() : 0;
}


const Cell& Dataset::cell(size_t row, const std::string& column) const
{
  if(!this->prepared_) throw ConfigurationError("Dataset from " + this->source_->location() + " isn't prepared");
  size_t index = this->parser_.index_of(column);
  if(row >= this->parser_.data().size()) {
    throw std::out_of_range("Row " + std::to_string(row) + " out of range [0, " +
                            std::to_string(this->parser_.data().size()) + ")");
  }
  const Row& record = this->parser_.data()[row];
  if(index >= record.size()) {
    throw std::out_of_range("Row " + std::to_string(row) + " has no value for column '" + column + "'");
  }
  return record[index];
}


AttributeType Dataset::column_type(const std::string& name) const
{
  return this->parser_.attributes()[this->parser_.index_of(name)].type;
}


std::vector<Cell> Dataset::column(const std::string& name) const
{
  std::vector<Cell> cells;
  size_t index = this->parser_.index_of(name);
  for(const Row& row: this->parser_.data()) {
    if(index < row.size()) cells.push_back(row[index]);
  }
  return cells;
}


std::string Dataset::info() const
{
  std::ostringstream oss;
  oss << "Relation: " << this->relation_name();
  oss << "\nFeatures: " << this->features_.size();
  for(const Feature& feature: this->features_) {
    oss << "\n- " << feature.name << "/" << typeToString(feature.type) << "/" << feature.featurizer->name();
  }
  oss << "\nLabels: " << this->labels_.size();
  for(const Feature& label: this->labels_) {
    oss << "\n- " << label.name << "/" << typeToString(label.type) << "/" << label.featurizer->name();
  }
  return oss.str();
}


}
