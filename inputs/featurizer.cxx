#include "featurizer.hxx"

#include <limits>

#include <boost/lexical_cast.hpp>


namespace arffdigger {


float NumericFeaturizer::featurize(const Cell& cell) const
{
  if(!cell) return std::numeric_limits<float>::quiet_NaN();
  try {
    return boost::lexical_cast<float>(*cell);
  } catch (const boost::bad_lexical_cast&) {
    // out of float range or not a number at all
    return std::numeric_limits<float>::quiet_NaN();
  }
}


void CategoricalFeaturizer::fit(const std::vector<Cell>& cells)
{
  this->indices_.clear();
  for(const Cell& cell: cells) {
    if(cell) this->indices_[*cell] = 0;
  }
  size_t index = 0;
  for(auto& entry: this->indices_) entry.second = index++;
}


float CategoricalFeaturizer::featurize(const Cell& cell) const
{
  if(!cell) return std::numeric_limits<float>::quiet_NaN();
  auto it = this->indices_.find(*cell);
  if(it == this->indices_.end()) return std::numeric_limits<float>::quiet_NaN();
  return static_cast<float>(it->second);
}


Feature numeric_feature(const std::string& name, AttributeType type)
{
  return Feature {name, type, std::make_shared<NumericFeaturizer>()};
}


Feature categorical_feature(const std::string& name, AttributeType type)
{
  return Feature {name, type, std::make_shared<CategoricalFeaturizer>()};
}


}
