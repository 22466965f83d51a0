#include "dataset_builder.hxx"

#include <algorithm>
#include <array>
#include <ios>
#include <regex>
#include <utility>

#include <glog/logging.h>

#include "source_factory.hxx"
#include "../utils/errors.hxx"


namespace arffdigger {


namespace {

std::regex compile_regex(const std::string& regex)
{
  try {
    return std::regex(regex);
  } catch (const std::regex_error& ex) {
    throw ConfigurationError("Invalid regular expression '" + regex + "': " + ex.what());
  }
}


bool contains(const std::vector<Feature>& columns, const std::string& name)
{
  return std::any_of(columns.begin(), columns.end(),
                     [&name](const Feature& column) {return column.name == name;});
}

}


DatasetBuilder& DatasetBuilder::source(const std::string& location)
{
  return this->source(std::shared_ptr<Source>(source_factory(location)));
}


DatasetBuilder& DatasetBuilder::source(std::shared_ptr<Source> source)
{
  if(!source) throw ConfigurationError("Source must not be empty");
  this->source_ = std::move(source);
  this->parser_.reset();
  this->header_read_ = false;
  return *this;
}


const ArffParser* DatasetBuilder::header()
{
  if(this->header_read_ || !this->source_) return this->parser_.get();

  // the header read only answers configuration queries, failures just leave us without a header
  this->header_read_ = true;
  try {
    std::unique_ptr<std::istream> stream = this->source_->open();
    std::unique_ptr<ArffParser> parser {new ArffParser()};
    parser->parse_header(*stream);
    this->parser_ = std::move(parser);
  } catch (const Error& ex) {
    LOG(WARNING) << "No header information for " << this->source_->location() << ": " << ex.what();
  } catch (const std::ios_base::failure& ex) {
    LOG(WARNING) << "No header information for " << this->source_->location() << ": " << ex.what();
  }
  return this->parser_.get();
}


const ArffParser& DatasetBuilder::require_header(const std::string& purpose)
{
  const ArffParser* parser = this->header();
  if(parser == nullptr) {
    throw ConfigurationError("Can't resolve " + purpose + ": no header information available" +
                             (this->source_ ? " for " + this->source_->location() : std::string(" (no source)")));
  }
  return *parser;
}


bool DatasetBuilder::is_class_column(const std::string& name) const
{
  return this->class_columns_.count(name) > 0;
}


bool DatasetBuilder::is_selected(const std::string& name) const
{
  return contains(this->features_, name) || contains(this->labels_, name);
}


boost::optional<Feature> DatasetBuilder::encode_column(const std::string& name, AttributeType type) const
{
  switch(type) {
    case NUMERIC:
      return numeric_feature(name, type);
    case DATE:
      if(this->date_as_numeric_) return numeric_feature(name, type);
      return boost::none;
    case NOMINAL:
      return categorical_feature(name, type);
    case STRING:
      if(this->string_as_nominal_) return categorical_feature(name, type);
      return boost::none;
  }
  LOG(FATAL) << "Unhandled attribute type: " << static_cast<int>(type);
  return boost::none;
}


void DatasetBuilder::add_column(const std::string& name, AttributeType type)
{
  if(this->ignored_columns_.count(name) > 0) return;
  boost::optional<Feature> column = this->encode_column(name, type);
  if(column) this->select(*column);
}


void DatasetBuilder::select(const Feature& column)
{
  if(this->is_class_column(column.name))
    this->add_label(column);
  else
    this->add_feature(column);
}


void DatasetBuilder::add_feature(const Feature& feature)
{
  if(this->is_selected(feature.name)) return;
  this->features_.push_back(feature);
}


void DatasetBuilder::add_label(const Feature& label)
{
  this->class_columns_.insert(label.name);
  if(contains(this->labels_, label.name)) return;

  auto feature = std::find_if(this->features_.begin(), this->features_.end(),
                              [&label](const Feature& column) {return column.name == label.name;});
  if(feature != this->features_.end()) {
    LOG(INFO) << "Column '" << label.name << "' was a feature, using it as label";
    this->features_.erase(feature);
  }
  this->labels_.push_back(label);
}


DatasetBuilder& DatasetBuilder::ignore_column(const std::string& name)
{
  this->ignored_columns_.insert(name);
  return *this;
}


DatasetBuilder& DatasetBuilder::ignore_columns(const std::vector<std::string>& names)
{
  for(const std::string& name: names) this->ignore_column(name);
  return *this;
}


DatasetBuilder& DatasetBuilder::ignore_matching(const std::string& regex)
{
  std::regex re = compile_regex(regex);
  const ArffParser* parser = this->header();
  if(parser == nullptr) return *this;

  for(const Attribute& attribute: parser->attributes()) {
    if(std::regex_match(attribute.name, re)) this->ignore_column(attribute.name);
  }
  return *this;
}


DatasetBuilder& DatasetBuilder::class_column(const std::string& name)
{
  if(this->is_class_column(name)) return *this;

  const ArffParser& parser = this->require_header("class column '" + name + "'");
  if(!parser.has_attribute(name)) throw ConfigurationError("Unknown class column: " + name);

  this->class_columns_.insert(name);
  this->add_column(name, parser.attributes()[parser.index_of(name)].type);
  return *this;
}


DatasetBuilder& DatasetBuilder::class_columns(const std::vector<std::string>& names)
{
  for(const std::string& name: names) this->class_column(name);
  return *this;
}


DatasetBuilder& DatasetBuilder::class_index(int index)
{
  const ArffParser& parser = this->require_header("class index " + std::to_string(index));
  int count = static_cast<int>(parser.attributes().size());
  if(index < 0 || index >= count) {
    throw ConfigurationError("Class index " + std::to_string(index) + " out of range [0, " +
                             std::to_string(count) + ")");
  }
  return this->class_column(parser.attributes()[index].name);
}


DatasetBuilder& DatasetBuilder::class_is_first()
{
  return this->class_index(0);
}


DatasetBuilder& DatasetBuilder::class_is_last()
{
  const ArffParser& parser = this->require_header("last class column");
  return this->class_index(static_cast<int>(parser.attributes().size()) - 1);
}


DatasetBuilder& DatasetBuilder::date_as_numeric()
{
  this->date_as_numeric_ = true;
  return *this;
}


DatasetBuilder& DatasetBuilder::string_as_nominal()
{
  this->string_as_nominal_ = true;
  return *this;
}


DatasetBuilder& DatasetBuilder::add_all_features()
{
  if(this->all_features_added_) return *this;
  this->all_features_added_ = true;

  const ArffParser* parser = this->header();
  if(parser == nullptr) {
    LOG(WARNING) << "Can't add features, no header information available";
    return *this;
  }
  for(const Attribute& attribute: parser->attributes()) {
    if(this->is_class_column(attribute.name)) continue;
    this->add_column(attribute.name, attribute.type);
  }
  return *this;
}


DatasetBuilder& DatasetBuilder::add_matching_features(const std::string& regex)
{
  if(this->matching_features_added_.count(regex) > 0) return *this;
  std::regex re = compile_regex(regex);
  this->matching_features_added_.insert(regex);

  const ArffParser* parser = this->header();
  if(parser == nullptr) {
    LOG(WARNING) << "Can't add features matching '" << regex << "', no header information available";
    return *this;
  }
  for(const Attribute& attribute: parser->attributes()) {
    if(this->is_class_column(attribute.name)) continue;
    if(std::regex_match(attribute.name, re)) this->add_column(attribute.name, attribute.type);
  }
  return *this;
}


AttributeType DatasetBuilder::explicit_type(const std::string& name, AttributeType fallback)
{
  const ArffParser* parser = this->header();
  if(parser == nullptr) return fallback;
  if(!parser->has_attribute(name)) {
    throw ConfigurationError("Unknown column '" + name + "' in " + this->source_->location());
  }
  return parser->attributes()[parser->index_of(name)].type;
}


DatasetBuilder& DatasetBuilder::add_numeric_feature(const std::string& name)
{
  this->add_feature(numeric_feature(name, this->explicit_type(name, NUMERIC)));
  return *this;
}


DatasetBuilder& DatasetBuilder::add_categorical_feature(const std::string& name)
{
  this->add_feature(categorical_feature(name, this->explicit_type(name, NOMINAL)));
  return *this;
}


DatasetBuilder& DatasetBuilder::add_numeric_label(const std::string& name)
{
  this->add_label(numeric_feature(name, this->explicit_type(name, NUMERIC)));
  return *this;
}


DatasetBuilder& DatasetBuilder::add_categorical_label(const std::string& name)
{
  this->add_label(categorical_feature(name, this->explicit_type(name, NOMINAL)));
  return *this;
}


bpt::ptree DatasetBuilder::to_schema_record() const
{
  bpt::ptree record, features, labels;

  record.put("source", this->source_ ? this->source_->location() : std::string());
  record.put("options.dateAsNumeric", this->date_as_numeric_);
  record.put("options.stringAsNominal", this->string_as_nominal_);

  for(const Feature& feature: this->features_) {
    bpt::ptree entry;
    entry.put("name", feature.name);
    entry.put("type", typeToString(feature.type));
    features.push_back(std::make_pair("", entry));
  }
  for(const Feature& label: this->labels_) {
    bpt::ptree entry;
    entry.put("name", label.name);
    entry.put("type", typeToString(label.type));
    labels.push_back(std::make_pair("", entry));
  }
  record.add_child("features", features);
  record.add_child("labels", labels);
  return record;
}


DatasetBuilder& DatasetBuilder::from_schema_record(const bpt::ptree& record)
{
  try {
    if(!this->source_) {
      std::string location = record.get<std::string>("source", "");
      if(!location.empty()) this->source(location);
    }
    if(record.get<bool>("options.dateAsNumeric", false)) this->date_as_numeric();
    if(record.get<bool>("options.stringAsNominal", false)) this->string_as_nominal();

    const ArffParser& parser = this->require_header("schema record");
    std::array<std::pair<const char*, bool>, 2> sections {{{"features", false}, {"labels", true}}};
    for(const auto& section: sections)
    {
      boost::optional<const bpt::ptree&> entries = record.get_child_optional(section.first);
      if(!entries) continue;
      for(const auto& entry: *entries) {
        std::string name = entry.second.get<std::string>("name");
        AttributeType type = typeFromString(entry.second.get<std::string>("type"));
        if(!parser.has_attribute(name)) {
          throw ConfigurationError("Column '" + name + "' of the schema record not found in " +
                                   this->source_->location());
        }
        AttributeType actual = parser.attributes()[parser.index_of(name)].type;
        if(actual != type) {
          throw ConfigurationError("Column '" + name + "' is " + typeToString(actual) +
                                   " but the schema record expects " + typeToString(type));
        }
        // listed columns bypass ignore lists, regular expressions and the type options
        if(section.second) this->class_columns_.insert(name);
        this->select(type == NUMERIC || type == DATE ? numeric_feature(name, type)
                                                     : categorical_feature(name, type));
      }
    }
  } catch (const bpt::ptree_error& ex) {
    throw ConfigurationError(std::string("Invalid schema record: ") + ex.what());
  }
  return *this;
}


std::vector<std::string> DatasetBuilder::column_names()
{
  const ArffParser* parser = this->header();
  if(parser == nullptr) return std::vector<std::string>();
  return parser->names();
}


boost::optional<AttributeType> DatasetBuilder::column_type(const std::string& name)
{
  const ArffParser* parser = this->header();
  if(parser == nullptr || !parser->has_attribute(name)) return boost::none;
  return parser->attributes()[parser->index_of(name)].type;
}


ColumnRole DatasetBuilder::role(const std::string& name) const
{
  if(contains(this->labels_, name)) return LABEL;
  if(contains(this->features_, name)) return FEATURE;
  return IGNORED;
}


std::shared_ptr<Dataset> DatasetBuilder::build() const
{
  if(!this->source_) throw ConfigurationError("No source set for the dataset");

  // every dataset gets its own featurizers
  std::vector<Feature> features, labels;
  for(const Feature& feature: this->features_) {
    features.push_back(feature.numeric() ? numeric_feature(feature.name, feature.type)
                                         : categorical_feature(feature.name, feature.type));
  }
  for(const Feature& label: this->labels_) {
    labels.push_back(label.numeric() ? numeric_feature(label.name, label.type)
                                     : categorical_feature(label.name, label.type));
  }
  return std::make_shared<Dataset>(this->source_, features, labels);
}


}
