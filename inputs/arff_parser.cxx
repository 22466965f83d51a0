#include "arff_parser.hxx"

#include <cstring>
#include <ios>
#include <utility>

#include <glog/logging.h>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "../utils/errors.hxx"
#include "../utils/string.hxx"


namespace arffdigger {


void ArffParser::reset()
{
  this->relation_name_.clear();
  this->attributes_.clear();
  this->lookup_.clear();
  this->data_.clear();
}


void ArffParser::add_attribute(const Attribute& attribute)
{
  auto previous = this->lookup_.find(attribute.name);
  if(previous != this->lookup_.end()) {
    LOG(WARNING) << "Duplicate attribute name '" << attribute.name << "': column #"
                 << previous->second << " is no longer accessible by name";
  }
  // sequence and lookup change together
  this->lookup_[attribute.name] = this->attributes_.size();
  this->attributes_.push_back(attribute);
}


void ArffParser::parse_header(std::istream& stream)
{
  this->only_header_ = true;
  this->do_parse(stream);
}


void ArffParser::parse(std::istream& stream)
{
  this->only_header_ = false;
  this->do_parse(stream);
}


void ArffParser::do_parse(std::istream& stream)
{
  State state = IN_HEADER;
  std::map<size_t, DateFormat> formats;  // per DATE column index
  std::string line;
  size_t lineno = 0;

  this->reset();

  try {
    while(std::getline(stream, line))
    {
      ++lineno;
      boost::algorithm::trim(line);
      if(line.empty() || line[0] == '%') continue;

      if(state == IN_HEADER) {
        if(boost::algorithm::istarts_with(line, KEYWORD_RELATION)) {
          std::string name = boost::algorithm::trim_copy(line.substr(std::strlen(KEYWORD_RELATION)));
          this->relation_name_ = startswith(name, "\"") ? unquote(name, '"') : unquote(name, '\'');
        } else if(boost::algorithm::istarts_with(line, KEYWORD_ATTRIBUTE)) {
          Attribute attribute = parse_attribute(line);
          if(attribute.type == DATE) {
            formats.insert(std::make_pair(this->attributes_.size(), DateFormat(attribute.date_format)));
          }
          this->add_attribute(attribute);
        } else if(boost::algorithm::istarts_with(line, KEYWORD_DATA)) {
          state = IN_DATA;
          if(this->only_header_) {
            LOG(INFO) << "Parsed header of '" << this->relation_name_ << "' -- "
                      << this->attributes_.size() << " attributes";
            return;
          }
        }
      } else {
        this->data_.push_back(this->parse_row(line, formats));
      }
    }
  } catch (Error& ex) {
    // a failed parse leaves nothing behind
    this->reset();
    if(ex.line() == 0) ex.line(lineno);
    throw;
  } catch (const std::ios_base::failure& ex) {
    this->reset();
    throw IOError(std::string("Failed to read ARFF data: ") + ex.what(), lineno + 1);
  }

  if(stream.bad()) {
    this->reset();
    throw IOError("Failed to read ARFF data", lineno + 1);
  }

  LOG(INFO) << "Parsed '" << this->relation_name_ << "' -- " << this->attributes_.size()
            << " attributes and " << this->data_.size() << " rows";
}


Row ArffParser::parse_row(const std::string& line, const std::map<size_t, DateFormat>& formats) const
{
  std::vector<std::string> cells = split(line, ',', false, '\'', true);
  Row row;

  // surplus cells are dropped, missing ones stay absent
  for(size_t i = 0; i < cells.size() && i < this->attributes_.size(); ++i)
  {
    std::string value = boost::algorithm::trim_copy(cells[i]);
    if(value == "?") {
      row.push_back(Cell());
      continue;
    }
    value = unquote(value);

    const Attribute& attribute = this->attributes_[i];
    switch(attribute.type) {
      case NUMERIC:
        try {
          boost::lexical_cast<double>(value);
        } catch (const boost::bad_lexical_cast&) {
          throw MalformedRow("Malformed numeric value '" + value + "' for attribute '" + attribute.name + "'");
        }
        row.push_back(Cell(value));
        break;
      case NOMINAL:
      case STRING:
        row.push_back(Cell(value));
        break;
      case DATE:
        try {
          row.push_back(Cell(std::to_string(formats.at(i).parse(value))));
        } catch (const FormatError& ex) {
          throw MalformedRow("Malformed date value for attribute '" + attribute.name + "': " + ex.message());
        }
        break;
      default:
        LOG(FATAL) << "Unhandled attribute type: " << static_cast<int>(attribute.type);
    }
  }
  return row;
}


std::vector<std::string> ArffParser::names() const
{
  std::vector<std::string> result;
  for(const Attribute& attribute: this->attributes_) result.push_back(attribute.name);
  return result;
}


std::vector<AttributeType> ArffParser::types() const
{
  std::vector<AttributeType> result;
  for(const Attribute& attribute: this->attributes_) result.push_back(attribute.type);
  return result;
}


bool ArffParser::has_attribute(const std::string& name) const
{
  return this->lookup_.find(name) != this->lookup_.end();
}


size_t ArffParser::index_of(const std::string& name) const
{
  auto it = this->lookup_.find(name);
  if(it == this->lookup_.end()) throw ConfigurationError("Unknown column: " + name);
  return it->second;
}


}
