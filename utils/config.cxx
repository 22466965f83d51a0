#include "../version.hxx"
#include "config.hxx"
#include "errors.hxx"

#include <fstream>
#include <regex>
#include <sstream>

#include <glog/logging.h>

#include <boost/property_tree/json_parser.hpp>
namespace bjson = boost::property_tree::json_parser;


namespace arffdigger {


bool is_valid_args(bpo::variables_map& args) noexcept
{
    // SOURCE may be omitted, data.file of the config names it then
    if(args.count("help") > 0) return false;
    return args.count("source") > 0 || args.count("config") > 0;
}


void print_help_args(bpo::options_description& cmd_opts, std::string title) noexcept
{
    if(!title.empty()) std::cout << title << std::endl;
    std::cout << "usage: arffdigger [options] [SOURCE]" << std::endl << std::endl;
    std::cout << cmd_opts << std::endl;
}


bool has_integrity(const boost::property_tree::ptree& params) noexcept
{
    // report every problem, not just the first
    bool result = true;
    if(!params.get<std::string>("data.class", "").empty() && params.get_optional<int>("data.class_index"))
    {
        LOG(ERROR) << "use either data.class or data.class_index, not both";
        result = false;
    }
    boost::optional<const bpt::ptree&> features = params.get_child_optional("data.features");
    if(features && features->empty() && !features->data().empty() && features->data() != "all")
    {
        LOG(ERROR) << "data.features must be \"all\" or a list of regular expressions";
        result = false;
    }
    return result;
}


boost::program_options::variables_map parse_cmd_args(int argc, const char** argv) noexcept
{
    bpo::options_description visible("Command line options");
    visible.add_options()
        ("help,h", "print this message")
        ("info,i", "print relation, features and labels (default if nothing else is requested)")
        ("dump,d", "print selected features and labels of every row as CSV")
        ("schema,s", bpo::value<std::string>(), "write the schema record (JSON) of the selection to a file")
        ("config,c", bpo::value<std::string>(), "JSON config file with the column selection")
    ;

    // SOURCE is positional only, keep it out of the help listing
    bpo::options_description positional("Positional");
    positional.add_options()
        ("source", bpo::value<std::string>(), "ARFF file (optionally .gz) or file:// URL")
    ;
    bpo::positional_options_description pos_opts;
    pos_opts.add("source", 1);

    bpo::options_description all_opts;
    all_opts.add(visible).add(positional);

    bpo::variables_map args;
    try {
        bpo::store(bpo::command_line_parser(argc, argv).options(all_opts).positional(pos_opts).run(), args);
        bpo::notify(args);
    }
    catch(const bpo::error& ex) {
        print_help_args(visible, ex.what());
        return bpo::variables_map();
    }
    if(!is_valid_args(args)) {
        print_help_args(visible, std::string("ARFF-Digger version ") + ARFFDIGGER_VERSION);
        return bpo::variables_map();  // nothing to do
    }
    return args;
}


bpt::ptree parse_config_file(std::istream* iconf) noexcept
{
    bpt::ptree conf;
    try {
        bjson::read_json(*iconf, conf);
    } catch (const bjson::json_parser_error& ex) {
        LOG(ERROR) << "Invalid config file: " << ex.what();
        return bpt::ptree();
    }
    return has_integrity(conf) ? conf : bpt::ptree();
}


bpt::ptree read_schema_record(const std::string& filename)
{
    std::ifstream input {filename};
    if(!input.good()) throw ConfigurationError("Can't open schema record '" + filename + "'");
    bpt::ptree record;
    try {
        bjson::read_json(input, record);
    } catch (const bjson::json_parser_error& ex) {
        throw ConfigurationError(std::string("Invalid schema record: ") + ex.what());
    }
    return record;
}


void write_schema_record(std::ostream& output, const bpt::ptree& record)
{
    std::ostringstream json;
    bjson::write_json(json, record);

    // property_tree writes every value as a string and empty children as ""
    static const std::regex flags {"\"(dateAsNumeric|stringAsNominal)\": \"(true|false)\""};
    static const std::regex lists {"\"(features|labels)\": \"\""};
    std::string text = std::regex_replace(json.str(), flags, "\"$1\": $2");
    output << std::regex_replace(text, lists, "\"$1\": []");
}


void builder_from_config(DatasetBuilder& builder, const bpt::ptree& conf)
{
    std::string schema = conf.get<std::string>("data.schema", "");
    if(!schema.empty())
    {
        LOG(INFO) << "Using selection from schema record " << schema;
        builder.from_schema_record(read_schema_record(schema));
        return;
    }

    // options affect only later selections so they go first
    if(conf.get("options.date_as_numeric", false)) builder.date_as_numeric();
    if(conf.get("options.string_as_nominal", false)) builder.string_as_nominal();

    boost::optional<const bpt::ptree&> ignore = conf.get_child_optional("data.ignore");
    if(ignore)
        for(const auto& name: *ignore) builder.ignore_column(name.second.data());
    boost::optional<const bpt::ptree&> ignore_matching = conf.get_child_optional("data.ignore_matching");
    if(ignore_matching)
        for(const auto& regex: *ignore_matching) builder.ignore_matching(regex.second.data());

    if(!conf.get<std::string>("data.class", "").empty())
        builder.class_column(conf.get<std::string>("data.class"));
    else if(conf.get("data.class_index", -1) == -1)
        builder.class_is_last();
    else
        builder.class_index(conf.get<int>("data.class_index"));

    boost::optional<const bpt::ptree&> features = conf.get_child_optional("data.features");
    if(!features || features->data() == "all")
        builder.add_all_features();
    else
        for(const auto& regex: *features) builder.add_matching_features(regex.second.data());
}

// namespace arffdigger end
}
