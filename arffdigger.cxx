#include <fstream>
#include <iostream>
using std::endl;

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
using std::string;

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <boost/program_options.hpp>
namespace bpo = boost::program_options;
#include <boost/property_tree/ptree.hpp>
namespace bpt = boost::property_tree;

#include "utils/config.hxx"
#include "utils/errors.hxx"
#include "inputs/dataset.hxx"
#include "inputs/dataset_builder.hxx"

using namespace arffdigger;



// Dump: print the selected features followed by the labels of every row.
void dump(const Dataset& dataset, std::ostream& output)
{
    std::vector<Feature> columns {dataset.features()};
    columns.insert(columns.end(), dataset.labels().begin(), dataset.labels().end());

    for(size_t n = 0; n < columns.size(); ++n) {
        if(n > 0) output << ",";
        output << columns[n].name;
    }
    output << endl;

    for(size_t i = 0; i < dataset.size(); ++i) {
        for(size_t n = 0; n < columns.size(); ++n) {
            if(n > 0) output << ",";
            try {
                const Cell& cell = dataset.cell(i, columns[n].name);
                output << (cell ? *cell : string("?"));
            } catch (const std::out_of_range&) {
                output << "?";  // short row
            }
        }
        output << endl;
    }
}


int main(int argc, const char *argv[])
{
    // parse command line arguments
    bpo::variables_map args = parse_cmd_args(argc, argv);
    if(args.empty()) return 0;

    // init logging and output
    FLAGS_logtostderr = 1;
    google::InitGoogleLogging(argv[0]);

    // obtain a config file (optional)
    bpt::ptree conf;
    if(args.count("config") > 0) {
        std::ifstream iconf {args["config"].as<string>()};
        CHECK(iconf.good()) << "Config file " << args["config"].as<string>() << " wasn't found";
        conf = parse_config_file(&iconf);
        CHECK(!conf.empty()) << "Error parsing the config file";
    }

    string location = args.count("source") > 0 ? args["source"].as<string>()
                                               : conf.get<string>("data.file", "");
    CHECK(!location.empty()) << "Specify a SOURCE or data.file in the config file";

    try {
        DatasetBuilder builder;
        builder.source(location);
        builder_from_config(builder, conf);

        std::shared_ptr<Dataset> dataset = builder.build();
        dataset->prepare();

        if(args.count("info") > 0 || (args.count("dump") == 0 && args.count("schema") == 0)) {
            std::cout << dataset->info() << endl;
        }
        if(args.count("dump") > 0) {
            dump(*dataset, std::cout);
        }
        if(args.count("schema") > 0) {
            std::ofstream output {args["schema"].as<string>()};
            CHECK(output.good()) << "Can't write schema record to " << args["schema"].as<string>();
            write_schema_record(output, builder.to_schema_record());
            LOG(INFO) << "Schema record written to " << args["schema"].as<string>();
        }
    } catch (const Error& ex) {
        LOG(ERROR) << ex.what();
        return 1;
    }
    return 0;
}
