#ifndef ARFFDIGGER_TEST_FIXTURES
#define ARFFDIGGER_TEST_FIXTURES

#include <memory>
#include <string>

#include "inputs/source_memory.hxx"

namespace arffdigger {
namespace testing {

inline std::string data_file(const std::string& name)
{
    return std::string(ARFFDIGGER_TEST_DATA) + "/" + name;
}

inline std::shared_ptr<Source> memory(const std::string& text)
{
    return std::make_shared<SourceMemory>(text);
}

const char* const ABC_ARFF =
    "@relation abc\n"
    "@attribute a numeric\n"
    "@attribute b numeric\n"
    "@attribute c numeric\n"
    "@data\n"
    "1,2,3\n"
    "4,5,6\n";

const char* const IRIS_ROW_ARFF =
    "@relation iris\n"
    "@attribute sepallength numeric\n"
    "@attribute sepalwidth numeric\n"
    "@attribute petallength numeric\n"
    "@attribute petalwidth numeric\n"
    "@attribute class {setosa,versicolor,virginica}\n"
    "@data\n"
    "5.1,3.5,1.4,0.2,setosa\n";

}
}

#endif
