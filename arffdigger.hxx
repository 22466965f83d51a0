#ifndef ARFFDIGGER_HEADER
#define ARFFDIGGER_HEADER

#include <string>

namespace arffdigger {


	enum AttributeType {NUMERIC=0, NOMINAL, STRING, DATE};

	enum ColumnRole {FEATURE=0, LABEL, IGNORED};

	enum Shape {BATCH=0, CHANNEL, HEIGHT, WIDTH};

	std::string typeToString(AttributeType type);

	// throws ConfigurationError for an unknown name
	AttributeType typeFromString(const std::string& name);

	std::string roleToString(ColumnRole role);

}



#endif
