#ifndef ARFFDIGGER_VERSION_HEADER
#define ARFFDIGGER_VERSION_HEADER

#define ARFFDIGGER_VERSION "0.3.0"

#endif
