#ifndef TEXTUTIL
#define TEXTUTIL

#include <string>

// strips leading and trailing spaces, tabs and line breaks
std::string trim(const std::string& value);

#endif
