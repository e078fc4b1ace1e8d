#ifndef ENVFILE
#define ENVFILE

#include <map>
#include <string>

// KEY=VALUE lines, '#' comments, optional "export " prefix and quotes
std::map<std::string, std::string> parseEnvFile(const std::string& content);

// Loads the file into the process environment without overriding variables
// that are already set. Returns false if the file cannot be read.
bool loadEnvFile(const std::string& path);

#endif
