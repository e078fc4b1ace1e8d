#ifndef SESSIONERRORS
#define SESSIONERRORS

#include <stdexcept>
#include <string>

// missing or empty credential set; the process cannot start
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// transient upstream failure while opening, sending or receiving
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& what) : std::runtime_error(what) {}
};

// audio device open/read/write failure
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

#endif
