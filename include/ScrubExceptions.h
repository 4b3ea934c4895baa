#ifndef SCRUB_EXCEPTIONS_H
#define SCRUB_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Scrub {

class ScrubException : public std::runtime_error {
public:
    explicit ScrubException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public ScrubException {
public:
    explicit IOException(const std::string& message) : ScrubException("IO Error: " + message) {}
};

class DatasetException : public ScrubException {
public:
    explicit DatasetException(const std::string& message) : ScrubException("Dataset Error: " + message) {}
};

class ConfigurationException : public ScrubException {
public:
    explicit ConfigurationException(const std::string& message) : ScrubException("Config Error: " + message) {}
};

} // namespace Scrub

#endif // SCRUB_EXCEPTIONS_H
