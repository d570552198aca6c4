#pragma once

#include <stdexcept>
#include <string>

namespace tsimport {

class ImportException : public std::runtime_error {
public:
    explicit ImportException(const std::string& message) : std::runtime_error(message) {}
    explicit ImportException(const char* message) : std::runtime_error(message) {}
};

// Malformed input unit: protocol line, CSV row or JSON record
class ParseError : public ImportException {
public:
    explicit ParseError(const std::string& message) 
        : ImportException(message) {}
};

// Missing or contradictory schema context
class ConfigurationError : public ImportException {
public:
    explicit ConfigurationError(const std::string& message) 
        : ImportException(message) {}
};

// The remote store refused (part of) a batch
class WriteError : public ImportException {
public:
    explicit WriteError(const std::string& message) 
        : ImportException(message) {}
};

} // namespace tsimport
