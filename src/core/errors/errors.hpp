#pragma once
#include <stdexcept>
#include <string>

namespace Trawl {
namespace Core {

// Raised before a crawl starts; the engine never reaches RUNNING.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {
    }
};

// A required collaborator (for example the scorer in best-first mode) is missing.
class NotConfiguredError : public ConfigurationError {
public:
    explicit NotConfiguredError(const std::string& message) : ConfigurationError(message) {
    }
};

class EngineStateError : public std::logic_error {
public:
    explicit EngineStateError(const std::string& message) : std::logic_error(message) {
    }
};

}  // namespace Core
}  // namespace Trawl
