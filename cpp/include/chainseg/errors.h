#pragma once
#include <stdexcept>
#include <string>

namespace chainseg {

class ChainsegException : public std::runtime_error {
public:
    explicit ChainsegException(const std::string& msg) : std::runtime_error(msg) {}
};

// write/fsync/rename failed: progress must not be claimed past this point
class DurabilityError : public ChainsegException {
public:
    explicit DurabilityError(const std::string& msg) : ChainsegException(msg) {}
};

// footer missing and repair did not help; needs an operator
class ShardCorruptError : public ChainsegException {
public:
    explicit ShardCorruptError(const std::string& msg) : ChainsegException(msg) {}
};

class ConfigError : public ChainsegException {
public:
    explicit ConfigError(const std::string& msg) : ChainsegException(msg) {}
};

} // namespace chainseg
