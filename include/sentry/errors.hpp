#pragma once
#include <stdexcept>
#include <string>

namespace sentry {
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Frame rejected by the detector or renderer (empty, wrong type, size changed).
class InvalidFrame : public Error {
public:
    explicit InvalidFrame(const std::string& what) : Error("invalid frame: " + what) {}
};

// Configuration rejected at construction or load time.
class InvalidConfig : public Error {
public:
    explicit InvalidConfig(const std::string& what) : Error("invalid config: " + what) {}
};
}
