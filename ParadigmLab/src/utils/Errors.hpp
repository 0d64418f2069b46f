#pragma once
#include <stdexcept>
#include <string>

// Raised before a run starts: bad digit sets, weights, counts or durations.
// Recoverable by fixing the inputs; never thrown once a run is underway.
class InvalidConfig_C : public std::runtime_error {
public:
    explicit InvalidConfig_C(const std::string& what) : std::runtime_error("InvalidConfig: " + what) {}
};
