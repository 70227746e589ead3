#pragma once
#include <stdexcept>
#include <string>

// Non-positive vocab size / embedding dim, or a tensor that doesn't fit the config.
class InvalidDimensionError : public std::invalid_argument {
public:
    explicit InvalidDimensionError(const std::string& what) : std::invalid_argument(what) {}
};

// Something needed to reduce (softmax, mean) over zero tokens.
class EmptyInputError : public std::runtime_error {
public:
    explicit EmptyInputError(const std::string& what) : std::runtime_error(what) {}
};
