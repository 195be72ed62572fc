#pragma once

#include <stdexcept>
#include <string>

// Caller broke an ordering or usage rule (wrong phase, spent ability, ...).
// Never retried: the same call on the same state fails the same way.
class PreconditionViolation : public std::logic_error {
public:
    explicit PreconditionViolation(const std::string& what) : std::logic_error(what) {}
};

// A roll value or an entropy slot the operation depends on was not supplied.
class MissingInput : public std::runtime_error {
public:
    explicit MissingInput(const std::string& what) : std::runtime_error(what) {}
};
