#pragma once
#include "core/Common.hpp"

// Thrown by the abstract PathFinder when no concrete algorithm overrides Search.
class NotImplementedError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// Thrown when the builder cannot satisfy the connectivity/route constraint
// within its attempt budget.
class MazeGenerationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
