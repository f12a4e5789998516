#pragma once

#include <stdexcept>
#include <string>


namespace bulls_cows {

// Feedback counts outside 0 <= bulls, cows and bulls + cows <= length
class InvalidFeedback : public std::invalid_argument {
public:
    explicit InvalidFeedback(const std::string& what) : std::invalid_argument(what) {}
};

// No code is consistent with every feedback received so far
class Contradiction : public std::runtime_error {
public:
    explicit Contradiction(const std::string& what) : std::runtime_error(what) {}
};

}
