#include "Feedback.h"
#include "Errors.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>


namespace bulls_cows {

Feedback make_feedback(int bulls, int cows, unsigned int length) {
    if (bulls < 0 || cows < 0) {
        throw InvalidFeedback("Bulls and cows cannot be negative");
    }
    const Feedback feedback(static_cast<unsigned int>(bulls), static_cast<unsigned int>(cows));
    if (!feedback.is_valid(length)) {
        std::ostringstream message;
        message << "Bulls and cows should be between 0 and " << length << ", and their sum <= " << length;
        throw InvalidFeedback(message.str());
    }
    return feedback;
}

std::optional<FeedbackInput> parse_feedback(std::string_view text) {
    std::string line(text);
    std::ranges::transform(line, line.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::istringstream stream(line);
    std::string first;
    if (!(stream >> first)) {
        return std::nullopt;
    }

    std::string rest;
    if (first == "win") {
        if (stream >> rest) {
            return std::nullopt;
        }
        return FeedbackInput{ true, 0, 0 };
    }

    FeedbackInput input;
    std::istringstream first_stream(first);
    if (!(first_stream >> input.bulls) || !first_stream.eof()) {
        return std::nullopt;
    }
    if (!(stream >> input.cows) || stream >> rest) {
        return std::nullopt;
    }
    return input;
}

std::ostream& operator<<(std::ostream& stream, const Feedback& feedback) {
    stream << feedback.bulls() << (feedback.bulls() == 1 ? " bull " : " bulls ")
        << feedback.cows() << (feedback.cows() == 1 ? " cow" : " cows");
    return stream;
}

}
