#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>


namespace bulls_cows {

class Feedback {
    unsigned int bulls_;
    unsigned int cows_;
public:
    Feedback(unsigned int bulls, unsigned int cows) : bulls_(bulls), cows_(cows) {}
    inline unsigned int bulls() const { return bulls_; }
    inline unsigned int cows() const { return cows_; }
    inline bool operator==(const Feedback& other) const = default;

    inline bool is_valid(unsigned int length) const { return bulls_ <= length && cows_ <= length - bulls_; }
    inline bool is_win(unsigned int length) const { return bulls_ == length; }

    // Dense slot in [0, slot_count(length)) for a valid feedback
    inline size_t index(unsigned int length) const { return bulls_ * (length + 1) + cows_; }
    static inline size_t slot_count(unsigned int length) { return (length + 1) * (length + 1); }
};

// Builds a feedback from untrusted counts, throws InvalidFeedback when out of range
Feedback make_feedback(int bulls, int cows, unsigned int length);


// A feedback line as typed: either "B C" or the 'win' shortcut
struct FeedbackInput {
    bool win = false;
    int bulls = 0;
    int cows = 0;
};

// Returns nothing when the text is neither two integers nor 'win'. Ranges are checked by make_feedback.
std::optional<FeedbackInput> parse_feedback(std::string_view text);

std::ostream& operator<<(std::ostream& stream, const Feedback& feedback);

}
