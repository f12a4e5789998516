#include "FeedbackCalculator.h"


namespace bulls_cows {

Feedback evaluate(const Code& secret, const Code& guess) {
    const std::uint8_t bulls = count_bulls(secret, guess);
    const std::uint8_t cows = count_cows(symbol_set(secret), symbol_set(guess), bulls);
    return { bulls, cows };
}

FeedbackCalculator::FeedbackCalculator(const Code& secret) {
    set_secret(secret);
}

void FeedbackCalculator::set_secret(const Code& secret) {
    this->secret = secret;
    secret_symbols = symbol_set(secret);
}

Feedback FeedbackCalculator::get_feedback(const Code& guess) const {
    return get_feedback(guess, symbol_set(guess));
}

}
