#include "Code.h"

#include <algorithm>
#include <ranges>
#include <stdexcept>


namespace bulls_cows {

CodeSpace::CodeSpace(unsigned int length, unsigned int alphabet_size)
    : length_(length)
    , alphabet_size_(alphabet_size)
{
    if (length == 0u) {
        throw std::invalid_argument("Code length must be at least 1");
    }
    if (alphabet_size > max_alphabet_size) {
        throw std::invalid_argument("Alphabet cannot hold more than 32 symbols");
    }
    if (length > alphabet_size) {
        throw std::invalid_argument("Code length cannot exceed the alphabet size when symbols are distinct");
    }
}

size_t CodeSpace::size() const {
    size_t count = 1;
    for (unsigned int i = 0; i < length_; ++i) {
        count *= alphabet_size_ - i;
    }
    return count;
}

SymbolSet symbol_set(const Code& code) {
    SymbolSet symbols;
    for (Symbol symbol : code) {
        symbols.set(symbol);
    }
    return symbols;
}

bool is_valid(const Code& code, const CodeSpace& space) {
    if (code.size() != space.length()) {
        return false;
    }
    if (!std::ranges::all_of(code, [&](Symbol symbol) { return symbol < space.alphabet_size(); })) {
        return false;
    }
    return symbol_set(code).count() == code.size();
}

std::optional<Code> parse_code(std::string_view text, const CodeSpace& space) {
    // Trim surrounding blanks
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    text = text.substr(first, text.find_last_not_of(" \t\r\n") - first + 1);

    if (space.alphabet_size() > 10u || text.size() != space.length()) {
        return std::nullopt;
    }

    Code code;
    code.reserve(text.size());
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        code.push_back(static_cast<Symbol>(c - '0'));
    }

    if (!is_valid(code, space)) {
        return std::nullopt;
    }
    return code;
}

std::ostream& operator<<(std::ostream& stream, const Code& code) {
    for (auto symbol : code | std::views::transform([](auto s) -> char { return s < 10 ? s + '0' : s - 10 + 'A'; })) stream << symbol;
    return stream;
}

}
