#pragma once

#include <bitset>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string_view>
#include <vector>


namespace bulls_cows {

using Symbol = std::uint8_t; // Symbol represented as a single byte
using Code = std::vector<Symbol>;

static constexpr size_t max_alphabet_size = 32;
using SymbolSet = std::bitset<max_alphabet_size>;


// Geometry of a game: how many symbols per code, drawn from how many
class CodeSpace {
    unsigned int length_;
    unsigned int alphabet_size_;
public:
    CodeSpace(unsigned int length = 4, unsigned int alphabet_size = 10);

    inline unsigned int length() const { return length_; }
    inline unsigned int alphabet_size() const { return alphabet_size_; }

    // alphabet_size! / (alphabet_size - length)!
    size_t size() const;

    inline bool operator==(const CodeSpace& other) const = default;
};


SymbolSet symbol_set(const Code& code);

bool is_valid(const Code& code, const CodeSpace& space);

std::optional<Code> parse_code(std::string_view text, const CodeSpace& space);

std::ostream& operator<<(std::ostream& stream, const Code& code);

}
