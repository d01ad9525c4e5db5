#include "core/cards.hpp"
#include <cctype>
#include <sstream>

namespace holdem_table {

namespace {
constexpr char RANK_CHARS[] = "23456789TJQKA";
constexpr char SUIT_CHARS[] = "cdhs";
} // namespace

Rank rank_from_char(char r) {
    const char up = static_cast<char>(std::toupper(static_cast<unsigned char>(r)));
    for (int i = 0; i < NUM_RANKS; ++i) {
        if (RANK_CHARS[i] == up) return static_cast<Rank>(i);
    }
    throw std::invalid_argument("Invalid rank character: " + std::string(1, r));
}

Suit suit_from_char(char s) {
    const char low = static_cast<char>(std::tolower(static_cast<unsigned char>(s)));
    for (int i = 0; i < NUM_SUITS; ++i) {
        if (SUIT_CHARS[i] == low) return static_cast<Suit>(i);
    }
    throw std::invalid_argument("Invalid suit character: " + std::string(1, s));
}

std::string to_string(Rank r) {
    const auto idx = static_cast<int>(r);
    if (idx < 0 || idx >= NUM_RANKS) return "?";
    return std::string(1, RANK_CHARS[idx]);
}

std::string to_string(Suit s) {
    const auto idx = static_cast<int>(s);
    if (idx < 0 || idx >= NUM_SUITS) return "?";
    return std::string(1, SUIT_CHARS[idx]);
}

std::string to_string(Card c) {
    if (c >= INVALID_CARD) return "??";
    return to_string(get_rank(c)) + to_string(get_suit(c));
}

std::string to_string(const std::vector<Card>& cards) {
    std::string out;
    for (Card c : cards) {
        if (!out.empty()) out += ' ';
        out += to_string(c);
    }
    return out;
}

Card card_from_string(const std::string& s) {
    if (s.length() != 2) {
        throw std::invalid_argument("Invalid card string format: '" + s + "'. Expected 'Rs'.");
    }
    try {
        return make_card(rank_from_char(s[0]), suit_from_char(s[1]));
    } catch (const std::invalid_argument& e) {
        // Propage l'erreur avec plus de contexte
        throw std::invalid_argument("Invalid card string '" + s + "': " + e.what());
    }
}

std::vector<Card> cards_from_string(const std::string& s) {
    std::vector<Card> cards;
    std::istringstream in(s);
    std::string token;
    while (in >> token) {
        cards.push_back(card_from_string(token));
    }
    return cards;
}

} // namespace holdem_table
