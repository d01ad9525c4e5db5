#ifndef HOLDEM_CARDS_HPP
#define HOLDEM_CARDS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept> // Pour std::invalid_argument

namespace holdem_table {

// Une carte = index 0-51 (suit * 13 + rank)
using Card = uint8_t;

// Carte invalide / inconnue (face cachée dans les vues publiques)
constexpr Card INVALID_CARD = 52;

enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;

constexpr Card make_card(Rank r, Suit s) {
    return static_cast<uint8_t>(s) * NUM_RANKS + static_cast<uint8_t>(r);
}

constexpr Rank get_rank(Card c) {
    return static_cast<Rank>(c % NUM_RANKS);
}

constexpr Suit get_suit(Card c) {
    return static_cast<Suit>(c / NUM_RANKS);
}

// Conversions texte <-> carte. Format "Rs" : rang "23456789TJQKA" puis
// couleur "cdhs" (la casse est ignorée en entrée : "AS" == "As").
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);
std::string to_string(const std::vector<Card>& cards);

Card card_from_string(const std::string& s);
std::vector<Card> cards_from_string(const std::string& s); // "As Kd 2c"
Rank rank_from_char(char r);
Suit suit_from_char(char s);

} // namespace holdem_table

#endif // HOLDEM_CARDS_HPP
