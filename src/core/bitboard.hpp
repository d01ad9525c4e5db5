#ifndef HOLDEM_BITBOARD_HPP
#define HOLDEM_BITBOARD_HPP

#include <bit>
#include <cstdint>
#include <string>
#include <vector>

#include "core/cards.hpp"

namespace holdem_table {

// Masque de 52 bits, un bit par carte (index = Card)
using Bitboard = uint64_t;

constexpr Bitboard EMPTY_BOARD = 0ULL;
constexpr int NUM_CARDS = 52;
constexpr Bitboard FULL_DECK = (1ULL << NUM_CARDS) - 1;

// Masque des 13 rangs d'une couleur
constexpr uint16_t RANK_MASK = 0x1FFF;

inline void set_card(Bitboard& board, Card c) {
    if (c < INVALID_CARD) board |= (1ULL << c);
}

inline void clear_card(Bitboard& board, Card c) {
    if (c < INVALID_CARD) board &= ~(1ULL << c);
}

inline bool test_card(Bitboard board, Card c) {
    if (c >= INVALID_CARD) return false;
    return (board & (1ULL << c)) != 0;
}

inline int count_set_bits(Bitboard board) {
    return std::popcount(board);
}

// Rangs présents dans une couleur donnée (bit r = rang r)
inline uint16_t suit_ranks(Bitboard board, Suit s) {
    return static_cast<uint16_t>((board >> (static_cast<int>(s) * NUM_RANKS)) & RANK_MASK);
}

// Extrait la carte du bit le moins significatif et l'enlève
inline Card pop_lsb(Bitboard& board) {
    if (board == 0) return INVALID_CARD;
    const int idx = std::countr_zero(board);
    board &= (board - 1);
    return static_cast<Card>(idx);
}

std::vector<Card> board_to_cards(Bitboard board);
Bitboard cards_to_board(const std::vector<Card>& cards);

} // namespace holdem_table

#endif // HOLDEM_BITBOARD_HPP
