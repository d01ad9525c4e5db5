#ifndef HOLDEM_HAND_EVALUATOR_HPP
#define HOLDEM_HAND_EVALUATOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "core/cards.hpp"
#include "core/bitboard.hpp"

namespace holdem_table {

// Force d'une main : plus grand = meilleur. Totalement ordonné, l'égalité
// signifie un partage du pot.
// Format : catégorie (bits 20-23) puis 5 rangs départageants de 4 bits.
using HandRank = uint32_t;

constexpr HandRank INVALID_HAND_RANK = 0;

enum class HandCategory : uint8_t {
    INVALID = 0,
    HIGH_CARD = 1,
    ONE_PAIR,
    TWO_PAIR,
    THREE_OF_A_KIND,
    STRAIGHT,
    FLUSH,
    FULL_HOUSE,
    FOUR_OF_A_KIND,
    STRAIGHT_FLUSH
};

/**
 * @brief Évalue la meilleure main de 5 cartes contenue dans le masque.
 * @param cards Bitboard de 5 à 7 cartes.
 * @return Le HandRank, ou INVALID_HAND_RANK si le nombre de cartes est hors bornes.
 */
HandRank evaluate_hand(Bitboard cards);

/**
 * @brief Évalue 2 cartes privées + 3 à 5 cartes communes.
 * @return INVALID_HAND_RANK si une carte est invalide ou en double.
 */
HandRank evaluate_hand(const std::vector<Card>& hole, const std::vector<Card>& board);

HandRank evaluate_hand(const std::vector<Card>& cards);

HandCategory hand_category(HandRank rank);

std::string hand_category_to_string(HandCategory category);
std::string hand_rank_to_string(HandRank rank); // "Royal Flush", "Two Pair", ...

} // namespace holdem_table

#endif // HOLDEM_HAND_EVALUATOR_HPP
