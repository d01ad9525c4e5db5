// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Évaluateur 5 à 7 cartes sur bitboards : un masque de 13 rangs par couleur,
//  puis recherche des catégories de la plus forte à la plus faible.
// ─────────────────────────────────────────────────────────────────────────────
#include "eval/hand_evaluator.hpp"

#include <array>
#include <bit>

namespace holdem_table {

namespace {

constexpr int RANK_ACE = static_cast<int>(Rank::ACE);
constexpr uint16_t WHEEL_MASK = 0x100F; // A-2-3-4-5

HandRank make_value(HandCategory cat, int k1 = 0, int k2 = 0, int k3 = 0, int k4 = 0, int k5 = 0) {
    HandRank v = static_cast<HandRank>(cat) << 20;
    v |= static_cast<HandRank>(k1 & 0xF) << 16;
    v |= static_cast<HandRank>(k2 & 0xF) << 12;
    v |= static_cast<HandRank>(k3 & 0xF) << 8;
    v |= static_cast<HandRank>(k4 & 0xF) << 4;
    v |= static_cast<HandRank>(k5 & 0xF);
    return v;
}

// Rang de la plus haute carte de la quinte, -1 sinon. L'as ferme aussi la roue.
int straight_high(uint16_t ranks) {
    for (int high = RANK_ACE; high >= 4; --high) {
        const uint16_t m = static_cast<uint16_t>(0x1F << (high - 4));
        if ((ranks & m) == m) return high;
    }
    if ((ranks & WHEEL_MASK) == WHEEL_MASK) return static_cast<int>(Rank::FIVE);
    return -1;
}

// Les n plus hauts rangs du masque, en ordre décroissant (complété par 0)
std::array<int, 5> top_ranks(uint16_t ranks, int n) {
    std::array<int, 5> out{0, 0, 0, 0, 0};
    int k = 0;
    for (int r = RANK_ACE; r >= 0 && k < n; --r) {
        if (ranks & (1u << r)) out[k++] = r;
    }
    return out;
}

int highest(uint16_t ranks) {
    return ranks == 0 ? -1 : 15 - std::countl_zero(ranks);
}

} // namespace

HandRank evaluate_hand(Bitboard cards) {
    const int n = count_set_bits(cards);
    if (n < 5 || n > 7 || (cards & ~FULL_DECK) != 0) return INVALID_HAND_RANK;

    std::array<uint16_t, NUM_SUITS> by_suit{};
    uint16_t all = 0;
    for (int s = 0; s < NUM_SUITS; ++s) {
        by_suit[s] = suit_ranks(cards, static_cast<Suit>(s));
        all |= by_suit[s];
    }

    // Masques par multiplicité : quads / trips / paires (exclusifs)
    uint16_t quads = 0, trips = 0, pairs = 0;
    for (int r = 0; r < NUM_RANKS; ++r) {
        int count = 0;
        for (int s = 0; s < NUM_SUITS; ++s) count += (by_suit[s] >> r) & 1;
        const uint16_t bit = static_cast<uint16_t>(1u << r);
        if (count == 4) quads |= bit;
        else if (count == 3) trips |= bit;
        else if (count == 2) pairs |= bit;
    }

    int flush_suit = -1;
    for (int s = 0; s < NUM_SUITS; ++s) {
        if (std::popcount(by_suit[s]) >= 5) { flush_suit = s; break; }
    }

    if (flush_suit >= 0) {
        const int sf = straight_high(by_suit[flush_suit]);
        if (sf >= 0) return make_value(HandCategory::STRAIGHT_FLUSH, sf);
    }

    if (quads) {
        const int q = highest(quads);
        const int kicker = highest(static_cast<uint16_t>(all & ~(1u << q)));
        return make_value(HandCategory::FOUR_OF_A_KIND, q, kicker);
    }

    if (trips) {
        const int t = highest(trips);
        // Deux brelans possibles sur 7 cartes : le second sert de paire
        const uint16_t rest = static_cast<uint16_t>((trips | pairs) & ~(1u << t));
        if (rest) return make_value(HandCategory::FULL_HOUSE, t, highest(rest));
    }

    if (flush_suit >= 0) {
        const auto k = top_ranks(by_suit[flush_suit], 5);
        return make_value(HandCategory::FLUSH, k[0], k[1], k[2], k[3], k[4]);
    }

    const int st = straight_high(all);
    if (st >= 0) return make_value(HandCategory::STRAIGHT, st);

    if (trips) {
        const int t = highest(trips);
        const auto k = top_ranks(static_cast<uint16_t>(all & ~(1u << t)), 2);
        return make_value(HandCategory::THREE_OF_A_KIND, t, k[0], k[1]);
    }

    if (std::popcount(pairs) >= 2) {
        const int p1 = highest(pairs);
        const int p2 = highest(static_cast<uint16_t>(pairs & ~(1u << p1)));
        const int kicker = highest(static_cast<uint16_t>(all & ~(1u << p1) & ~(1u << p2)));
        return make_value(HandCategory::TWO_PAIR, p1, p2, kicker);
    }

    if (pairs) {
        const int p = highest(pairs);
        const auto k = top_ranks(static_cast<uint16_t>(all & ~(1u << p)), 3);
        return make_value(HandCategory::ONE_PAIR, p, k[0], k[1], k[2]);
    }

    const auto k = top_ranks(all, 5);
    return make_value(HandCategory::HIGH_CARD, k[0], k[1], k[2], k[3], k[4]);
}

HandRank evaluate_hand(const std::vector<Card>& cards) {
    Bitboard mask = EMPTY_BOARD;
    for (Card c : cards) {
        if (c >= INVALID_CARD || test_card(mask, c)) return INVALID_HAND_RANK;
        set_card(mask, c);
    }
    return evaluate_hand(mask);
}

HandRank evaluate_hand(const std::vector<Card>& hole, const std::vector<Card>& board) {
    if (hole.size() != 2 || board.size() < 3 || board.size() > 5) return INVALID_HAND_RANK;
    std::vector<Card> all(hole);
    all.insert(all.end(), board.begin(), board.end());
    return evaluate_hand(all);
}

HandCategory hand_category(HandRank rank) {
    const auto cat = rank >> 20;
    if (cat == 0 || cat > static_cast<HandRank>(HandCategory::STRAIGHT_FLUSH)) return HandCategory::INVALID;
    return static_cast<HandCategory>(cat);
}

std::string hand_category_to_string(HandCategory category) {
    switch (category) {
        case HandCategory::HIGH_CARD:       return "High Card";
        case HandCategory::ONE_PAIR:        return "One Pair";
        case HandCategory::TWO_PAIR:        return "Two Pair";
        case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
        case HandCategory::STRAIGHT:        return "Straight";
        case HandCategory::FLUSH:           return "Flush";
        case HandCategory::FULL_HOUSE:      return "Full House";
        case HandCategory::FOUR_OF_A_KIND:  return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH:  return "Straight Flush";
        default:                            return "Invalid";
    }
}

std::string hand_rank_to_string(HandRank rank) {
    const HandCategory cat = hand_category(rank);
    if (cat == HandCategory::STRAIGHT_FLUSH && ((rank >> 16) & 0xF) == static_cast<HandRank>(RANK_ACE)) {
        return "Royal Flush";
    }
    return hand_category_to_string(cat);
}

} // namespace holdem_table
