#include "core/deck.hpp"
#include "core/bitboard.hpp"
#include "holdem/errors.h"
#include <algorithm>
#include <numeric>
#include <string>

namespace holdem_table {

Deck::Deck()
    : cards_(standard_cards())
{
    std::random_device rd;
    rng_.seed(rd());
    shuffle();
}

Deck::Deck(uint64_t seed)
    : cards_(standard_cards()),
      rng_(static_cast<std::mt19937::result_type>(seed))
{
    shuffle();
}

std::vector<Card> Deck::standard_cards() {
    std::vector<Card> cards(NUM_CARDS);
    std::iota(cards.begin(), cards.end(), 0);
    return cards;
}

void Deck::shuffle() {
    std::shuffle(cards_.begin(), cards_.end(), rng_);
    next_card_index_ = 0;
}

std::vector<Card> Deck::draw(size_t n) {
    if (n > remaining()) {
        throw DeckExhaustedError("Cannot draw " + std::to_string(n) + " cards, only " +
                                 std::to_string(remaining()) + " left");
    }
    std::vector<Card> drawn(cards_.begin() + next_card_index_,
                            cards_.begin() + next_card_index_ + n);
    next_card_index_ += n;
    return drawn;
}

Card Deck::deal_card() {
    return draw(1).front();
}

void Deck::burn_card() {
    if (remaining() == 0) {
        throw DeckExhaustedError("Deck is empty, cannot burn card.");
    }
    next_card_index_++;
}

void Deck::set_cards_for_testing(const std::vector<Card>& specific_deck) {
    if (specific_deck.size() != NUM_CARDS) {
        throw std::invalid_argument("Specific deck for testing must contain exactly " +
                                    std::to_string(NUM_CARDS) + " cards.");
    }
    if (count_set_bits(cards_to_board(specific_deck)) != NUM_CARDS) {
        throw std::invalid_argument("Specific deck for testing contains duplicate or invalid cards.");
    }
    cards_ = specific_deck;
    next_card_index_ = 0;
}

} // namespace holdem_table
