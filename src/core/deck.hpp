#ifndef HOLDEM_CORE_DECK_HPP
#define HOLDEM_CORE_DECK_HPP

#include "core/cards.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace holdem_table {

// Paquet possédé par une seule main (copiable avec son générateur, jamais partagé)
class Deck {
public:
    // Graine tirée de std::random_device
    Deck();
    // Graine fixe : rejouable dans les tests
    explicit Deck(uint64_t seed);

    // Les 52 combinaisons rang x couleur, sans doublon, dans l'ordre des index
    static std::vector<Card> standard_cards();

    // Fisher-Yates (std::shuffle) sur le paquet complet, remet l'index à zéro
    void shuffle();

    // Retire et renvoie les n cartes du dessus. DeckExhaustedError si n > remaining()
    std::vector<Card> draw(size_t n);
    Card deal_card();
    void burn_card();

    size_t remaining() const { return cards_.size() - next_card_index_; }

    // Ordre imposé (52 cartes distinctes), distribué depuis le début
    void set_cards_for_testing(const std::vector<Card>& specific_deck);

private:
    std::vector<Card> cards_;
    size_t            next_card_index_ = 0;
    std::mt19937      rng_;
};

} // namespace holdem_table

#endif // HOLDEM_CORE_DECK_HPP
