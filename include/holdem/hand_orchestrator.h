#ifndef HOLDEM_HAND_ORCHESTRATOR_H
#define HOLDEM_HAND_ORCHESTRATOR_H

#include "core/deck.hpp"
#include "holdem/action_validator.h"
#include "holdem/hand.h"

namespace holdem_table {

/**
 * Séquence une main : cartes privées -> préflop -> flop -> turn -> river ->
 * abattage (ou attribution immédiate si un seul siège reste).
 *
 * Travaille sur un TableState passé par référence : le moteur lui donne une
 * copie tampon et ne publie cette copie qu'une fois la transition complète.
 */
class HandOrchestrator {
public:
    explicit HandOrchestrator(TableState& state);

    // WAITING -> IN_PROGRESS puis première main
    void start_table(Deck deck);

    // Bouton, blindes, distribution et ouverture du préflop
    void start_hand(Deck deck);

    // Valide puis applique ; avance les streets si le tour de mise est clos
    void submit_action(const Action& action);

    LegalActions legal_actions(SeatNumber seat) const;

private:
    Hand& hand();
    void post_blind(SeatNumber seat, Chips amount, std::map<SeatNumber, Chips>& committed);
    void commit_chips(Seat& seat, Chips amount);
    void deal_hole_cards();
    void deal_community(Street street);
    void advance();
    void open_postflop_round();
    void award_uncontested();
    void showdown();
    void finish_hand(HandResult result);
    int count_in_hand(SeatStatus status) const;

    TableState& state_;
};

} // namespace holdem_table

#endif // HOLDEM_HAND_ORCHESTRATOR_H
