#ifndef HOLDEM_POSITION_RESOLVER_H
#define HOLDEM_POSITION_RESOLVER_H

#include <optional>
#include <vector>

#include "holdem/common_types.h"
#include "holdem/table.h"

namespace holdem_table {

struct SeatPositions {
    SeatNumber button = NO_SEAT;
    SeatNumber small_blind = NO_SEAT;
    SeatNumber big_blind = NO_SEAT;
    SeatNumber first_to_act = NO_SEAT;   // préflop
};

/**
 * @brief Bouton, blindes et premier à parler préflop pour la main suivante.
 *
 * Seuls les sièges PLAYING participent, rangés par numéro croissant en cercle.
 * Première main : le bouton va au plus petit siège éligible (déterministe).
 * Ensuite : premier siège éligible après l'ancien bouton, même si l'ancien
 * bouton a quitté la table ou s'est assis dehors.
 * Heads-up : bouton == petite blinde, qui parle en premier préflop.
 *
 * @throws InsufficientPlayersError si moins de 2 sièges éligibles.
 */
SeatPositions resolve_positions(const std::vector<Seat>& seats,
                                std::optional<SeatNumber> previous_button);

// Sièges PLAYING, triés
std::vector<SeatNumber> eligible_seats(const std::vector<Seat>& seats);

// Premier candidat strictement après `from` dans le sens horaire (NO_SEAT si vide).
// `candidates` doit être trié ; `from` n'a pas besoin d'en faire partie.
SeatNumber next_seat_clockwise(const std::vector<SeatNumber>& candidates, SeatNumber from);

// Comme ci-dessus mais `from` lui-même est accepté
SeatNumber seat_at_or_after(const std::vector<SeatNumber>& candidates, SeatNumber from);

// Tous les candidats dans l'ordre horaire, en commençant juste après `from`
std::vector<SeatNumber> clockwise_from(const std::vector<SeatNumber>& candidates, SeatNumber from);

} // namespace holdem_table

#endif // HOLDEM_POSITION_RESOLVER_H
