#ifndef HOLDEM_POT_ACCOUNTANT_H
#define HOLDEM_POT_ACCOUNTANT_H

#include <map>
#include <set>
#include <vector>

#include "holdem/common_types.h"
#include "eval/hand_evaluator.hpp"

namespace holdem_table {

struct Pot {
    Chips amount = 0;
    std::vector<SeatNumber> eligible_seats;   // triés
};

struct PotAward {
    size_t pot_index = 0;
    Chips amount = 0;
    std::vector<SeatNumber> winners;
    std::map<SeatNumber, Chips> payouts;
};

/**
 * Pot principal + pots annexes.
 *
 * On garde la contribution totale de chaque siège sur la main ; les pots
 * sont découpés en couches aux niveaux des all-in : la couche (a, b] est
 * alimentée par tous les sièges (même couchés) et n'est jouée que par les
 * sièges non couchés qui y ont contribué et qui ne sont pas all-in en dessous
 * de b. Une couche sans aucun prétendant (seuls des sièges couchés l'ont
 * alimentée) n'est gagnée par personne : chaque contributeur la récupère dans
 * un pot à un seul siège. Les pots sont rendus dans l'ordre de création
 * (principal d'abord).
 */
class PotAccountant {
public:
    void contribute(SeatNumber seat, Chips amount);
    void fold(SeatNumber seat);
    void mark_all_in(SeatNumber seat);

    Chips total() const;
    Chips contributed(SeatNumber seat) const;
    const std::map<SeatNumber, Chips>& contributions() const { return contributions_; }

    std::vector<Pot> pots() const;

    /**
     * @brief Répartit chaque pot entre les meilleures mains éligibles.
     * @param ranks Force des mains à l'abattage (vide si main gagnée sans abattage).
     * @param clockwise_from_button Sièges de la main, dans l'ordre horaire après le bouton :
     *        le reste d'une division inégale va au premier gagnant dans cet ordre.
     */
    std::vector<PotAward> award(const std::map<SeatNumber, HandRank>& ranks,
                                const std::vector<SeatNumber>& clockwise_from_button) const;

private:
    std::map<SeatNumber, Chips> contributions_;
    std::set<SeatNumber> folded_;
    std::set<SeatNumber> all_in_;
};

} // namespace holdem_table

#endif // HOLDEM_POT_ACCOUNTANT_H
