#include "holdem/pot_accountant.h"
#include "holdem/errors.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <string>

namespace holdem_table {

void PotAccountant::contribute(SeatNumber seat, Chips amount) {
    if (amount < 0) throw InvalidActionError("Negative contribution from seat " + std::to_string(seat));
    contributions_[seat] += amount;
}

void PotAccountant::fold(SeatNumber seat) {
    folded_.insert(seat);
}

void PotAccountant::mark_all_in(SeatNumber seat) {
    all_in_.insert(seat);
}

Chips PotAccountant::total() const {
    Chips total = 0;
    for (const auto& [seat, amount] : contributions_) total += amount;
    return total;
}

Chips PotAccountant::contributed(SeatNumber seat) const {
    auto it = contributions_.find(seat);
    return it == contributions_.end() ? 0 : it->second;
}

std::vector<Pot> PotAccountant::pots() const {
    // Niveaux de coupe : contribution de chaque all-in encore en jeu, puis le maximum
    std::set<Chips> levels;
    Chips top = 0;
    for (const auto& [seat, amount] : contributions_) {
        top = std::max(top, amount);
        if (all_in_.count(seat) && !folded_.count(seat) && amount > 0) levels.insert(amount);
    }
    if (top > 0) levels.insert(top);

    std::vector<Pot> pots;
    auto push_or_merge = [&pots](Pot pot) {
        // Même ensemble de prétendants que le pot précédent : une seule couche
        if (!pots.empty() && pot.eligible_seats == pots.back().eligible_seats) {
            pots.back().amount += pot.amount;
        } else {
            pots.push_back(std::move(pot));
        }
    };

    Chips previous = 0;
    for (Chips level : levels) {
        Pot pot;
        std::map<SeatNumber, Chips> layer;
        for (const auto& [seat, amount] : contributions_) {
            const Chips part = std::min(amount, level) - std::min(amount, previous);
            if (part > 0) layer[seat] = part;
            pot.amount += part;
            const bool reaches = amount > previous;
            const bool capped_below = all_in_.count(seat) && amount < level;
            if (reaches && !capped_below && !folded_.count(seat)) {
                pot.eligible_seats.push_back(seat);
            }
        }
        previous = level;
        if (pot.amount == 0) continue;

        if (pot.eligible_seats.empty()) {
            // Couche que personne n'a suivie : chaque contributeur reprend sa part
            for (const auto& [seat, part] : layer) {
                spdlog::debug("Uncalled {} returned to seat {}", part, seat);
                push_or_merge(Pot{part, {seat}});
            }
        } else {
            push_or_merge(std::move(pot));
        }
    }

    spdlog::trace("Pot layering: {} pot(s), total {}", pots.size(), total());
    return pots;
}

std::vector<PotAward> PotAccountant::award(const std::map<SeatNumber, HandRank>& ranks,
                                           const std::vector<SeatNumber>& clockwise_from_button) const {
    std::vector<PotAward> awards;
    const std::vector<Pot> all_pots = pots();

    for (size_t i = 0; i < all_pots.size(); ++i) {
        const Pot& pot = all_pots[i];
        PotAward award;
        award.pot_index = i;
        award.amount = pot.amount;

        if (pot.eligible_seats.size() == 1) {
            award.winners = pot.eligible_seats;
        } else {
            HandRank best = INVALID_HAND_RANK;
            for (SeatNumber s : pot.eligible_seats) {
                auto it = ranks.find(s);
                if (it != ranks.end()) best = std::max(best, it->second);
            }
            if (best == INVALID_HAND_RANK) {
                throw InvalidActionError("No ranked hand among the seats eligible for pot " + std::to_string(i));
            }
            // Ordre horaire depuis le bouton : le premier reçoit le reste
            for (SeatNumber s : clockwise_from_button) {
                auto it = ranks.find(s);
                const bool eligible = std::binary_search(pot.eligible_seats.begin(), pot.eligible_seats.end(), s);
                if (eligible && it != ranks.end() && it->second == best) award.winners.push_back(s);
            }
        }

        if (award.winners.empty()) {
            throw InvalidActionError("No winner for pot " + std::to_string(i));
        }
        const Chips share = pot.amount / static_cast<Chips>(award.winners.size());
        const Chips remainder = pot.amount % static_cast<Chips>(award.winners.size());
        for (SeatNumber s : award.winners) award.payouts[s] = share;
        award.payouts[award.winners.front()] += remainder;

        spdlog::debug("Pot {} ({} chips) -> {} winner(s), share {}, remainder {} to seat {}",
                      i, pot.amount, award.winners.size(), share, remainder, award.winners.front());
        awards.push_back(std::move(award));
    }
    return awards;
}

} // namespace holdem_table
