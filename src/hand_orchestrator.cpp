#include "holdem/hand_orchestrator.h"
#include "holdem/errors.h"
#include "holdem/game_utils.hpp"
#include "eval/hand_evaluator.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <string>

namespace holdem_table {

HandOrchestrator::HandOrchestrator(TableState& state)
    : state_(state) {}

Hand& HandOrchestrator::hand() {
    if (!state_.hand) throw InvalidActionError("No hand dealt at table " + state_.table.id);
    return *state_.hand;
}

int HandOrchestrator::count_in_hand(SeatStatus status) const {
    int n = 0;
    for (const auto& s : state_.table.seats) {
        if (s.status == status) ++n;
    }
    return n;
}

// -----------------------------------------------------------------------------
//  Démarrage
// -----------------------------------------------------------------------------
void HandOrchestrator::start_table(Deck deck) {
    Table& table = state_.table;
    if (table.status != TableStatus::WAITING) {
        throw InvalidActionError(std::string("Table already started (status ") +
                                 table_status_to_string(table.status) + ")");
    }
    table.settings.validate();
    int ready = 0;
    for (const auto& s : table.seats) {
        if (s.can_play()) ++ready;
    }
    if (ready < 2) {
        throw InsufficientPlayersError("Cannot start a table with fewer than 2 players.");
    }
    table.status = TableStatus::IN_PROGRESS;
    spdlog::info("Table {} started with {} players", table.id, ready);
    start_hand(std::move(deck));
}

void HandOrchestrator::start_hand(Deck deck) {
    Table& table = state_.table;
    if (table.status != TableStatus::IN_PROGRESS) {
        throw InvalidActionError(std::string("Table is not in progress (status ") +
                                 table_status_to_string(table.status) + ")");
    }
    if (state_.hand && !state_.hand->complete) {
        throw InvalidActionError("A hand is already in progress at table " + table.id);
    }

    // Remise à zéro des sièges : ceux qui ont des jetons rejouent
    for (auto& s : table.seats) {
        s.hole_cards.clear();
        s.status = s.can_play() ? SeatStatus::PLAYING : SeatStatus::SITTING_OUT;
    }

    Hand h;
    h.positions = resolve_positions(table.seats, table.button_seat);
    h.participants = eligible_seats(table.seats);
    h.deck = std::move(deck);
    h.hand_number = table.hands_played + 1;
    h.street = Street::PREFLOP;
    table.button_seat = h.positions.button;
    table.hands_played = h.hand_number;
    state_.hand = std::move(h);

    spdlog::info("Table {} hand #{}: BTN {} SB {} BB {} seats {}", table.id, hand().hand_number,
                 hand().positions.button, hand().positions.small_blind, hand().positions.big_blind,
                 seats_to_string(hand().participants));

    deal_hole_cards();

    std::map<SeatNumber, Chips> committed;
    post_blind(hand().positions.small_blind, table.settings.small_blind, committed);
    post_blind(hand().positions.big_blind, table.settings.big_blind, committed);

    hand().round = BettingRound::open(Street::PREFLOP,
                                      table.settings.big_blind,
                                      table.settings.big_blind,
                                      std::move(committed),
                                      table,
                                      hand().positions.first_to_act);
    advance();
}

void HandOrchestrator::deal_hole_cards() {
    Hand& h = hand();
    const auto order = clockwise_from(h.participants, h.positions.button);
    for (int round = 0; round < 2; ++round) {
        for (SeatNumber s : order) {
            state_.table.seat_at(s).hole_cards.push_back(h.deck.deal_card());
        }
    }
}

void HandOrchestrator::commit_chips(Seat& seat, Chips amount) {
    seat.chip_count -= amount;
    hand().pots.contribute(seat.seat_number, amount);
    if (seat.chip_count == 0 && seat.status == SeatStatus::PLAYING) {
        seat.status = SeatStatus::ALL_IN;
        hand().pots.mark_all_in(seat.seat_number);
    }
}

void HandOrchestrator::post_blind(SeatNumber seat_number, Chips amount, std::map<SeatNumber, Chips>& committed) {
    Seat& seat = state_.table.seat_at(seat_number);
    const Chips posted = std::min(amount, seat.chip_count);
    commit_chips(seat, posted);
    committed[seat_number] += posted;
    spdlog::debug("Seat {} posts blind {} (stack {}){}", seat_number, posted, seat.chip_count,
                  seat.status == SeatStatus::ALL_IN ? " all-in" : "");
}

// -----------------------------------------------------------------------------
//  Actions
// -----------------------------------------------------------------------------
void HandOrchestrator::submit_action(const Action& action) {
    if (!state_.hand || state_.hand->complete) {
        throw InvalidActionError("No hand is accepting actions at table " + state_.table.id);
    }
    Hand& h = hand();
    Seat* seat = state_.table.find_seat(action.seat);
    if (!seat) throw InvalidActionError("Unknown seat " + std::to_string(action.seat));

    const ValidatedAction v = validate_action(h.round, *seat, action, state_.table.settings.big_blind);

    if (v.type == ActionType::FOLD) {
        seat->status = SeatStatus::FOLDED;
        seat->hole_cards.clear();
        h.pots.fold(seat->seat_number);
    } else {
        commit_chips(*seat, v.chips_to_commit);
    }
    h.round.apply(v, state_.table);
    ++h.action_sequence;

    spdlog::info("Table {} {} {}: {} (committed {}, stack {}{})", state_.table.id,
                 street_to_string(h.street), action_to_string(action),
                 action_type_to_string(v.type), v.new_total, seat->chip_count,
                 v.goes_all_in ? ", all-in" : "");
    advance();
}

LegalActions HandOrchestrator::legal_actions(SeatNumber seat) const {
    if (!state_.hand || state_.hand->complete) return {};
    const Seat* s = state_.table.find_seat(seat);
    if (!s) return {};
    return holdem_table::legal_actions(state_.hand->round, *s, state_.table.settings.big_blind);
}

// -----------------------------------------------------------------------------
//  Progression des streets
// -----------------------------------------------------------------------------
void HandOrchestrator::advance() {
    Hand& h = hand();
    while (true) {
        const int contenders = count_in_hand(SeatStatus::PLAYING) + count_in_hand(SeatStatus::ALL_IN);
        if (contenders <= 1) {
            award_uncontested();
            return;
        }
        if (!h.round.complete()) return;

        if (h.street == Street::RIVER) {
            showdown();
            return;
        }
        // Tous all-in (ou un seul joueur avec des jetons) : on déroule sans mise
        h.street = static_cast<Street>(static_cast<int>(h.street) + 1);
        deal_community(h.street);
        open_postflop_round();
    }
}

void HandOrchestrator::deal_community(Street street) {
    Hand& h = hand();
    const size_t n = street == Street::FLOP ? 3 : 1;
    h.deck.burn_card();
    const std::vector<Card> cards = h.deck.draw(n);
    h.community_cards.insert(h.community_cards.end(), cards.begin(), cards.end());
    spdlog::debug("{}: [{}] board [{}]", street_to_string(street), to_string(cards), to_string(h.community_cards));
}

void HandOrchestrator::open_postflop_round() {
    Hand& h = hand();
    // Postflop : premier siège actif après le bouton
    const SeatNumber first = next_seat_clockwise(eligible_seats(state_.table.seats), h.positions.button);
    h.round = BettingRound::open(h.street, 0, state_.table.settings.big_blind, {}, state_.table,
                                 first == NO_SEAT ? h.positions.button : first);
}

// -----------------------------------------------------------------------------
//  Résolution
// -----------------------------------------------------------------------------
void HandOrchestrator::award_uncontested() {
    Hand& h = hand();
    HandResult result;
    result.uncontested = true;
    result.awards = h.pots.award({}, clockwise_from(h.participants, h.positions.button));
    finish_hand(std::move(result));
}

void HandOrchestrator::showdown() {
    Hand& h = hand();
    HandResult result;
    std::map<SeatNumber, HandRank> ranks;
    for (SeatNumber s : h.participants) {
        const Seat& seat = state_.table.seat_at(s);
        if (seat.status == SeatStatus::FOLDED) continue;
        ShowdownHand shown;
        shown.seat = s;
        shown.hole_cards = seat.hole_cards;
        shown.rank = evaluate_hand(seat.hole_cards, h.community_cards);
        shown.description = hand_rank_to_string(shown.rank);
        ranks[s] = shown.rank;
        spdlog::info("Showdown seat {}: [{}] {}", s, to_string(seat.hole_cards), shown.description);
        result.showdown.push_back(std::move(shown));
    }
    result.awards = h.pots.award(ranks, clockwise_from(h.participants, h.positions.button));
    finish_hand(std::move(result));
}

void HandOrchestrator::finish_hand(HandResult result) {
    Hand& h = hand();
    Table& table = state_.table;

    for (const auto& award : result.awards) {
        for (const auto& [seat, amount] : award.payouts) {
            table.seat_at(seat).chip_count += amount;
            result.net_won[seat] += amount;
        }
    }
    for (const auto& [seat, amount] : result.net_won) {
        spdlog::info("Table {} hand #{}: seat {} wins {}", table.id, h.hand_number, seat, amount);
    }

    h.street = Street::SHOWDOWN;
    h.round.close();
    h.complete = true;
    h.result = std::move(result);

    // Sièges à sec : spectateurs jusqu'à nouvel ordre. button_seat n'est pas
    // déplacé (bouton mort), la main suivante tourne depuis lui.
    int can_play = 0;
    for (auto& s : table.seats) {
        if (s.chip_count == 0) s.status = SeatStatus::SITTING_OUT;
        if (s.can_play()) ++can_play;
    }
    if (can_play < 2) {
        table.status = TableStatus::FINISHED;
        spdlog::info("Table {} finished: {} seat(s) left with chips", table.id, can_play);
    } else {
        spdlog::debug("Table {} ready for next hand", table.id);
    }
}

} // namespace holdem_table
