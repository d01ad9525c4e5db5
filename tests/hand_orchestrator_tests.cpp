#include <catch2/catch_test_macros.hpp>
#include "holdem/hand_orchestrator.h"
#include "holdem/public_view.h"
#include "holdem/errors.h"
#include "test_helpers.hpp"

#include <random>

using namespace holdem_table;
using namespace holdem_table::test;

namespace {
void submit(TableState& state, SeatNumber seat, ActionType type, Chips amount = 0) {
    HandOrchestrator(state).submit_action(Action{seat, type, amount});
}
} // namespace

TEST_CASE("Heads-up fold preflop", "[orchestrator]") {
    TableState state = make_state({100, 100});
    HandOrchestrator orchestrator(state);
    orchestrator.start_table(Deck(1));

    REQUIRE(state.table.status == TableStatus::IN_PROGRESS);
    REQUIRE(state.hand);
    REQUIRE(state.hand->positions.button == 1);
    REQUIRE(state.hand->positions.small_blind == 1);
    REQUIRE(state.table.seat_at(1).chip_count == 95);
    REQUIRE(state.table.seat_at(2).chip_count == 90);
    REQUIRE(state.table.seat_at(1).hole_cards.size() == 2);
    REQUIRE(state.hand->round.seat_to_act() == 1);

    orchestrator.submit_action(Action{1, ActionType::FOLD, 0});

    REQUIRE(state.hand->complete);
    REQUIRE(state.hand->result->uncontested);
    REQUIRE(state.hand->result->showdown.empty());
    REQUIRE(state.hand->result->net_won.at(2) == 15);
    REQUIRE(state.table.seat_at(1).chip_count == 95);
    REQUIRE(state.table.seat_at(2).chip_count == 105);
    REQUIRE(state.hand->community_cards.empty());
    REQUIRE_FALSE(state.awaiting_action());
}

TEST_CASE("Three players to showdown", "[orchestrator]") {
    // BTN 1, SB 2, BB 3 ; distribution 2, 3, 1
    TableState state = make_state({100, 100, 100});
    const Deck deck = stacked_deck({2, 3, 1},
                                   {{1, "As Ad"}, {2, "Kh Kd"}, {3, "7c 2d"}},
                                   "Ac 9h 4s 3c Jd");
    HandOrchestrator(state).start_table(deck);
    REQUIRE(state.table.seat_at(1).hole_cards == cards_from_string("As Ad"));
    REQUIRE(state.hand->round.seat_to_act() == 1);

    // Préflop
    submit(state, 1, ActionType::RAISE, 30);
    submit(state, 2, ActionType::CALL);
    submit(state, 3, ActionType::FOLD);
    REQUIRE(state.hand->street == Street::FLOP);
    REQUIRE(state.hand->community_cards == cards_from_string("Ac 9h 4s"));
    REQUIRE(state.hand->pots.total() == 70);

    // Flop : premier siège actif après le bouton
    REQUIRE(state.hand->round.seat_to_act() == 2);
    submit(state, 2, ActionType::CHECK);
    submit(state, 1, ActionType::BET, 50);
    submit(state, 2, ActionType::CALL);
    REQUIRE(state.hand->street == Street::TURN);
    REQUIRE(state.hand->community_cards.size() == 4);

    submit(state, 2, ActionType::CHECK);
    submit(state, 1, ActionType::CHECK);
    REQUIRE(state.hand->street == Street::RIVER);
    submit(state, 2, ActionType::CHECK);
    submit(state, 1, ActionType::CHECK);

    REQUIRE(state.hand->complete);
    REQUIRE(state.hand->community_cards == cards_from_string("Ac 9h 4s 3c Jd"));
    const HandResult& result = *state.hand->result;
    REQUIRE_FALSE(result.uncontested);
    REQUIRE(result.showdown.size() == 2);
    REQUIRE(result.net_won.at(1) == 170);
    REQUIRE(result.showdown[0].description == "Three of a Kind");
    REQUIRE(state.table.seat_at(1).chip_count == 190);
    REQUIRE(state.table.seat_at(2).chip_count == 20);
    REQUIRE(state.table.seat_at(3).chip_count == 90);
    REQUIRE(state.table.total_chips() == 300);
    REQUIRE(state.hand->action_sequence == 10);

    SECTION("Next hand moves the button") {
        HandOrchestrator(state).start_hand(Deck(3));
        REQUIRE(state.hand->hand_number == 2);
        REQUIRE(state.table.button_seat == 2);
        REQUIRE(state.hand->positions.small_blind == 3);
        REQUIRE(state.hand->positions.big_blind == 1);
        REQUIRE(state.table.seat_at(3).status == SeatStatus::PLAYING);
    }
}

TEST_CASE("All-in preflop runs the board out", "[orchestrator]") {
    TableState state = make_state({100, 100});
    // HU : bouton 1, distribution 2 puis 1
    const Deck deck = stacked_deck({2, 1}, {{1, "Ah Ac"}, {2, "7s 2d"}}, "Kd 9c 4h 3s Js");
    HandOrchestrator(state).start_table(deck);

    submit(state, 1, ActionType::RAISE, 100);
    submit(state, 2, ActionType::CALL);

    REQUIRE(state.hand->complete);
    REQUIRE(state.hand->community_cards.size() == 5);
    REQUIRE(state.table.seat_at(1).chip_count == 200);
    REQUIRE(state.table.seat_at(2).chip_count == 0);
    REQUIRE(state.table.seat_at(2).status == SeatStatus::SITTING_OUT);
    REQUIRE(state.table.status == TableStatus::FINISHED);

    REQUIRE_THROWS_AS(HandOrchestrator(state).start_hand(Deck(2)), InvalidActionError);
}

TEST_CASE("Short big blind is all-in", "[orchestrator]") {
    TableState state = make_state({100, 100, 4});
    HandOrchestrator(state).start_table(Deck(5));

    REQUIRE(state.table.seat_at(3).status == SeatStatus::ALL_IN);
    REQUIRE(state.hand->round.current_bet() == 10);
    submit(state, 1, ActionType::CALL);
    submit(state, 2, ActionType::CALL);
    REQUIRE(state.hand->street == Street::FLOP);

    const auto pots = state.hand->pots.pots();
    REQUIRE(pots.size() == 2);
    REQUIRE(pots[0].amount == 12);
    REQUIRE(pots[0].eligible_seats == std::vector<SeatNumber>{1, 2, 3});
    REQUIRE(pots[1].amount == 12);
    REQUIRE(pots[1].eligible_seats == std::vector<SeatNumber>{1, 2});
}

TEST_CASE("Folding to a short all-in big blind", "[orchestrator]") {
    SECTION("Heads-up: the small blind gets back what the big blind never covered") {
        TableState state = make_state({100, 3});
        HandOrchestrator(state).start_table(Deck(5));
        REQUIRE(state.table.seat_at(2).status == SeatStatus::ALL_IN);
        REQUIRE(state.hand->round.seat_to_act() == 1);

        submit(state, 1, ActionType::FOLD);

        REQUIRE(state.hand->complete);
        REQUIRE(state.hand->result->uncontested);
        REQUIRE(state.table.seat_at(1).chip_count == 97);
        REQUIRE(state.table.seat_at(2).chip_count == 6);
        REQUIRE(state.table.total_chips() == 103);
    }

    SECTION("Three players: button and small blind both fold") {
        TableState state = make_state({100, 100, 3});
        HandOrchestrator(state).start_table(Deck(5));
        REQUIRE(state.table.seat_at(3).status == SeatStatus::ALL_IN);

        submit(state, 1, ActionType::FOLD);
        submit(state, 2, ActionType::FOLD);

        REQUIRE(state.hand->complete);
        REQUIRE(state.table.seat_at(1).chip_count == 100);
        REQUIRE(state.table.seat_at(2).chip_count == 97);
        REQUIRE(state.table.seat_at(3).chip_count == 6);
        REQUIRE(state.hand->result->net_won.at(3) == 6);
        REQUIRE(state.hand->result->net_won.at(2) == 2);
    }
}

TEST_CASE("Busted button stays as a dead button", "[orchestrator]") {
    // BTN 1 (10 jetons) part all-in au call et perd ; distribution 2, 3, 1
    TableState state = make_state({10, 100, 100});
    const Deck deck = stacked_deck({2, 3, 1},
                                   {{1, "7c 2d"}, {2, "As Ad"}, {3, "Kh Kd"}},
                                   "Ac 9h 4s 3c Jd");
    HandOrchestrator(state).start_table(deck);

    submit(state, 1, ActionType::CALL);
    REQUIRE(state.table.seat_at(1).status == SeatStatus::ALL_IN);
    submit(state, 2, ActionType::CALL);
    submit(state, 3, ActionType::CHECK);
    for (int street = 0; street < 3; ++street) {
        submit(state, 2, ActionType::CHECK);
        submit(state, 3, ActionType::CHECK);
    }

    REQUIRE(state.hand->complete);
    REQUIRE(state.table.seat_at(2).chip_count == 120);
    REQUIRE(state.table.seat_at(1).status == SeatStatus::SITTING_OUT);
    REQUIRE(state.table.status == TableStatus::IN_PROGRESS);
    // Le marqueur reste sur le siège sorti jusqu'à la main suivante
    REQUIRE(state.table.button_seat == 1);

    HandOrchestrator(state).start_hand(Deck(8));
    REQUIRE(state.table.button_seat == 2);
    REQUIRE(state.hand->positions.small_blind == 2);
    REQUIRE(state.hand->positions.big_blind == 3);
    REQUIRE(state.hand->participants == std::vector<SeatNumber>{2, 3});
}

TEST_CASE("Rejected actions leave the hand untouched", "[orchestrator]") {
    TableState state = make_state({100, 100, 100});
    HandOrchestrator(state).start_table(Deck(9));
    const TableState before = state;

    REQUIRE_THROWS_AS(submit(state, 2, ActionType::CALL), NotYourTurnError);
    REQUIRE_THROWS_AS(submit(state, 1, ActionType::CHECK), InvalidActionError);
    REQUIRE_THROWS_AS(submit(state, 7, ActionType::CALL), InvalidActionError);
    REQUIRE(state.hand->action_sequence == before.hand->action_sequence);
    REQUIRE(state.table.total_chips() == before.table.total_chips());
    REQUIRE(state.hand->round.seat_to_act() == 1);
}

TEST_CASE("Table and hand lifecycle errors", "[orchestrator]") {
    SECTION("Not enough players with chips") {
        TableState state = make_state({100, 0});
        REQUIRE_THROWS_AS(HandOrchestrator(state).start_table(Deck(1)), InsufficientPlayersError);
        REQUIRE(state.table.status == TableStatus::WAITING);
    }

    SECTION("Invalid settings") {
        TableState state = make_state({100, 100}, 10, 5);
        REQUIRE_THROWS_AS(HandOrchestrator(state).start_table(Deck(1)), InvalidConfigurationError);
    }

    SECTION("Hand already in progress") {
        TableState state = make_state({100, 100});
        HandOrchestrator(state).start_table(Deck(1));
        REQUIRE_THROWS_AS(HandOrchestrator(state).start_table(Deck(1)), InvalidActionError);
        REQUIRE_THROWS_AS(HandOrchestrator(state).start_hand(Deck(1)), InvalidActionError);
    }

    SECTION("Hand before the table is started") {
        TableState state = make_state({100, 100});
        REQUIRE_THROWS_AS(HandOrchestrator(state).start_hand(Deck(1)), InvalidActionError);
    }
}

TEST_CASE("Public view hides private cards", "[orchestrator]") {
    TableState state = make_state({100, 100, 100});
    HandOrchestrator(state).start_table(Deck(11));

    const PublicView spectator = build_public_view(state);
    REQUIRE(spectator.hand_number == 1);
    REQUIRE(spectator.pot_size == 15);
    REQUIRE(spectator.current_bet == 10);
    REQUIRE(spectator.seat_to_act == 1);
    for (const auto& seat : spectator.seats) {
        REQUIRE(seat.has_cards);
        REQUIRE(seat.cards.empty());
    }
    REQUIRE(spectator.seats[0].is_turn);
    REQUIRE(spectator.seats[2].committed_this_street == 10);

    const PublicView seat_two = build_public_view(state, 2);
    REQUIRE(seat_two.seats[1].cards == state.table.seat_at(2).hole_cards);
    REQUIRE(seat_two.seats[0].cards.empty());
}

TEST_CASE("Chips are conserved over many hands", "[orchestrator]") {
    TableState state = make_state({200, 150, 100, 300, 50, 250});
    const Chips total = state.table.total_chips();
    std::mt19937 rng(2024);
    std::uniform_int_distribution<int> roll(0, 99);

    HandOrchestrator(state).start_table(Deck(100));
    for (int hand = 0; hand < 40 && state.table.status == TableStatus::IN_PROGRESS; ++hand) {
        int guard = 0;
        while (state.awaiting_action()) {
            REQUIRE(++guard < 200);
            const SeatNumber seat = *state.hand->round.seat_to_act();
            const LegalActions legal = HandOrchestrator(state).legal_actions(seat);
            REQUIRE_FALSE(legal.actions.empty());

            const int r = roll(rng);
            Action action{seat, ActionType::FOLD, 0};
            if (legal.allows(ActionType::RAISE) && r < 15) action = {seat, ActionType::RAISE, legal.max_raise_to};
            else if (legal.allows(ActionType::BET) && r < 30) action = {seat, ActionType::BET, legal.min_bet};
            else if (legal.allows(ActionType::CHECK)) action = {seat, ActionType::CHECK, 0};
            else if (legal.allows(ActionType::CALL) && r < 85) action = {seat, ActionType::CALL, 0};
            submit(state, seat, action.type, action.amount);

            REQUIRE(state.table.total_chips() + (state.hand->complete ? 0 : state.hand->pots.total()) == total);
        }
        REQUIRE(state.hand->complete);
        REQUIRE(state.table.total_chips() == total);
        if (state.table.status == TableStatus::IN_PROGRESS) {
            HandOrchestrator(state).start_hand(Deck(static_cast<uint64_t>(200 + hand)));
        }
    }
}
