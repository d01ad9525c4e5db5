#include <catch2/catch_test_macros.hpp>
#include "holdem/action_validator.h"
#include "holdem/errors.h"
#include "test_helpers.hpp"

using namespace holdem_table;
using namespace holdem_table::test;

TEST_CASE("Preflop validation", "[validator]") {
    // BTN 1, SB 2, BB 3 ; le bouton parle en premier à trois
    Table table = make_table({100, 100, 100});
    BettingRound round = open_preflop(table, 2, 3, 1);
    REQUIRE(round.seat_to_act() == 1);
    const Seat& utg = table.seat_at(1);

    SECTION("Out of turn") {
        REQUIRE_THROWS_AS(validate_action(round, table.seat_at(2), Action{2, ActionType::CALL, 0}, 10),
                          NotYourTurnError);
    }

    SECTION("Check facing a bet") {
        REQUIRE_THROWS_AS(validate_action(round, utg, Action{1, ActionType::CHECK, 0}, 10), InvalidActionError);
    }

    SECTION("Amounts only on bet and raise") {
        REQUIRE_THROWS_AS(validate_action(round, utg, Action{1, ActionType::CALL, 10}, 10), InvalidActionError);
        REQUIRE_THROWS_AS(validate_action(round, utg, Action{1, ActionType::FOLD, 5}, 10), InvalidActionError);
    }

    SECTION("Call matches the current bet") {
        const ValidatedAction v = validate_action(round, utg, Action{1, ActionType::CALL, 0}, 10);
        REQUIRE(v.chips_to_commit == 10);
        REQUIRE(v.new_total == 10);
        REQUIRE_FALSE(v.goes_all_in);
    }

    SECTION("Bet is not allowed once blinds are posted") {
        REQUIRE_THROWS_AS(validate_action(round, utg, Action{1, ActionType::BET, 20}, 10), InvalidActionError);
    }

    SECTION("Raise sizing") {
        REQUIRE_THROWS_AS(validate_action(round, utg, Action{1, ActionType::RAISE, 15}, 10), InvalidActionError);
        REQUIRE_THROWS_AS(validate_action(round, utg, Action{1, ActionType::RAISE, 10}, 10), InvalidActionError);
        REQUIRE_THROWS_AS(validate_action(round, utg, Action{1, ActionType::RAISE, 101}, 10), InvalidActionError);

        const ValidatedAction min_raise = validate_action(round, utg, Action{1, ActionType::RAISE, 20}, 10);
        REQUIRE(min_raise.chips_to_commit == 20);
        REQUIRE(min_raise.full_raise);

        const ValidatedAction shove = validate_action(round, utg, Action{1, ActionType::RAISE, 100}, 10);
        REQUIRE(shove.goes_all_in);
        REQUIRE(shove.full_raise);
    }

    SECTION("Short all-in raise is legal but incomplete") {
        table.seat_at(1).chip_count = 15;
        const ValidatedAction v = validate_action(round, table.seat_at(1), Action{1, ActionType::RAISE, 15}, 10);
        REQUIRE(v.goes_all_in);
        REQUIRE_FALSE(v.full_raise);
    }

    SECTION("Call capped at the stack") {
        table.seat_at(1).chip_count = 4;
        const ValidatedAction v = validate_action(round, table.seat_at(1), Action{1, ActionType::CALL, 0}, 10);
        REQUIRE(v.chips_to_commit == 4);
        REQUIRE(v.new_total == 4);
        REQUIRE(v.goes_all_in);
    }

    SECTION("Seat not playing") {
        Seat folded = utg;
        folded.status = SeatStatus::FOLDED;
        REQUIRE_THROWS_AS(validate_action(round, folded, Action{1, ActionType::CALL, 0}, 10), InvalidActionError);
    }
}

TEST_CASE("Postflop validation", "[validator]") {
    Table table = make_table({100, 100, 30});
    BettingRound round = BettingRound::open(Street::FLOP, 0, 10, {}, table, 2);
    REQUIRE(round.seat_to_act() == 2);
    const Seat& seat = table.seat_at(2);

    REQUIRE(validate_action(round, seat, Action{2, ActionType::CHECK, 0}, 10).chips_to_commit == 0);
    REQUIRE_THROWS_AS(validate_action(round, seat, Action{2, ActionType::CALL, 0}, 10), InvalidActionError);
    REQUIRE_THROWS_AS(validate_action(round, seat, Action{2, ActionType::RAISE, 20}, 10), InvalidActionError);
    REQUIRE_THROWS_AS(validate_action(round, seat, Action{2, ActionType::BET, 0}, 10), InvalidActionError);
    REQUIRE_THROWS_AS(validate_action(round, seat, Action{2, ActionType::BET, 5}, 10), InvalidActionError);
    REQUIRE_THROWS_AS(validate_action(round, seat, Action{2, ActionType::BET, 150}, 10), InvalidActionError);

    const ValidatedAction bet = validate_action(round, seat, Action{2, ActionType::BET, 10}, 10);
    REQUIRE(bet.new_total == 10);
    REQUIRE(bet.full_raise);

    SECTION("All-in bet below the big blind") {
        table.seat_at(2).chip_count = 6;
        const ValidatedAction v = validate_action(round, table.seat_at(2), Action{2, ActionType::BET, 6}, 10);
        REQUIRE(v.goes_all_in);
    }
}

TEST_CASE("No action once the round is complete", "[validator]") {
    Table table = make_table({100, 100});
    BettingRound round = BettingRound::open(Street::RIVER, 0, 10, {}, table, 2);
    act(round, table, Action{2, ActionType::CHECK, 0});
    act(round, table, Action{1, ActionType::CHECK, 0});
    REQUIRE(round.complete());
    REQUIRE_THROWS_AS(validate_action(round, table.seat_at(2), Action{2, ActionType::CHECK, 0}, 10),
                      InvalidActionError);
}

TEST_CASE("Legal actions query", "[validator]") {
    Table table = make_table({100, 100, 100});
    BettingRound round = open_preflop(table, 2, 3, 1);

    SECTION("Facing the big blind") {
        const LegalActions legal = legal_actions(round, table.seat_at(1), 10);
        REQUIRE(legal.allows(ActionType::FOLD));
        REQUIRE(legal.allows(ActionType::CALL));
        REQUIRE(legal.allows(ActionType::RAISE));
        REQUIRE_FALSE(legal.allows(ActionType::CHECK));
        REQUIRE_FALSE(legal.allows(ActionType::BET));
        REQUIRE(legal.call_amount == 10);
        REQUIRE(legal.min_raise_to == 20);
        REQUIRE(legal.max_raise_to == 100);
    }

    SECTION("Not this seat's turn") {
        REQUIRE(legal_actions(round, table.seat_at(2), 10).actions.empty());
    }

    SECTION("Big blind option") {
        act(round, table, Action{1, ActionType::CALL, 0});
        act(round, table, Action{2, ActionType::CALL, 0});
        REQUIRE(round.seat_to_act() == 3);
        const LegalActions legal = legal_actions(round, table.seat_at(3), 10);
        REQUIRE(legal.allows(ActionType::CHECK));
        REQUIRE(legal.allows(ActionType::RAISE));
        REQUIRE_FALSE(legal.allows(ActionType::CALL));
    }
}
