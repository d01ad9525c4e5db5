#include "holdem/table_engine.h"
#include "holdem/game_utils.hpp"
#include "holdem/errors.h"
#include "spdlog/spdlog.h"

#include <iostream>   // std::cerr
#include <random>     // std::mt19937
#include <string>
#include <vector>

namespace {

// Publie chaque transition dans le log (à la place d'un transport réel)
class LoggingObserver : public holdem_table::StateObserver {
public:
    void notify_state_changed(const std::string& table_id, const holdem_table::PublicView& view) override {
        spdlog::debug("[{}] {} | hand #{} | pot {} | bet {} | to act {}",
                      table_id, holdem_table::table_status_to_string(view.status), view.hand_number,
                      view.pot_size, view.current_bet,
                      view.seat_to_act ? std::to_string(*view.seat_to_act) : "-");
    }
};

// Joueur scripté : choisit une action légale au hasard, relances au minimum
holdem_table::Action pick_action(const holdem_table::LegalActions& legal,
                                 holdem_table::SeatNumber seat,
                                 std::mt19937& rng)
{
    using holdem_table::ActionType;
    std::uniform_int_distribution<int> roll(0, 99);
    const int r = roll(rng);

    if (legal.allows(ActionType::RAISE) && r < 10) return {seat, ActionType::RAISE, legal.min_raise_to};
    if (legal.allows(ActionType::BET) && r < 20)   return {seat, ActionType::BET, legal.min_bet};
    if (legal.allows(ActionType::CHECK))           return {seat, ActionType::CHECK, 0};
    if (legal.allows(ActionType::CALL) && r < 80)  return {seat, ActionType::CALL, 0};
    return {seat, ActionType::FOLD, 0};
}

} // namespace

int main(int /*argc*/, char* /*argv*/[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::info("Démarrage de la simulation de table…");

    // ─────────────────────────────────────────────────────────────
    // Paramètres généraux
    // ─────────────────────────────────────────────────────────────
    const std::string table_id    = "demo";
    const int         num_players = 4;
    const int         max_hands   = 50;
    const uint64_t    seed        = 20240611;

    try
    {
        holdem_table::TableState initial;
        initial.table.id = table_id;
        initial.table.settings = holdem_table::TableSettings{5, 10, 500, 8};
        initial.table.settings.validate();
        for (int i = 1; i <= num_players; ++i) {
            holdem_table::Seat seat;
            seat.seat_number = i;
            seat.occupant = "bot-" + std::to_string(i);
            seat.chip_count = initial.table.settings.buy_in;
            initial.table.seats.push_back(seat);
        }

        holdem_table::InMemoryTableRepository repository;
        repository.put(initial);
        LoggingObserver observer;

        std::mt19937 deck_seeds(static_cast<std::mt19937::result_type>(seed));
        holdem_table::EngineConfig config;
        config.action_timeout = std::chrono::milliseconds(0); // les bots répondent tout de suite
        config.deck_factory = [&deck_seeds] { return holdem_table::Deck(deck_seeds()); };

        holdem_table::TableEngine engine(repository, observer, config);
        std::mt19937 bots(static_cast<std::mt19937::result_type>(seed + 1));

        engine.start_table(table_id);
        for (int hand = 1; hand <= max_hands; ++hand)
        {
            holdem_table::PublicView view = engine.view(table_id);
            while (view.seat_to_act)
            {
                const holdem_table::SeatNumber seat = *view.seat_to_act;
                const auto legal = engine.legal_actions(table_id, seat);
                engine.submit_action(table_id, seat, pick_action(legal, seat, bots));
                view = engine.view(table_id);
            }
            if (view.status == holdem_table::TableStatus::FINISHED) break;
            engine.start_hand(table_id);
        }

        const holdem_table::PublicView final_view = engine.view(table_id);
        spdlog::info("Table {} après {} main(s), statut {}", table_id, final_view.hand_number,
                     holdem_table::table_status_to_string(final_view.status));
        for (const auto& seat : final_view.seats) {
            spdlog::info("  Siège {} ({}): {} jetons, {}", seat.seat, seat.occupant, seat.chip_count,
                         holdem_table::seat_status_to_string(seat.status));
        }
    }
    catch (const holdem_table::EngineError& e)
    {
        spdlog::critical("Erreur moteur ({}) : {}", holdem_table::error_kind_to_string(e.kind()), e.what());
        std::cerr << "Erreur moteur : " << e.what() << '\n';
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
