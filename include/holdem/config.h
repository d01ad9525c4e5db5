#ifndef HOLDEM_CONFIG_H
#define HOLDEM_CONFIG_H

#include <chrono>
#include <functional>

#include "core/deck.hpp"

namespace holdem_table {

// Fabrique du paquet de chaque main (injectée dans les tests)
using DeckFactory = std::function<Deck()>;

struct EngineConfig {
    // Délai avant check / fold automatique ; 0 désactive le minuteur
    std::chrono::milliseconds action_timeout{30000};
    // 2 = une nouvelle tentative après un échec de persistance
    int commit_attempts = 2;
    // Vide : paquet mélangé depuis std::random_device
    DeckFactory deck_factory;
};

} // namespace holdem_table

#endif // HOLDEM_CONFIG_H
