#pragma once

#include "model/IAnimationState.hpp"
#include "model/board.hpp"
#include "model/turnState.hpp"
#include "render/buttonRegion.hpp"

#include <QColor>

#include <optional>
#include <string>
#include <vector>

//! Rules deciding what the renderer shows. Independent of any drawing surface.
namespace dicetrail::render {

// Board
QColor fillColor(const Cell& cell);          //!< Fill color of a cell by its role.
std::string cellTypeLabel(const Cell& cell); //!< Short type label drawn below the cell center.

// Tokens
Point staggerOffset(std::size_t index);                                    //!< Token offset by player list index. Avoids full overlap on shared cells.
bool isMoving(const Player& player, const IAnimationState& animation);     //!< The animation currently moves this player.
std::optional<Point> tokenPosition(const Player& player, std::size_t index, const Board& board, const IAnimationState& animation);

// Status panel
//! True if the slot at index is controlled by the viewer of this client.
bool isLocalSlot(const TurnState& state, std::size_t index);
//! Name of a human player: the announced name of remote participants, otherwise the local nickname.
std::string humanName(const TurnState& state, const Player& player, const std::string& nickname);
//! Complete status panel line of the player at index. Includes local and current player markers.
std::string playerLine(const TurnState& state, std::size_t index, const std::string& nickname);
//! Name of the current player in the status line. Empty if there is no current player.
std::string currentPlayerName(const TurnState& state, const std::string& nickname);
//! Status line shown above the bottom edge. Empty if there is no current player.
std::string statusLine(const TurnState& state, const std::string& nickname);
//! Die results below the player list. Dice not rolled yet are left out.
std::vector<std::string> diceLines(const TurnState& state);

// Action button
bool canAct(const TurnState& state);                                     //!< The viewer may act in the current turn.
std::optional<ButtonRegion::Kind> selectButton(const TurnState& state); //!< Button to show this frame, if any.
std::string buttonLabel(ButtonRegion::Kind kind);
QColor buttonColor(ButtonRegion::Kind kind);

} // namespace dicetrail::render
