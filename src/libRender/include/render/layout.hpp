#pragma once

namespace dicetrail::render {

// Surface
constexpr int WINDOW_WIDTH  = 1000; //!< Default surface width [px].
constexpr int WINDOW_HEIGHT = 800;  //!< Default surface height [px].

// Board
constexpr int CELL_SIZE      = 60;  //!< Edge length of a cell square [px].
constexpr int OUTLINE_WIDTH  = 2;   //!< Outline of cells, tokens and buttons [px].
constexpr int INDEX_LABEL_DY = -20; //!< Vertical offset of the index label from the cell center.
constexpr int TYPE_LABEL_DY  = 10;  //!< Vertical offset of the type label from the cell center.

// Tokens
constexpr int TOKEN_RADIUS     = 8;
constexpr int HIGHLIGHT_RADIUS = 12; //!< Ring around the moving token.
constexpr int STAGGER_STEP     = 15; //!< Distance between tokens sharing a cell.
constexpr int STAGGER_BIAS     = 7;

// Fonts
constexpr int FONT_SIZE       = 20; //!< Default text [px].
constexpr int LARGE_FONT_SIZE = 32; //!< Headlines [px].

// Status panel
constexpr int PANEL_X             = 10;
constexpr int PANEL_Y             = 10;
constexpr int PLAYER_LINE_SPACING = 30;
constexpr int DICE_GAP            = 20; //!< Space between the player list and the dice lines.
constexpr int DICE_LINE_SPACING   = 25;
constexpr int MESSAGE_BOTTOM      = 80; //!< Distance of the message line from the bottom edge.
constexpr int STATUS_BOTTOM       = 40; //!< Distance of the status line center from the bottom edge.

// Action button (bottom right corner)
constexpr int BUTTON_WIDTH  = 120;
constexpr int BUTTON_HEIGHT = 40;
constexpr int BUTTON_RIGHT  = 150; //!< Distance of the left button edge from the right surface edge.
constexpr int BUTTON_BOTTOM = 60;  //!< Distance of the top button edge from the bottom surface edge.

} // namespace dicetrail::render
