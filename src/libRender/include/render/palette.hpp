#pragma once

#include <QColor>

#include <array>

namespace dicetrail::render::palette {

inline const QColor WHITE{255, 255, 255};
inline const QColor BLACK{0, 0, 0};
inline const QColor RED{220, 30, 30};
inline const QColor GREEN{60, 200, 90};
inline const QColor GRAY{200, 200, 200};
inline const QColor LIGHT_BLUE{150, 200, 240};
inline const QColor GOLD{255, 200, 0};

inline const QColor& BACKGROUND = WHITE;
inline const QColor& TEXT       = BLACK;
inline const QColor& ALERT      = RED;  //!< Current player line.
inline const QColor& ATTENTION  = GOLD; //!< Waiting for the effect die, moving token ring.
inline const QColor& NEUTRAL    = GRAY; //!< Plain cells.

inline const QColor REWARD{250, 235, 130};
inline const QColor PENALTY{190, 140, 210};

//! Home cell color per owner slot.
inline const std::array<QColor, 4> HOME{
        QColor{240, 110, 110},
        QColor{110, 140, 240},
        QColor{120, 210, 120},
        QColor{245, 165, 70},
};

// Action buttons
inline const QColor& BUTTON_RESTART     = GREEN;
inline const QColor& BUTTON_EFFECT_DICE = GOLD;
inline const QColor& BUTTON_DICE        = LIGHT_BLUE;

} // namespace dicetrail::render::palette
