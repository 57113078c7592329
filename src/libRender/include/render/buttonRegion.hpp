#pragma once

#include <QRect>

namespace dicetrail::render {

//! Clickable area of the action button drawn in a frame.
//! Only valid until the next frame is drawn.
struct ButtonRegion {
	enum class Kind {
		Restart,       //!< Start a new game.
		RollEffectDie, //!< Roll the effect die.
		RollDie        //!< Roll the movement die.
	};

	Kind kind;
	QRect rect;

	//! True if the pointer position hits the button.
	bool contains(int x, int y) const {
		return rect.contains(x, y);
	}
};

} // namespace dicetrail::render
