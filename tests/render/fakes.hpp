#pragma once

#include "config/INicknameProvider.hpp"
#include "model/IAnimationState.hpp"

#include <string>
#include <utility>

namespace dicetrail::render::gtest {

class FixedNickname : public config::INicknameProvider {
public:
	explicit FixedNickname(std::string nickname) : m_nickname{std::move(nickname)} {
	}
	std::string nickname() const override {
		return m_nickname;
	}

private:
	std::string m_nickname;
};

//! Animation snapshot with a fixed position. Counts position queries.
class FixedAnimation : public IAnimationState {
public:
	FixedAnimation() = default;
	FixedAnimation(unsigned playerId, Point position) : m_moving{true}, m_playerId{playerId}, m_position{position} {
	}

	bool playerMoving() const override {
		return m_moving;
	}
	unsigned movingPlayerId() const override {
		return m_playerId;
	}
	Point animatedPosition(unsigned playerId, const Board&) const override {
		++queries;
		lastQueried = playerId;
		return m_position;
	}

	mutable unsigned queries{0u};
	mutable unsigned lastQueried{0u};

private:
	bool m_moving{false};
	unsigned m_playerId{0u};
	Point m_position{0, 0};
};

} // namespace dicetrail::render::gtest
