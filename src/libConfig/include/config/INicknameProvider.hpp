#pragma once

#include <string>

namespace dicetrail::config {

//! Resolves the nickname the local user configured for themselves.
class INicknameProvider {
public:
	virtual ~INicknameProvider()         = default;
	virtual std::string nickname() const = 0;
};

} // namespace dicetrail::config
