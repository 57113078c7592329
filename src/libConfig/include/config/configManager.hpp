#pragma once

#include "config/INicknameProvider.hpp"

#include <QSettings>

#include <filesystem>
#include <string>
#include <vector>

namespace dicetrail::config {

//! Persistent user settings stored in an ini file.
class ConfigManager : public INicknameProvider {
public:
	//! Use the default per-user settings location of the application.
	ConfigManager();
	//! Use the given ini file. Created on first write.
	explicit ConfigManager(const std::filesystem::path& file);

	std::string nickname() const override;
	bool setNickname(const std::string& nickname); //!< Store the nickname. False if empty.

	std::vector<std::string> fontCandidates() const; //!< Font files to try in order.
	void setFontCandidates(const std::vector<std::string>& paths);

	std::string systemFontFamily() const; //!< Family of the terminal fallback font. Empty for the system default.
	void setSystemFontFamily(const std::string& family);

	void sync(); //!< Write pending changes to disk.

private:
	void logStatus() const;

private:
	QSettings m_settings;
};

} // namespace dicetrail::config
