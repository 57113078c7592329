#include "config/configManager.hpp"
#include "Logging.hpp"

#include <QString>
#include <QStringList>

#include <format>

namespace dicetrail::config {

namespace {
constexpr auto KEY_NICKNAME      = "player/nickname";
constexpr auto KEY_FONTS         = "fonts/candidates";
constexpr auto KEY_SYSTEM_FAMILY = "fonts/systemFamily";

constexpr auto DEFAULT_NICKNAME = "Player";

//! CJK capable fonts shipped by common distributions.
const QStringList DEFAULT_FONTS{
        "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/truetype/wqy/wqy-microhei.ttc",
};
} // namespace

ConfigManager::ConfigManager() : m_settings{QSettings::IniFormat, QSettings::UserScope, "Dicetrail", "dicetrail"} {
	logStatus();
}

ConfigManager::ConfigManager(const std::filesystem::path& file) : m_settings{QString::fromStdString(file.string()), QSettings::IniFormat} {
	logStatus();
}

std::string ConfigManager::nickname() const {
	const auto value = m_settings.value(KEY_NICKNAME).toString();
	if (value.isEmpty()) {
		return DEFAULT_NICKNAME;
	}
	return value.toStdString();
}

bool ConfigManager::setNickname(const std::string& nickname) {
	if (nickname.empty()) {
		Logger().Log(Logging::LogLevel::Warning, "Rejected empty nickname.");
		return false;
	}

	m_settings.setValue(KEY_NICKNAME, QString::fromStdString(nickname));
	Logger().Log(Logging::LogLevel::Info, std::format("Nickname set to '{}'.", nickname));
	return true;
}

std::vector<std::string> ConfigManager::fontCandidates() const {
	const auto list = m_settings.value(KEY_FONTS, DEFAULT_FONTS).toStringList();

	std::vector<std::string> paths;
	paths.reserve(static_cast<std::size_t>(list.size()));
	for (const auto& path: list) {
		paths.push_back(path.toStdString());
	}
	return paths;
}

void ConfigManager::setFontCandidates(const std::vector<std::string>& paths) {
	QStringList list;
	for (const auto& path: paths) {
		list.push_back(QString::fromStdString(path));
	}
	m_settings.setValue(KEY_FONTS, list);
}

std::string ConfigManager::systemFontFamily() const {
	return m_settings.value(KEY_SYSTEM_FAMILY).toString().toStdString();
}

void ConfigManager::setSystemFontFamily(const std::string& family) {
	m_settings.setValue(KEY_SYSTEM_FAMILY, QString::fromStdString(family));
}

void ConfigManager::sync() {
	m_settings.sync();
	logStatus();
}

void ConfigManager::logStatus() const {
	switch (m_settings.status()) {
	case QSettings::NoError:
		break;
	case QSettings::AccessError:
		Logger().Log(Logging::LogLevel::Warning, std::format("Cannot access settings file '{}'. Using defaults.", m_settings.fileName().toStdString()));
		break;
	case QSettings::FormatError:
		Logger().Log(Logging::LogLevel::Warning, std::format("Malformed settings file '{}'. Using defaults.", m_settings.fileName().toStdString()));
		break;
	}
}

} // namespace dicetrail::config
