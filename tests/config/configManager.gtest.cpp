#include "config/configManager.hpp"

#include <QTemporaryDir>

#include <filesystem>
#include <gtest/gtest.h>

namespace dicetrail::config::gtest {

class ConfigManagerTest : public ::testing::Test {
protected:
	std::filesystem::path settingsFile() const {
		return std::filesystem::path(m_dir.path().toStdString()) / "dicetrail.ini";
	}

private:
	QTemporaryDir m_dir;
};

TEST_F(ConfigManagerTest, Defaults) {
	ConfigManager config(settingsFile());
	EXPECT_EQ(config.nickname(), "Player");
	EXPECT_FALSE(config.fontCandidates().empty());
	EXPECT_TRUE(config.systemFontFamily().empty());
}

TEST_F(ConfigManagerTest, NicknamePersists) {
	{
		ConfigManager config(settingsFile());
		EXPECT_TRUE(config.setNickname("Ann"));
		EXPECT_EQ(config.nickname(), "Ann");
		config.sync();
	}

	ConfigManager reloaded(settingsFile());
	EXPECT_EQ(reloaded.nickname(), "Ann");
}

TEST_F(ConfigManagerTest, RejectEmptyNickname) {
	ConfigManager config(settingsFile());
	ASSERT_TRUE(config.setNickname("Bob"));
	EXPECT_FALSE(config.setNickname(""));
	EXPECT_EQ(config.nickname(), "Bob");
}

TEST_F(ConfigManagerTest, FontSettings) {
	{
		ConfigManager config(settingsFile());
		config.setFontCandidates({"/fonts/a.ttf", "/fonts/b.ttc"});
		config.setSystemFontFamily("Sans");
		config.sync();
	}

	ConfigManager reloaded(settingsFile());
	const std::vector<std::string> expected{"/fonts/a.ttf", "/fonts/b.ttc"};
	EXPECT_EQ(reloaded.fontCandidates(), expected);
	EXPECT_EQ(reloaded.systemFontFamily(), "Sans");
}

TEST_F(ConfigManagerTest, NicknameProviderInterface) {
	ConfigManager config(settingsFile());
	ASSERT_TRUE(config.setNickname("Ann"));

	const INicknameProvider& provider = config;
	EXPECT_EQ(provider.nickname(), "Ann");
}

} // namespace dicetrail::config::gtest
