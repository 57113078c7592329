#include "render/fontSet.hpp"
#include "Logging.hpp"
#include "render/layout.hpp"

#include <QFontDatabase>
#include <QStringList>

#include <format>

namespace dicetrail::render {

FontSet FontSet::load(const std::vector<FontSource>& sources, const std::string& systemFamily) {
	for (std::size_t i = 0; i != sources.size(); ++i) {
		const auto& source = sources[i];
		const auto family  = source.load ? source.load() : std::optional<QString>{};
		if (family && !family->isEmpty()) {
			Logger().Log(Logging::LogLevel::Info, std::format("Using font '{}' from '{}'.", family->toStdString(), source.name));
			return FontSet{*family, i};
		}

		Logger().Log(Logging::LogLevel::Warning, std::format("Font source '{}' unavailable. Trying next.", source.name));
	}

	// Terminal fallback. Qt resolves unknown families to a substitute, so this cannot fail.
	auto family = systemFamily.empty() ? QFontDatabase::systemFont(QFontDatabase::GeneralFont).family()
	                                   : QFont(QString::fromStdString(systemFamily)).family();
	if (family.isEmpty()) {
		family = QFont().defaultFamily();
	}
	Logger().Log(Logging::LogLevel::Info, std::format("Using system font '{}'.", family.toStdString()));
	return FontSet{family, std::nullopt};
}

FontSource FontSet::fromFile(const std::filesystem::path& file) {
	return {file.string(), [file]() -> std::optional<QString> {
		        const auto id = QFontDatabase::addApplicationFont(QString::fromStdString(file.string()));
		        if (id < 0) {
			        return std::nullopt;
		        }

		        const auto families = QFontDatabase::applicationFontFamilies(id);
		        if (families.isEmpty()) {
			        return std::nullopt;
		        }
		        return families.front();
	        }};
}

std::vector<FontSource> FontSet::fromFiles(const std::vector<std::string>& files) {
	std::vector<FontSource> sources;
	sources.reserve(files.size());
	for (const auto& file: files) {
		sources.push_back(fromFile(file));
	}
	return sources;
}

FontSet::FontSet(const QString& family, const std::optional<std::size_t> sourceIndex)
    : m_family{family}, m_normal{family}, m_large{family}, m_sourceIndex{sourceIndex} {
	m_normal.setPixelSize(FONT_SIZE);
	m_large.setPixelSize(LARGE_FONT_SIZE);
}

const QFont& FontSet::normal() const {
	return m_normal;
}

const QFont& FontSet::large() const {
	return m_large;
}

const QString& FontSet::family() const {
	return m_family;
}

std::optional<std::size_t> FontSet::sourceIndex() const {
	return m_sourceIndex;
}

} // namespace dicetrail::render
