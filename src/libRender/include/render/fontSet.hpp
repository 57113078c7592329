#pragma once

#include <QFont>
#include <QString>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dicetrail::render {

//! One attempt of acquiring a font.
struct FontSource {
	std::string name;                             //!< Shown in the log.
	std::function<std::optional<QString>()> load; //!< Returns the font family on success.
};

//! Default and large font used by the renderer. Immutable after loading.
class FontSet {
public:
	//! Try the sources in order and stop at the first success.
	//! Falls back to the system font (by family name if given) which always succeeds.
	static FontSet load(const std::vector<FontSource>& sources, const std::string& systemFamily = {});

	static FontSource fromFile(const std::filesystem::path& file);                   //!< Register a font file with the application.
	static std::vector<FontSource> fromFiles(const std::vector<std::string>& files); //!< One source per file, same order.

	const QFont& normal() const;
	const QFont& large() const;
	const QString& family() const;

	//! Index of the source that provided the fonts. Empty if the system fallback was used.
	std::optional<std::size_t> sourceIndex() const;

private:
	FontSet(const QString& family, std::optional<std::size_t> sourceIndex);

private:
	QString m_family;
	QFont m_normal;
	QFont m_large;
	std::optional<std::size_t> m_sourceIndex;
};

} // namespace dicetrail::render
