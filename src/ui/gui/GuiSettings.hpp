#ifndef CODETYPER_GUI_SETTINGS_HPP
#define CODETYPER_GUI_SETTINGS_HPP

#include <QSettings>
#include <QString>

namespace codetyper::ui
{
constexpr int g_defaultDurationSeconds = 60;
inline const QString g_defaultLanguageId = QStringLiteral("py");
inline const QString g_defaultModel = QStringLiteral("deepseek-ai/DeepSeek-R1-0528");

// Falls back to the key passed in (usually taken from the environment) when none is stored.
inline QString readApiKey(const QString& fallback = {})
{
    QSettings settings{};
    const QString stored = settings.value("generator/apiKey").toString();
    return stored.isEmpty() ? fallback : stored;
}

inline void writeApiKey(const QString& key)
{
    QSettings settings{};
    settings.setValue("generator/apiKey", key);
}

inline QString readModel()
{
    QSettings settings{};
    return settings.value("generator/model", g_defaultModel).toString();
}

inline void writeModel(const QString& model)
{
    QSettings settings{};
    settings.setValue("generator/model", model);
}

inline QString readLanguageId()
{
    QSettings settings{};
    return settings.value("practice/language", g_defaultLanguageId).toString();
}

inline void writeLanguageId(const QString& id)
{
    QSettings settings{};
    settings.setValue("practice/language", id);
}

inline int readDurationSeconds()
{
    QSettings settings{};
    return settings.value("practice/durationSeconds", g_defaultDurationSeconds).toInt();
}

inline void writeDurationSeconds(int seconds)
{
    QSettings settings{};
    settings.setValue("practice/durationSeconds", seconds);
}
} // namespace codetyper::ui

#endif // CODETYPER_GUI_SETTINGS_HPP
