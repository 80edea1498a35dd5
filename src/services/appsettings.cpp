#include "appsettings.h"

#include <QSettings>

AppSettings::AppSettings(QObject *parent)
    : QObject(parent)
{
    load();
}

void AppSettings::setLanguage(const QString &language)
{
    if (language_ == language) return;
    language_ = language;
    emit settingsChanged();
}

void AppSettings::setTheme(const QString &theme)
{
    if (theme_ == theme) return;
    theme_ = theme;
    emit settingsChanged();
}

void AppSettings::setDownloadDirectory(const QString &directory)
{
    if (downloadDirectory_ == directory) return;
    downloadDirectory_ = directory;
    emit settingsChanged();
}

void AppSettings::setActiveProfileId(const QString &id)
{
    if (activeProfileId_ == id) return;
    activeProfileId_ = id;
    emit settingsChanged();
}

void AppSettings::load()
{
    QSettings settings;
    language_ = settings.value("preferences/language", "en").toString();
    theme_ = settings.value("preferences/theme", "system").toString();
    downloadDirectory_ = settings.value("preferences/downloadDirectory").toString();
    activeProfileId_ = settings.value("servers/activeProfile").toString();
}

void AppSettings::save()
{
    QSettings settings;
    settings.setValue("preferences/language", language_);
    settings.setValue("preferences/theme", theme_);
    settings.setValue("preferences/downloadDirectory", downloadDirectory_);
    settings.setValue("servers/activeProfile", activeProfileId_);
}
