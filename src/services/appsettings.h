/**
 * @file appsettings.h
 * @brief Application preferences.
 */

#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QObject>
#include <QString>

/**
 * @brief User preferences persisted with QSettings.
 *
 * Constructed explicitly and passed to whoever needs it; nothing reads the
 * preferences through a global.
 */
class AppSettings : public QObject
{
    Q_OBJECT

public:
    explicit AppSettings(QObject *parent = nullptr);

    [[nodiscard]] QString language() const { return language_; }
    void setLanguage(const QString &language);

    /// "system", "light" or "dark"
    [[nodiscard]] QString theme() const { return theme_; }
    void setTheme(const QString &theme);

    /// Empty means the platform download directory
    [[nodiscard]] QString downloadDirectory() const { return downloadDirectory_; }
    void setDownloadDirectory(const QString &directory);

    /// Id of the profile used when none is given explicitly
    [[nodiscard]] QString activeProfileId() const { return activeProfileId_; }
    void setActiveProfileId(const QString &id);

    void load();
    void save();

signals:
    void settingsChanged();

private:
    QString language_;
    QString theme_;
    QString downloadDirectory_;
    QString activeProfileId_;
};

#endif // APPSETTINGS_H
