/**
 * @file downloadpaths.h
 * @brief Resolves where downloaded objects are written.
 */

#ifndef DOWNLOADPATHS_H
#define DOWNLOADPATHS_H

#include <QString>

/**
 * @brief Download directory resolution and collision-free file naming.
 */
class DownloadPaths
{
public:
    /// Name used when sanitizing leaves nothing usable
    static constexpr const char *FallbackFileName = "download";

    /**
     * @brief Picks the directory downloads are saved to, creating it if needed.
     *
     * A non-empty @p preferred directory is used as-is and must be creatable.
     * Otherwise the platform download directory is tried, then the
     * application's own data directory.
     *
     * @param preferred Directory configured by the user, may be empty.
     * @param errorMessage Receives a description on failure.
     * @return The directory, or an empty string if none could be created.
     */
    [[nodiscard]] static QString resolveDownloadDirectory(const QString &preferred,
                                                          QString *errorMessage = nullptr);

    /**
     * @brief Replaces characters outside letters, digits, underscore,
     *        whitespace, '.' and '-' with '_'.
     */
    [[nodiscard]] static QString sanitizeFileName(const QString &name);

    /**
     * @brief Returns dir/fileName, or the first free "name (n).ext" variant.
     *
     * The suffix goes before the last '.', unless the name has no dot or
     * starts with its only dot, in which case it is appended.
     */
    [[nodiscard]] static QString uniqueFilePath(const QString &directory, const QString &fileName);

private:
    [[nodiscard]] static bool ensureWritableDirectory(const QString &path);
};

#endif // DOWNLOADPATHS_H
