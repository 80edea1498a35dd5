/**
 * @file logging.h
 * @brief Simple logging utility with runtime verbose flag.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace s3ui {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

} // namespace s3ui

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (s3ui::verboseLogging) qDebug()

#endif // LOGGING_H
