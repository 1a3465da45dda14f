/*
 * The Holocron Project -- libholocron
 *
 * Copyright (c) 2013 The Holocron Authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, see <http://www.gnu.org/licenses/>.
 */

#ifndef LIBHOLOCRON_LOG_H
#define LIBHOLOCRON_LOG_H

#include "libholocron.h"

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>

/// Macro for accessing the local log of the current thread.
#define LOG()               holocron::Log::threadLog()

/// Macro for accessing the local log of the current thread and entering
/// a new log section.
#define LOG_AS(sectionName) holocron::Log::Section __logSection(sectionName);

#define LOG_AT_LEVEL(level, str)    holocron::LogEntryStager(level, str)

#define LOG_TRACE(str)      LOG_AT_LEVEL(holocron::LogEntry::TRACE,    str)
#define LOG_DEBUG(str)      LOG_AT_LEVEL(holocron::LogEntry::DEBUG,    str)
#define LOG_VERBOSE(str)    LOG_AT_LEVEL(holocron::LogEntry::VERBOSE,  str)
#define LOG_MSG(str)        LOG_AT_LEVEL(holocron::LogEntry::MESSAGE,  str)
#define LOG_INFO(str)       LOG_AT_LEVEL(holocron::LogEntry::INFO,     str)
#define LOG_WARNING(str)    LOG_AT_LEVEL(holocron::LogEntry::WARNING,  str)
#define LOG_ERROR(str)      LOG_AT_LEVEL(holocron::LogEntry::ERROR,    str)
#define LOG_CRITICAL(str)   LOG_AT_LEVEL(holocron::LogEntry::CRITICAL, str)

namespace holocron {

/**
 * An entry to be stored in the log entry buffer. Log entries are created
 * with Log::enter() and the formatted message is composed from a format
 * string and a list of arguments.
 *
 * @ingroup core
 */
class HOLOCRON_PUBLIC LogEntry
{
public:
    /// Importance level of the log entry.
    enum Level
    {
        /// Trace messages are intended for low-level debugging. They should
        /// be used to log which methods are entered and exited, and to mark
        /// certain points within methods.
        TRACE = 0,

        /// Debug messages are intended for normal debugging.
        DEBUG = 1,

        /// Verbose log messages are used to log technical information that
        /// is only of interest to advanced users.
        VERBOSE = 2,

        /// Normal log entries are the most common ones.
        MESSAGE = 3,

        /// Important messages that are intended for situations that are
        /// particularly noteworthy.
        INFO = 4,

        /// Warning messages are reserved for recoverable error situations.
        WARNING = 5,

        /// Error messages are intended for errors that can be recovered
        /// from but prevent the current operation from completing.
        ERROR = 6,

        /// Critical messages are intended for fatal errors.
        CRITICAL = 7,

        MAX_LOG_LEVELS
    };

    typedef QStringList Args;

public:
    LogEntry();
    LogEntry(Level level, QString const &section, QString const &format, Args const &args);

    Level level() const { return _level; }
    QDateTime when() const { return _when; }
    QString section() const { return _section; }

    /// Composes the message with the arguments substituted in place of the
    /// format placeholders (%s, %i, %x, etc.).
    QString message() const;

    /// Converts the entry to text, prefixed by the level and section.
    QString asText() const;

    static QString levelToText(Level level);

    /// Parses a level name ("debug", "warning", ...). Returns @a defaultLevel
    /// if the text is not recognized.
    static Level textToLevel(QString const &text, Level defaultLevel = MESSAGE);

private:
    QDateTime _when;
    Level _level;
    QString _section;
    QString _format;
    Args _args;
};

/**
 * Logbook that is used to store log entries. There is one Log for each
 * thread; it keeps track of the current log section.
 *
 * @ingroup core
 */
class HOLOCRON_PUBLIC Log
{
public:
    /**
     * Scope of a log section. The section name is pushed on the log's
     * section stack when constructed and popped when destroyed.
     */
    class HOLOCRON_PUBLIC Section
    {
    public:
        Section(char const *name);
        ~Section();

    private:
        Log &_log;
        char const *_name;
    };

public:
    Log();
    ~Log();

    void beginSection(char const *name);
    void endSection(char const *name);

    /// Composes the current section path, e.g. "Installation > Capsule".
    QString currentSection() const;

    /**
     * Creates a new log entry with the specified level and passes it to the
     * application's log buffer.
     */
    void enter(LogEntry::Level level, QString const &format, LogEntry::Args const &args);

    /// Returns the logbook of the current thread.
    static Log &threadLog();

private:
    HOLOCRON_PRIVATE(d)
};

/**
 * Stages a log entry while its arguments are being collected. The entry
 * is passed to the thread's Log when the stager is destroyed.
 */
class HOLOCRON_PUBLIC LogEntryStager
{
public:
    LogEntryStager(LogEntry::Level level, QString const &format);
    ~LogEntryStager();

    LogEntryStager &operator << (QString const &text);
    LogEntryStager &operator << (char const *text);
    LogEntryStager &operator << (int value);
    LogEntryStager &operator << (unsigned int value);
    LogEntryStager &operator << (long value);
    LogEntryStager &operator << (unsigned long value);
    LogEntryStager &operator << (qint64 value);
    LogEntryStager &operator << (quint64 value);
    LogEntryStager &operator << (double value);
    LogEntryStager &operator << (bool value);
    LogEntryStager &operator << (void const *ptr);

private:
    bool _disabled;
    LogEntry::Level _level;
    QString _format;
    LogEntry::Args _args;
};

} // namespace holocron

#endif // LIBHOLOCRON_LOG_H
