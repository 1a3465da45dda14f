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

#ifndef LIBHOLOCRON_LOGBUFFER_H
#define LIBHOLOCRON_LOGBUFFER_H

#include "log.h"

#include <QList>

class QTextStream;

namespace holocron {

/**
 * Receiver of log entries. Sinks are registered with a LogBuffer.
 */
class HOLOCRON_PUBLIC LogSink
{
public:
    enum Mode {
        Disabled,
        Enabled,
        OnlyNormalEntries,  ///< Entries below the WARNING level.
        OnlyWarningEntries  ///< Entries at WARNING or above.
    };

public:
    LogSink();
    virtual ~LogSink();

    void setMode(Mode mode);
    Mode mode() const;

    /// Determines whether the sink wants an entry, according to its mode.
    bool willAccept(LogEntry const &entry) const;

    virtual LogSink &operator << (LogEntry const &entry) = 0;

    virtual void flush() {}

private:
    Mode _mode;
};

/**
 * Log sink that writes the entries as plain text to a QTextStream.
 */
class HOLOCRON_PUBLIC TextStreamLogSink : public LogSink
{
public:
    /// @param ts  Output stream. The sink takes ownership.
    TextStreamLogSink(QTextStream *ts);
    ~TextStreamLogSink();

    LogSink &operator << (LogEntry const &entry);
    void flush();

private:
    QTextStream *_ts;
};

/**
 * Log sink that keeps copies of the entries in memory.
 */
class HOLOCRON_PUBLIC MemoryLogSink : public LogSink
{
public:
    MemoryLogSink();

    LogSink &operator << (LogEntry const &entry);

    int entryCount() const;
    LogEntry const &entry(int index) const;
    QList<LogEntry> const &entries() const;

    /// @return Number of stored entries at @a level whose message contains
    /// @a text (case insensitively).
    int count(LogEntry::Level level, QString const &text = "") const;

    void clear();

private:
    QList<LogEntry> _entries;
};

/**
 * Buffer for log entries. Entries are filtered by level and passed on to
 * the registered sinks as they arrive.
 *
 * @ingroup core
 */
class HOLOCRON_PUBLIC LogBuffer
{
public:
    LogBuffer();
    virtual ~LogBuffer();

    /**
     * Enables log entries at or over a level. When a level is disabled, the
     * entries will not be added to the log entry buffer.
     */
    void enable(LogEntry::Level overLevel = LogEntry::MESSAGE);

    /// Disables all log entries.
    void disable() { enable(LogEntry::MAX_LOG_LEVELS); }

    bool isEnabled(LogEntry::Level level = LogEntry::MESSAGE) const;

    /// Enables or disables the stdout/stderr sinks.
    void enableStandardOutput(bool yes = true);

    /// Adds a new entry and passes it on to the sinks.
    void add(LogEntry const &entry);

    /// Adds a sink. The buffer does not take ownership.
    void addSink(LogSink &sink);
    void removeSink(LogSink &sink);

    void flush();

    /// Returns the application's log buffer.
    static LogBuffer &appBuffer();

private:
    HOLOCRON_PRIVATE(d)
};

} // namespace holocron

#endif // LIBHOLOCRON_LOGBUFFER_H
