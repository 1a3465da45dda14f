/*
 * The Holocron Project -- libholocron
 *
 * Copyright © 2013 The Holocron Authors
 *
 * @par License
 * LGPL: http://www.gnu.org/licenses/lgpl.html
 *
 * <small>This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or (at your
 * option) any later version. This program is distributed in the hope that it
 * will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
 * of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Lesser
 * General Public License for more details. You should have received a copy of
 * the GNU Lesser General Public License along with this program; if not, see:
 * http://www.gnu.org/licenses</small>
 */

#include "holocron/logbuffer.h"

#include <stdio.h>
#include <QTextStream>

namespace holocron {

LogSink::LogSink() : _mode(Enabled)
{}

LogSink::~LogSink()
{}

void LogSink::setMode(Mode mode)
{
    _mode = mode;
}

LogSink::Mode LogSink::mode() const
{
    return _mode;
}

bool LogSink::willAccept(LogEntry const &entry) const
{
    switch(_mode)
    {
    case Disabled:
        return false;

    case Enabled:
        return true;

    case OnlyNormalEntries:
        return entry.level() < LogEntry::WARNING;

    case OnlyWarningEntries:
        return entry.level() >= LogEntry::WARNING;
    }
    return false;
}

TextStreamLogSink::TextStreamLogSink(QTextStream *ts) : _ts(ts)
{}

TextStreamLogSink::~TextStreamLogSink()
{
    delete _ts;
}

LogSink &TextStreamLogSink::operator << (LogEntry const &entry)
{
    *_ts << entry.asText() << "\n";
    return *this;
}

void TextStreamLogSink::flush()
{
    _ts->flush();
}

MemoryLogSink::MemoryLogSink()
{}

LogSink &MemoryLogSink::operator << (LogEntry const &entry)
{
    _entries.append(entry);
    return *this;
}

int MemoryLogSink::entryCount() const
{
    return _entries.size();
}

LogEntry const &MemoryLogSink::entry(int index) const
{
    HOLOCRON_ASSERT(index >= 0 && index < _entries.size());
    return _entries.at(index);
}

QList<LogEntry> const &MemoryLogSink::entries() const
{
    return _entries;
}

int MemoryLogSink::count(LogEntry::Level level, QString const &text) const
{
    int n = 0;
    foreach(LogEntry const &e, _entries)
    {
        if(e.level() != level) continue;
        if(!text.isEmpty() && !e.message().contains(text, Qt::CaseInsensitive)) continue;
        ++n;
    }
    return n;
}

void MemoryLogSink::clear()
{
    _entries.clear();
}

HOLOCRON_PIMPL_NOREF(LogBuffer)
{
    typedef QList<LogSink *> Sinks;

    int enabledOverLevel;
    bool useStandardOutput;
    TextStreamLogSink outSink;
    TextStreamLogSink errSink;
    Sinks sinks;

    Instance()
        : enabledOverLevel(LogEntry::MESSAGE)
        , useStandardOutput(true)
        , outSink(new QTextStream(stdout))
        , errSink(new QTextStream(stderr))
    {
        outSink.setMode(LogSink::OnlyNormalEntries);
        errSink.setMode(LogSink::OnlyWarningEntries);
    }
};

LogBuffer::LogBuffer() : d(new Instance)
{}

LogBuffer::~LogBuffer()
{
    flush();
}

void LogBuffer::enable(LogEntry::Level overLevel)
{
    d->enabledOverLevel = overLevel;
}

bool LogBuffer::isEnabled(LogEntry::Level level) const
{
    return level >= d->enabledOverLevel;
}

void LogBuffer::enableStandardOutput(bool yes)
{
    d->useStandardOutput = yes;
}

void LogBuffer::add(LogEntry const &entry)
{
    if(d->useStandardOutput)
    {
        if(d->outSink.willAccept(entry)) d->outSink << entry;
        if(d->errSink.willAccept(entry))
        {
            d->errSink << entry;
            d->errSink.flush();
        }
    }

    foreach(LogSink *sink, d->sinks)
    {
        if(sink->willAccept(entry))
        {
            *sink << entry;
        }
    }
}

void LogBuffer::addSink(LogSink &sink)
{
    if(!d->sinks.contains(&sink))
    {
        d->sinks.append(&sink);
    }
}

void LogBuffer::removeSink(LogSink &sink)
{
    d->sinks.removeAll(&sink);
}

void LogBuffer::flush()
{
    d->outSink.flush();
    d->errSink.flush();
    foreach(LogSink *sink, d->sinks)
    {
        sink->flush();
    }
}

LogBuffer &LogBuffer::appBuffer()
{
    static LogBuffer buffer;
    return buffer;
}

} // namespace holocron
