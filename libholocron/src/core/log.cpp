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

#include "holocron/log.h"
#include "holocron/logbuffer.h"

#include <QThreadStorage>
#include <QTextStream>

namespace holocron {

static char const *MAIN_SECTION = "";

static char const *levelNames[LogEntry::MAX_LOG_LEVELS] = {
    "TRACE",
    "DEBUG",
    "VERBOSE",
    "MESSAGE",
    "INFO",
    "WARNING",
    "ERROR",
    "CRITICAL"
};

LogEntry::LogEntry() : _level(MESSAGE)
{}

LogEntry::LogEntry(Level level, QString const &section, QString const &format, Args const &args)
    : _when(QDateTime::currentDateTime())
    , _level(level)
    , _section(section)
    , _format(format)
    , _args(args)
{}

QString LogEntry::message() const
{
    if(_args.isEmpty()) return _format; // Verbatim.

    QString result;
    int argIdx = 0;
    int pos = 0;
    while(pos < _format.size())
    {
        QChar ch = _format.at(pos);
        if(ch != '%' || pos + 1 >= _format.size())
        {
            result.append(ch);
            ++pos;
            continue;
        }

        if(_format.at(pos + 1) == '%')
        {
            result.append('%');
            pos += 2;
            continue;
        }

        // Skip over any flags and field width, then the conversion.
        int end = pos + 1;
        while(end < _format.size() &&
              (_format.at(end).isDigit() || _format.at(end) == '-' || _format.at(end) == '.' ||
               _format.at(end) == 'l'))
        {
            ++end;
        }
        if(end >= _format.size() || !QString("sidupxXfb").contains(_format.at(end)) ||
           argIdx >= _args.size())
        {
            // Not a placeholder we can fill.
            result.append(_format.mid(pos, end - pos + 1));
            pos = end + 1;
            continue;
        }

        QString arg = _args.at(argIdx++);
        QChar const conv = _format.at(end);
        if(conv == 'x' || conv == 'X')
        {
            bool ok = false;
            qlonglong num = arg.toLongLong(&ok);
            if(ok) arg = QString::number(num, 16);
            if(conv == 'X') arg = arg.toUpper();
        }

        // Field width ("%8s").
        QString spec = _format.mid(pos + 1, end - pos - 1);
        bool leftAlign = spec.startsWith('-');
        int width = spec.mid(leftAlign? 1 : 0).section('.', 0, 0).toInt();
        if(width > arg.size())
        {
            arg = leftAlign? arg.leftJustified(width) : arg.rightJustified(width);
        }

        result.append(arg);
        pos = end + 1;
    }
    return result;
}

QString LogEntry::asText() const
{
    QString result;
    QTextStream output(&result);

    if(_level != MESSAGE)
    {
        output << "(" << levelToText(_level).toLower() << ") ";
    }
    if(!_section.isEmpty())
    {
        output << _section << ": ";
    }
    output << message();
    output.flush();
    return result;
}

QString LogEntry::levelToText(Level level)
{
    if(level < TRACE || level >= MAX_LOG_LEVELS) return "";
    return levelNames[level];
}

LogEntry::Level LogEntry::textToLevel(QString const &text, Level defaultLevel)
{
    for(int i = TRACE; i < MAX_LOG_LEVELS; ++i)
    {
        if(!text.compare(levelNames[i], Qt::CaseInsensitive))
            return Level(i);
    }
    return defaultLevel;
}

Log::Section::Section(char const *name) : _log(Log::threadLog()), _name(name)
{
    _log.beginSection(_name);
}

Log::Section::~Section()
{
    _log.endSection(_name);
}

HOLOCRON_PIMPL_NOREF(Log)
{
    typedef QList<char const *> SectionStack;
    SectionStack sectionStack;

    Instance()
    {
        sectionStack.push_back(MAIN_SECTION);
    }
};

Log::Log() : d(new Instance)
{}

Log::~Log()
{}

void Log::beginSection(char const *name)
{
    d->sectionStack.append(name);
}

void Log::endSection(char const *HOLOCRON_DEBUG_ONLY(name))
{
    HOLOCRON_ASSERT(d->sectionStack.back() == name);
    d->sectionStack.takeLast();
}

QString Log::currentSection() const
{
    QString context;
    QString latest;
    foreach(char const *i, d->sectionStack)
    {
        if(!i[0]) continue;
        if(latest == i)
        {
            // Don't repeat if it has the exact same name (due to recursive calls).
            continue;
        }
        if(context.size())
        {
            context += " > ";
        }
        latest = i;
        context += i;
    }
    return context;
}

void Log::enter(LogEntry::Level level, QString const &format, LogEntry::Args const &args)
{
    LogBuffer &buf = LogBuffer::appBuffer();
    if(!buf.isEnabled(level)) return;

    buf.add(LogEntry(level, currentSection(), format, args));
}

/// Each thread has its own log.
static QThreadStorage<Log *> threadLogs;

Log &Log::threadLog()
{
    if(!threadLogs.hasLocalData())
    {
        // The storage owns the log and deletes it when the thread exits.
        threadLogs.setLocalData(new Log);
    }
    return *threadLogs.localData();
}

LogEntryStager::LogEntryStager(LogEntry::Level level, QString const &format)
    : _level(level)
{
    _disabled = !LogBuffer::appBuffer().isEnabled(level);
    if(!_disabled)
    {
        _format = format;
    }
}

LogEntryStager::~LogEntryStager()
{
    if(!_disabled)
    {
        LOG().enter(_level, _format, _args);
    }
}

LogEntryStager &LogEntryStager::operator << (QString const &text)
{
    if(!_disabled) _args << text;
    return *this;
}

LogEntryStager &LogEntryStager::operator << (char const *text)
{
    if(!_disabled) _args << QString::fromUtf8(text);
    return *this;
}

LogEntryStager &LogEntryStager::operator << (int value)
{
    if(!_disabled) _args << QString::number(value);
    return *this;
}

LogEntryStager &LogEntryStager::operator << (unsigned int value)
{
    if(!_disabled) _args << QString::number(value);
    return *this;
}

LogEntryStager &LogEntryStager::operator << (long value)
{
    if(!_disabled) _args << QString::number(value);
    return *this;
}

LogEntryStager &LogEntryStager::operator << (unsigned long value)
{
    if(!_disabled) _args << QString::number(value);
    return *this;
}

LogEntryStager &LogEntryStager::operator << (qint64 value)
{
    if(!_disabled) _args << QString::number(value);
    return *this;
}

LogEntryStager &LogEntryStager::operator << (quint64 value)
{
    if(!_disabled) _args << QString::number(value);
    return *this;
}

LogEntryStager &LogEntryStager::operator << (double value)
{
    if(!_disabled) _args << QString::number(value);
    return *this;
}

LogEntryStager &LogEntryStager::operator << (bool value)
{
    if(!_disabled) _args << (value? "true" : "false");
    return *this;
}

LogEntryStager &LogEntryStager::operator << (void const *ptr)
{
    if(!_disabled) _args << QString("0x%1").arg(quintptr(ptr), 0, 16);
    return *this;
}

} // namespace holocron
