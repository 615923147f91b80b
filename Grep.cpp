#include "Grep.h"
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QIODevice>
#include <QStringList>
#include <QtDebug>

namespace {

const char StandardInputName[] = "(standard input)";

// SGR parameters for the parts of an output line other than the match.
const char FileNameColor[]  = "35";
const char LineNumColor[]   = "32";
const char SeparatorColor[] = "36";

}

//------------------------------------------------------------------------------
// Name: Grep
//------------------------------------------------------------------------------
Grep::Grep(const GrepOptions &options, QIODevice *in, QIODevice *out, QIODevice *err) : options_(options), in_(in), out_(out), err_(err), color_(options.color == ColorMode::Always), multipleFiles_(false), found_(false), errors_(false), done_(false) {
}

//------------------------------------------------------------------------------
// Name: run
//------------------------------------------------------------------------------
int Grep::run() {

    try {
        regex_.reset(new Regex(options_.pattern.toUtf8().constData(), options_.ignoreCase ? REDFLT_CASE_INSENSITIVE : REDFLT_STANDARD));
    } catch(const RegexException &e) {
        err_ << "ngrep: " << options_.pattern << ": " << e.what() << " at offset " << e.offset() << '\n';
        err_.flush();
        return 2;
    }

    qDebug().noquote() << "compiled" << options_.pattern << "to" << regex_->root()->toString();

    QStringList files = options_.files;
    if(files.isEmpty() && options_.recursive) {
        files << QLatin1String(".");
    }

    multipleFiles_ = files.size() > 1 || options_.recursive;

    if(files.isEmpty()) {
        searchDevice(in_, QLatin1String(StandardInputName));
    } else {
        for(const QString &file : files) {
            if(done_) {
                break;
            }

            if(file == QLatin1String("-")) {
                searchDevice(in_, QLatin1String(StandardInputName));
            } else {
                searchPath(file);
            }
        }
    }

    if(errors_ && !(options_.quiet && found_)) {
        return 2;
    }

    return found_ ? 0 : 1;
}

//------------------------------------------------------------------------------
// Name: searchPath
// Desc: a file operand, or with -r a directory whose regular files are all
//       searched in sorted order
//------------------------------------------------------------------------------
void Grep::searchPath(const QString &path) {

    const QFileInfo info(path);

    if(!info.exists()) {
        error(QString::fromLatin1("%1: No such file or directory").arg(path));
        return;
    }

    if(!info.isDir()) {
        searchFile(path);
        return;
    }

    if(!options_.recursive) {
        error(QString::fromLatin1("%1: Is a directory").arg(path));
        return;
    }

    QStringList entries;
    QDirIterator it(path, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while(it.hasNext()) {
        entries << it.next();
    }

    entries.sort();

    for(const QString &entry : entries) {
        if(done_) {
            break;
        }

        searchFile(entry);
    }
}

void Grep::searchFile(const QString &path) {

    QFile file(path);
    if(!file.open(QIODevice::ReadOnly)) {
        error(QString::fromLatin1("%1: %2").arg(path, file.errorString()));
        return;
    }

    searchDevice(&file, path);
}

//------------------------------------------------------------------------------
// Name: searchDevice
//------------------------------------------------------------------------------
void Grep::searchDevice(QIODevice *device, const QString &name) {

    RegexMatch match(regex_.get());
    match.setStepLimit(options_.maxSteps);

    long lineNumber = 0;
    long selected   = 0;

    while(!done_) {
        QByteArray line = device->readLine();
        if(line.isEmpty()) {
            // Empty means end of input or a failed read.
            QFileDevice *const file = qobject_cast<QFileDevice *>(device);
            if(file && file->error() != QFileDevice::NoError) {
                error(QString::fromLatin1("%1: read error: %2").arg(name, file->errorString()));
            }
            break;
        }

        ++lineNumber;

        if(line.endsWith('\n')) {
            line.chop(1);
        }

        if(line.endsWith('\r')) {
            line.chop(1);
        }

        const bool matched = match.ExecRE(line.constData(), line.constData() + line.size());

        if(match.limitExceeded()) {
            err_ << "ngrep: " << name << ':' << lineNumber << ": match step limit exceeded, line skipped" << '\n';
            err_.flush();
            continue;
        }

        if(matched == options_.invert) {
            continue;
        }

        ++selected;
        found_ = true;

        if(options_.quiet) {
            done_ = true;
            break;
        }

        if(options_.count) {
            continue;
        }

        if(options_.onlyMatching) {
            // -v -o selects lines without a match, so there is nothing to print.
            if(!options_.invert) {
                printMatches(&match, line, name, lineNumber);
            }
        } else {
            printLine(&match, line, name, lineNumber);
        }
    }

    if(options_.count && !options_.quiet) {
        QByteArray output;
        if(multipleFiles_) {
            output = colored(name.toLocal8Bit(), FileNameColor) + colored(":", SeparatorColor);
        }

        output += QByteArray::number(static_cast<qlonglong>(selected)) + '\n';
        write(output);
    }
}

//------------------------------------------------------------------------------
// Name: printLine
// Desc: the whole line; with color every match in it is highlighted
//------------------------------------------------------------------------------
void Grep::printLine(RegexMatch *match, const QByteArray &line, const QString &name, long lineNumber) {

    QByteArray output = prefix(name, lineNumber);

    if(!color_ || options_.invert) {
        output += line;
    } else {
        const char *const begin = line.constData();
        const char *const end   = begin + line.size();
        const char *from        = begin;
        const char *copied      = begin;

        while(match->ExecRE(begin, end, from)) {
            const Capture whole = match->capture(0);

            if(whole.start == whole.end) {
                if(whole.end == end) {
                    break;
                }
                from = whole.end + char_length(whole.end, end);
                continue;
            }

            output += QByteArray(copied, static_cast<int>(whole.start - copied));
            output += colored(QByteArray(whole.start, static_cast<int>(whole.end - whole.start)), options_.colorSequence.toLatin1());
            copied = from = whole.end;
        }

        output += QByteArray(copied, static_cast<int>(end - copied));
    }

    output += '\n';
    write(output);
}

//------------------------------------------------------------------------------
// Name: printMatches
// Desc: -o, every non-empty, non-overlapping match on a line of its own
//------------------------------------------------------------------------------
void Grep::printMatches(RegexMatch *match, const QByteArray &line, const QString &name, long lineNumber) {

    const char *const begin = line.constData();
    const char *const end   = begin + line.size();
    const char *from        = begin;

    QByteArray output;

    while(match->ExecRE(begin, end, from)) {
        const Capture whole = match->capture(0);

        if(whole.start == whole.end) {
            if(whole.end == end) {
                break;
            }
            from = whole.end + char_length(whole.end, end);
            continue;
        }

        output += prefix(name, lineNumber);
        output += colored(QByteArray(whole.start, static_cast<int>(whole.end - whole.start)), options_.colorSequence.toLatin1());
        output += '\n';
        from = whole.end;
    }

    write(output);
}

QByteArray Grep::prefix(const QString &name, long lineNumber) const {

    QByteArray result;

    if(multipleFiles_) {
        result += colored(name.toLocal8Bit(), FileNameColor) + colored(":", SeparatorColor);
    }

    if(options_.lineNumber) {
        result += colored(QByteArray::number(static_cast<qlonglong>(lineNumber)), LineNumColor) + colored(":", SeparatorColor);
    }

    return result;
}

QByteArray Grep::colored(const QByteArray &text, const QByteArray &sequence) const {

    if(!color_ || text.isEmpty()) {
        return text;
    }

    return "\033[" + sequence + "m" + text + "\033[m";
}

void Grep::write(const QByteArray &data) {

    if(data.isEmpty()) {
        return;
    }

    if(out_->write(data) != data.size()) {
        error(QString::fromLatin1("write error: %1").arg(out_->errorString()));
        done_ = true;
    }
}

void Grep::error(const QString &message) {
    err_ << "ngrep: " << message << '\n';
    err_.flush();
    errors_ = true;
}
