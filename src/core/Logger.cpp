#include "Logger.hpp"
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <deque>
#include <iostream>
#include <mutex>

namespace router_monitor {

namespace {

struct LogEntry {
    QDateTime timestamp;
    LogLevel level;
    std::string message;
    std::string source;
    std::string function;
};

std::string baseName(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    QString logFile;
    qint64 maxFileSize{5 * 1024 * 1024};
    bool includeTimestamps{true};
    bool includeSourceInfo{true};

    std::deque<LogEntry> recent;
    size_t maxRecent{1000};
    mutable std::mutex mutex;
    std::unique_ptr<QFile> file;

    void openLogFile() {
        if (logFile.isEmpty()) {
            return;
        }
        file = std::make_unique<QFile>(logFile);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::cerr << "Failed to open log file: "
                      << logFile.toStdString() << std::endl;
            file.reset();
        }
    }

    void closeLogFile() {
        if (file) {
            file->close();
            file.reset();
        }
    }

    // Returns the rotated file name, or an empty string if nothing rotated.
    QString rotateIfNeeded() {
        if (!file || file->size() < maxFileSize) {
            return {};
        }
        closeLogFile();
        QString rotated = logFile + "."
            + QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss");
        if (!QFile::rename(logFile, rotated)) {
            std::cerr << "Failed to rotate log file: "
                      << logFile.toStdString() << std::endl;
            rotated.clear();
        }
        openLogFile();
        return rotated;
    }

    std::string format(const LogEntry& entry) const {
        std::string line;
        if (includeTimestamps) {
            line += entry.timestamp.toString("yyyy-MM-dd HH:mm:ss.zzz").toStdString();
            line += " ";
        }
        line += "[" + Logger::levelName(entry.level) + "] ";
        if (includeSourceInfo && !entry.source.empty()) {
            line += baseName(entry.source);
            if (!entry.function.empty()) {
                line += ":" + entry.function;
            }
            line += " - ";
        }
        line += entry.message;
        return line;
    }
};

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() {
    d->closeLogFile();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->currentLevel = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->currentLevel;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->closeLogFile();
    d->logFile = QString::fromStdString(filename);
    d->openLogFile();
}

void Logger::setMaxFileSize(qint64 bytes) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->maxFileSize = bytes;
}

void Logger::setMaxRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->maxRecent = count;
    while (d->recent.size() > d->maxRecent) {
        d->recent.pop_front();
    }
}

void Logger::enableTimestamps(bool enable) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->includeTimestamps = enable;
}

void Logger::enableSourceInfo(bool enable) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->includeSourceInfo = enable;
}

void Logger::debug(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                      const std::string& source,
                      const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    QString rotated;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        if (level < d->currentLevel) {
            return;
        }

        LogEntry entry{QDateTime::currentDateTime(), level, message, source, function};
        const std::string line = d->format(entry);

        d->recent.push_back(std::move(entry));
        while (d->recent.size() > d->maxRecent) {
            d->recent.pop_front();
        }

        if (d->destination == LogDestination::Console ||
            d->destination == LogDestination::All) {
            auto& stream = (level >= LogLevel::Error) ? std::cerr : std::cout;
            stream << line << std::endl;
        }

        if ((d->destination == LogDestination::File ||
             d->destination == LogDestination::All) && d->file) {
            QTextStream out(d->file.get());
            out << QString::fromStdString(line) << '\n';
            out.flush();
            rotated = d->rotateIfNeeded();
        }
    }

    // Emitted unlocked so handlers may log.
    if (!rotated.isEmpty()) {
        emit logFileRotated(rotated.toStdString());
    }
    emit logAdded(level, message);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->mutex);
    if (d->file) {
        d->file->flush();
    }
    std::cout.flush();
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->recent.clear();
    if (d->file) {
        d->file->resize(0);
    }
}

std::vector<std::string> Logger::recentLogs(size_t count) const {
    std::lock_guard<std::mutex> lock(d->mutex);
    std::vector<std::string> result;
    size_t start = (count >= d->recent.size()) ? 0 : d->recent.size() - count;
    result.reserve(d->recent.size() - start);
    for (size_t i = start; i < d->recent.size(); ++i) {
        result.push_back(d->format(d->recent[i]));
    }
    return result;
}

LogLevel Logger::levelFromInt(int level) {
    switch (level) {
        case 0: return LogLevel::Debug;
        case 1: return LogLevel::Info;
        case 2: return LogLevel::Warning;
        case 3: return LogLevel::Error;
        case 4: return LogLevel::Critical;
        default: return LogLevel::Info;
    }
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

} // namespace router_monitor
