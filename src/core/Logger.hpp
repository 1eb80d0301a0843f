#pragma once
#include <QObject>
#include <string>
#include <vector>
#include <memory>

namespace router_monitor {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    All
};

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Configuration
    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);
    void setMaxFileSize(qint64 bytes);
    void setMaxRecentLogs(size_t count);
    void enableTimestamps(bool enable);
    void enableSourceInfo(bool enable);

    void debug(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void info(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void warning(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");
    void error(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void critical(const std::string& message,
                  const std::string& source = "",
                  const std::string& function = "");

    void flush();
    void clear();
    std::vector<std::string> recentLogs(size_t count = 100) const;

    static LogLevel levelFromInt(int level);
    static std::string levelName(LogLevel level);

signals:
    void logAdded(LogLevel level, const std::string& message);
    void logFileRotated(const std::string& rotatedFile);

private:
    Logger();
    ~Logger();

    void log(LogLevel level,
             const std::string& message,
             const std::string& source,
             const std::string& function);

    class Private;
    std::unique_ptr<Private> d;
};

#define RM_LOG_DEBUG(msg) \
    ::router_monitor::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define RM_LOG_INFO(msg) \
    ::router_monitor::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define RM_LOG_WARNING(msg) \
    ::router_monitor::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define RM_LOG_ERROR(msg) \
    ::router_monitor::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define RM_LOG_CRITICAL(msg) \
    ::router_monitor::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace router_monitor
