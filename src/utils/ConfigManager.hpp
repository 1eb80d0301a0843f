#pragma once
#include "../core/CoordinatorSettings.hpp"
#include <QObject>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace router_monitor {

using ConfigValue = std::variant<bool, int, double, std::string>;

class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    void setBool(const std::string& key, bool value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setString(const std::string& key, const std::string& value);

    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;

    // Throws std::invalid_argument when a value is out of range.
    CoordinatorSettings coordinatorSettings() const;
    void applyLoggerSettings() const;

    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    void resetToDefaults();

signals:
    void configChanged(const std::string& key);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
