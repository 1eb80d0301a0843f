#include "ConfigManager.hpp"
#include "../core/Logger.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>

namespace router_monitor {

namespace Keys {
    constexpr const char* FETCH_POLICY = "fetchPolicy";
    constexpr const char* LOG_ENTRY_COUNT = "logEntryCount";
    constexpr const char* LOG_LEVEL = "logLevel";
    constexpr const char* LOG_FILE = "logFile";
    constexpr const char* ROUTER_NAME = "newRouter.name";
    constexpr const char* ROUTER_ADDRESS = "newRouter.address";
    constexpr const char* ROUTER_PORT = "newRouter.port";
    constexpr const char* ROUTER_USERNAME = "newRouter.username";
    constexpr const char* ROUTER_SNMP_COMMUNITY = "newRouter.snmpCommunity";
    constexpr const char* ROUTER_SNMP_PORT = "newRouter.snmpPort";
}

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> settings;

    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double v) -> QJsonValue { return v; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    bool fromJsonValue(const QJsonValue& json, ConfigValue& out) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                out = json.toBool();
                return true;
            case QJsonValue::Double: {
                double v = json.toDouble();
                double integral = 0.0;
                if (std::modf(v, &integral) == 0.0 &&
                    std::fabs(v) <= static_cast<double>(std::numeric_limits<int>::max())) {
                    out = static_cast<int>(v);
                } else {
                    out = v;
                }
                return true;
            }
            case QJsonValue::String:
                out = json.toString().toStdString();
                return true;
            default:
                return false;
        }
    }

    void setDefaults() {
        settings = {
            {Keys::FETCH_POLICY, std::string("abort")},
            {Keys::LOG_ENTRY_COUNT, DEFAULT_LOG_ENTRY_COUNT},
            {Keys::LOG_LEVEL, 1},
            {Keys::ROUTER_NAME, std::string(DEFAULT_ROUTER_NAME)},
            {Keys::ROUTER_ADDRESS, std::string(DEFAULT_ROUTER_ADDRESS)},
            {Keys::ROUTER_PORT, DEFAULT_API_PORT},
            {Keys::ROUTER_USERNAME, std::string(DEFAULT_USERNAME)},
            {Keys::ROUTER_SNMP_COMMUNITY, std::string(DEFAULT_SNMP_COMMUNITY)},
            {Keys::ROUTER_SNMP_PORT, DEFAULT_SNMP_PORT}
        };
    }

    // Throws when the key holds a value of another type.
    template<typename T>
    T require(const std::string& key, const T& defaultValue, const char* typeName) const {
        auto it = settings.find(key);
        if (it == settings.end()) {
            return defaultValue;
        }
        if (const T* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        throw std::invalid_argument(key + " must be " + typeName);
    }

    template<typename T>
    const T* find(const std::string& key) const {
        auto it = settings.find(key);
        if (it == settings.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    const bool* value = d->find<bool>(key);
    return value ? *value : defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    const int* value = d->find<int>(key);
    return value ? *value : defaultValue;
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    if (const double* value = d->find<double>(key)) {
        return *value;
    }
    // Whole numbers in JSON load as int.
    if (const int* value = d->find<int>(key)) {
        return *value;
    }
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    const std::string* value = d->find<std::string>(key);
    return value ? *value : defaultValue;
}

void ConfigManager::setBool(const std::string& key, bool value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setDouble(const std::string& key, double value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->settings[key] = value;
    emit configChanged(key);
}

bool ConfigManager::contains(const std::string& key) const {
    return d->settings.find(key) != d->settings.end();
}

std::vector<std::string> ConfigManager::keys() const {
    std::vector<std::string> result;
    result.reserve(d->settings.size());
    for (const auto& [key, _] : d->settings) {
        result.push_back(key);
    }
    return result;
}

CoordinatorSettings ConfigManager::coordinatorSettings() const {
    CoordinatorSettings result;

    const std::string policy = d->require<std::string>(Keys::FETCH_POLICY, "abort", "a string");
    if (policy == "abort") {
        result.fetchPolicy = FetchPolicy::AbortOnFirstFailure;
    } else if (policy == "continue") {
        result.fetchPolicy = FetchPolicy::ContinueOnFailure;
    } else {
        throw std::invalid_argument("Unknown fetchPolicy: " + policy);
    }

    result.logEntryCount = d->require<int>(Keys::LOG_ENTRY_COUNT, DEFAULT_LOG_ENTRY_COUNT, "an integer");
    if (result.logEntryCount <= 0 || result.logEntryCount > MAX_LOG_ENTRY_COUNT) {
        throw std::invalid_argument("logEntryCount out of range: " +
                                    std::to_string(result.logEntryCount));
    }

    auto& router = result.newRouter;
    router.name = d->require<std::string>(Keys::ROUTER_NAME, router.name, "a string");
    router.address = d->require<std::string>(Keys::ROUTER_ADDRESS, router.address, "a string");
    router.port = d->require<int>(Keys::ROUTER_PORT, router.port, "an integer");
    router.username = d->require<std::string>(Keys::ROUTER_USERNAME, router.username, "a string");
    router.snmpCommunity = d->require<std::string>(Keys::ROUTER_SNMP_COMMUNITY,
                                                   router.snmpCommunity, "a string");
    router.snmpPort = d->require<int>(Keys::ROUTER_SNMP_PORT, router.snmpPort, "an integer");

    if (router.port <= 0 || router.port > MAX_PORT) {
        throw std::invalid_argument("newRouter.port out of range: " +
                                    std::to_string(router.port));
    }
    if (router.snmpPort <= 0 || router.snmpPort > MAX_PORT) {
        throw std::invalid_argument("newRouter.snmpPort out of range: " +
                                    std::to_string(router.snmpPort));
    }

    return result;
}

void ConfigManager::applyLoggerSettings() const {
    auto& logger = Logger::instance();
    logger.setLogLevel(Logger::levelFromInt(getInt(Keys::LOG_LEVEL, 1)));

    const std::string logFile = getString(Keys::LOG_FILE);
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
        logger.setLogDestination(LogDestination::All);
    }
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        RM_LOG_WARNING("Cannot open configuration file " + filename);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        RM_LOG_WARNING("Invalid configuration file " + filename + ": " +
                       parseError.errorString().toStdString());
        return false;
    }

    QJsonObject globals = doc.object().value("global").toObject();
    for (auto it = globals.begin(); it != globals.end(); ++it) {
        ConfigValue value;
        std::string key = it.key().toStdString();
        if (!d->fromJsonValue(it.value(), value)) {
            RM_LOG_WARNING("Ignoring unsupported value for key " + key);
            continue;
        }
        d->settings[key] = std::move(value);
        emit configChanged(key);
    }

    RM_LOG_INFO("Loaded configuration from " + filename);
    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject globals;
    for (const auto& [key, value] : d->settings) {
        globals[QString::fromStdString(key)] = d->toJsonValue(value);
    }
    QJsonObject root;
    root["global"] = globals;

    QSaveFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly)) {
        RM_LOG_ERROR("Cannot write configuration file " + filename);
        return false;
    }
    file.write(QJsonDocument(root).toJson());
    return file.commit();
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();
    for (const auto& [key, _] : d->settings) {
        emit configChanged(key);
    }
}

}
