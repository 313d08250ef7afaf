// include/settings/DbSettings.hpp
#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace bullion::settings {

/**
 * @brief Подключение к PostgreSQL
 *
 * - BULLION_DB_HOST / PORT / NAME / USER / PASSWORD
 * - BULLION_DB_CONNECT_TIMEOUT_SECONDS (5): уходит в строку подключения
 * - BULLION_DB_STATEMENT_TIMEOUT_MS (2000): адаптеры ставят его через
 *   SET LOCAL statement_timeout для запросов, которые не должны висеть
 */
class DbSettings {
public:
    DbSettings()
        : host_(getEnvOrDefault("BULLION_DB_HOST", "bullion-postgres"))
        , port_(std::stoi(getEnvOrDefault("BULLION_DB_PORT", "5432")))
        , name_(getEnvOrDefault("BULLION_DB_NAME", "bullion_db"))
        , user_(getEnvOrDefault("BULLION_DB_USER", "bullion_user"))
        , password_(getEnvOrDefault("BULLION_DB_PASSWORD", "bullion_secret_password"))
        , connectTimeout_(std::stoi(getEnvOrDefault("BULLION_DB_CONNECT_TIMEOUT_SECONDS", "5")))
        , statementTimeout_(std::stoi(getEnvOrDefault("BULLION_DB_STATEMENT_TIMEOUT_MS", "2000")))
    {}

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_ +
               " connect_timeout=" + std::to_string(connectTimeout_.count()) +
               " application_name=bullion";
    }

    std::chrono::milliseconds getStatementTimeout() const { return statementTimeout_; }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    std::chrono::seconds connectTimeout_;
    std::chrono::milliseconds statementTimeout_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace bullion::settings
