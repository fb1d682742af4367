#pragma once

#include "settings/EnvUtils.hpp"
#include <string>

namespace chronicle::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("CHRONICLE_DB_HOST", "localhost");
            port_ = std::stoi(getEnvOrDefault("CHRONICLE_DB_PORT", "5432"));
            name_ = getEnvOrDefault("CHRONICLE_DB_NAME", "chronicle_db");
            user_ = getEnvOrDefault("CHRONICLE_DB_USER", "chronicle_user");
            password_ = getEnvOrDefault("CHRONICLE_DB_PASSWORD", "chronicle_password");
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
    };

} // namespace chronicle::settings
