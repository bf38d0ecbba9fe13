// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace wallet::settings
{

    /**
     * @brief Подключение к PostgreSQL хранилищу журнала
     *
     * ENV:
     * - WALLET_DB_HOST (default: wallet-postgres)
     * - WALLET_DB_PORT (default: 5432)
     * - WALLET_DB_NAME (default: wallet_db)
     * - WALLET_DB_USER (default: wallet_user)
     * - WALLET_DB_PASSWORD
     * - WALLET_DB_CONNECT_TIMEOUT_SEC (default: 5)
     *
     * Используется только при WALLET_STORAGE=postgres.
     */
    class DbSettings
    {
    public:
        DbSettings()
            : host_(envOr("WALLET_DB_HOST", "wallet-postgres"))
            , port_(parsePositive("WALLET_DB_PORT", envOr("WALLET_DB_PORT", "5432")))
            , name_(envOr("WALLET_DB_NAME", "wallet_db"))
            , user_(envOr("WALLET_DB_USER", "wallet_user"))
            , password_(envOr("WALLET_DB_PASSWORD", "wallet_secret_password"))
            , connectTimeoutSec_(parsePositive("WALLET_DB_CONNECT_TIMEOUT_SEC",
                                               envOr("WALLET_DB_CONNECT_TIMEOUT_SEC", "5")))
        {
            if (port_ > 65535)
            {
                throw std::invalid_argument("WALLET_DB_PORT out of range: " + std::to_string(port_));
            }
        }

        int getPort() const { return port_; }
        int getConnectTimeoutSec() const { return connectTimeoutSec_; }

        /// libpq conninfo; application_name виден в pg_stat_activity
        std::string getConnectionString() const
        {
            return "host=" + host_ +
                   " port=" + std::to_string(port_) +
                   " dbname=" + name_ +
                   " user=" + user_ +
                   " password=" + password_ +
                   " connect_timeout=" + std::to_string(connectTimeoutSec_) +
                   " application_name=wallet-service";
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int connectTimeoutSec_;

        static std::string envOr(const char *name, const char *fallback)
        {
            const char *value = std::getenv(name);
            return (value && *value) ? std::string(value) : std::string(fallback);
        }

        static int parsePositive(const char *name, const std::string &text)
        {
            int value = std::stoi(text);
            if (value <= 0)
            {
                throw std::invalid_argument(std::string(name) + " must be positive");
            }
            return value;
        }
    };

} // namespace wallet::settings
