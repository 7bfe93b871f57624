// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>

namespace containers::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL хранилищу контейнеров
     *
     * Переменные окружения CONTAINER_DB_*:
     * HOST, PORT, NAME, USER, PASSWORD, SSLMODE (default: prefer),
     * CONNECT_TIMEOUT в секундах (default: 5).
     *
     * Репозитории открывают соединение на каждый вызов,
     * поэтому connect_timeout ограничивает задержку каждой операции.
     */
    class DbSettings
    {
    public:
        DbSettings()
            : host_(env("CONTAINER_DB_HOST", "container-postgres")),
              port_(std::stoi(env("CONTAINER_DB_PORT", "5432"))),
              name_(env("CONTAINER_DB_NAME", "container_db")),
              user_(env("CONTAINER_DB_USER", "container_user")),
              password_(env("CONTAINER_DB_PASSWORD", "")),
              sslMode_(env("CONTAINER_DB_SSLMODE", "prefer")),
              connectTimeoutSeconds_(std::stoi(env("CONTAINER_DB_CONNECT_TIMEOUT", "5")))
        {
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getSslMode() const { return sslMode_; }
        int getConnectTimeoutSeconds() const { return connectTimeoutSeconds_; }

        /// libpq key=value строка; пароль добавляется только если задан
        std::string getConnectionString() const
        {
            std::string conn = "host=" + host_ +
                               " port=" + std::to_string(port_) +
                               " dbname=" + name_ +
                               " user=" + user_ +
                               " sslmode=" + sslMode_ +
                               " connect_timeout=" + std::to_string(connectTimeoutSeconds_) +
                               " application_name=container-service";
            if (!password_.empty())
            {
                conn += " password=" + password_;
            }
            return conn;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        std::string sslMode_;
        int connectTimeoutSeconds_;

        static std::string env(const char *name, const char *fallback)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(fallback);
        }
    };

} // namespace containers::settings
