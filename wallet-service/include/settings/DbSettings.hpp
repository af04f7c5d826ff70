#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace wallet::settings {

/**
 * @brief Параметры подключения к базе журнала (PostgreSQL)
 *
 * Если задан WALLET_DB_URL (postgresql://...), он используется как есть,
 * остальные переменные игнорируются. Иначе строка libpq собирается из:
 * - WALLET_DB_HOST (default: "wallet-postgres")
 * - WALLET_DB_PORT (default: 5432)
 * - WALLET_DB_NAME (default: "wallet_db")
 * - WALLET_DB_USER (default: "wallet_user")
 * - WALLET_DB_PASSWORD
 * - WALLET_DB_SSLMODE (default: "prefer")
 * - WALLET_DB_CONNECT_TIMEOUT_SEC (default: 5)
 *
 * @throws std::invalid_argument при нечисловом или нулевом порте/таймауте
 */
class DbSettings {
public:
    DbSettings() {
        if (const char* url = std::getenv("WALLET_DB_URL")) {
            url_ = url;
        }
        host_ = env("WALLET_DB_HOST", "wallet-postgres");
        database_ = env("WALLET_DB_NAME", "wallet_db");
        user_ = env("WALLET_DB_USER", "wallet_user");
        password_ = env("WALLET_DB_PASSWORD", "wallet_secret_password");
        sslMode_ = env("WALLET_DB_SSLMODE", "prefer");
        port_ = positive("WALLET_DB_PORT", 5432);
        connectTimeoutSec_ = positive("WALLET_DB_CONNECT_TIMEOUT_SEC", 5);
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return database_; }
    std::string getUser() const { return user_; }
    int getConnectTimeoutSec() const { return connectTimeoutSec_; }

    /**
     * @brief Строка для pqxx::connection
     */
    std::string getConnectionString() const {
        if (!url_.empty()) {
            return url_;
        }
        std::string conn;
        conn += "host=" + host_;
        conn += " port=" + std::to_string(port_);
        conn += " dbname=" + database_;
        conn += " user=" + user_;
        conn += " password=" + password_;
        conn += " sslmode=" + sslMode_;
        conn += " connect_timeout=" + std::to_string(connectTimeoutSec_);
        conn += " application_name=wallet-service";
        return conn;
    }

    /**
     * @brief Описание для логов, без пароля
     */
    std::string describe() const {
        if (!url_.empty()) {
            return "WALLET_DB_URL";
        }
        return user_ + "@" + host_ + ":" + std::to_string(port_) + "/" + database_;
    }

private:
    static std::string env(const char* name, const char* fallback) {
        const char* value = std::getenv(name);
        return value ? value : fallback;
    }

    static int positive(const char* name, int fallback) {
        const char* raw = std::getenv(name);
        if (!raw) {
            return fallback;
        }
        int value = std::stoi(raw);
        if (value <= 0) {
            throw std::invalid_argument(std::string(name) + " must be positive, got " + raw);
        }
        return value;
    }

    std::string url_;
    std::string host_;
    int port_ = 5432;
    std::string database_;
    std::string user_;
    std::string password_;
    std::string sslMode_;
    int connectTimeoutSec_ = 5;
};

} // namespace wallet::settings
