#pragma once

#include <string>
#include <cstdlib>

namespace paygate::settings {

/**
 * @brief Настройки RabbitMQ для публикации событий
 *
 * Читает из ENV:
 * - RABBITMQ_HOST (default: "rabbitmq")
 * - RABBITMQ_PORT (default: 5672)
 * - RABBITMQ_USER / RABBITMQ_PASSWORD (default: "guest")
 * - RABBITMQ_VHOST (default: "/")
 * - RABBITMQ_EXCHANGE (default: "paygate.events")
 * - EVENT_QUEUE_CAPACITY (default: 1024): буфер асинхронной публикации
 */
class RabbitMQSettings {
public:
    RabbitMQSettings() {
        if (const char* host = std::getenv("RABBITMQ_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("RABBITMQ_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* user = std::getenv("RABBITMQ_USER")) {
            user_ = user;
        }
        if (const char* password = std::getenv("RABBITMQ_PASSWORD")) {
            password_ = password;
        }
        if (const char* vhost = std::getenv("RABBITMQ_VHOST")) {
            vhost_ = vhost;
        }
        if (const char* exchange = std::getenv("RABBITMQ_EXCHANGE")) {
            exchange_ = exchange;
        }
        if (const char* capacity = std::getenv("EVENT_QUEUE_CAPACITY")) {
            queueCapacity_ = std::stoul(capacity);
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getVhost() const { return vhost_; }
    std::string getExchange() const { return exchange_; }
    size_t getQueueCapacity() const { return queueCapacity_; }

    std::string getAmqpUrl() const {
        return "amqp://" + user_ + ":" + password_ + "@" + host_ + ":" +
               std::to_string(port_) + vhost_;
    }

private:
    std::string host_ = "rabbitmq";
    int port_ = 5672;
    std::string user_ = "guest";
    std::string password_ = "guest";
    std::string vhost_ = "/";
    std::string exchange_ = "paygate.events";
    size_t queueCapacity_ = 1024;
};

} // namespace paygate::settings
