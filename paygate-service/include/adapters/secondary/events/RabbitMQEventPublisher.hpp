#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace paygate::adapters::secondary {

/**
 * @brief Публикация событий в RabbitMQ (topic exchange paygate.events)
 *
 * Только публикация: потребители (сигнальный форвардер и т.п.) живут
 * в других сервисах. Публикация уходит в поток io_context через post().
 * Вызывается из рабочего потока AsyncEventPublisher.
 */
class RabbitMQEventPublisher : public ports::output::IEventPublisher {
public:
    explicit RabbitMQEventPublisher(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , exchangeName_(settings_->getExchange())
        , running_(false)
        , ready_(false)
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        std::cout << "[RabbitMQEventPublisher] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
    }

    ~RabbitMQEventPublisher() override {
        stop();
    }

    /**
     * @param routingKey Ключ маршрутизации (call.succeeded, oracle.report)
     * @param message JSON-сообщение
     */
    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_ || !ready_) {
            std::cerr << "[RabbitMQEventPublisher] Cannot publish " << routingKey
                      << ": not connected" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!channel_) {
                return;
            }
            channel_->publish(exchangeName_, routingKey, message);
            std::cout << "[RabbitMQEventPublisher] Published " << routingKey
                      << ": " << message.substr(0, 100) << "..." << std::endl;
        });
    }

    void start() {
        if (running_.exchange(true)) {
            return;
        }

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQEventPublisher] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQEventPublisher] Started" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }

        ready_ = false;
        workGuard_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQEventPublisher] Stopped" << std::endl;
    }

    bool isReady() const { return ready_.load(); }

private:
    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_, AMQP::Address(settings_->getAmqpUrl()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* msg) {
            ready_ = false;
            std::cerr << "[RabbitMQEventPublisher] Channel error: " << msg << std::endl;
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                ready_ = true;
                std::cout << "[RabbitMQEventPublisher] Exchange declared: " << exchangeName_ << std::endl;
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQEventPublisher] Exchange error: " << msg << std::endl;
            });
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_;
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace paygate::adapters::secondary
