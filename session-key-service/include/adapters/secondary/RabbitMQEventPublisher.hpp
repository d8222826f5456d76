#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <memory>
#include <thread>
#include <atomic>
#include <iostream>

namespace sessionkeys::adapters::secondary {

/**
 * @brief Публикация событий аудита в RabbitMQ
 *
 * Exchange: topic (session-keys.events), routing key = тип события.
 * Соединение живёт в отдельном потоке с io_context; publish() из потоков
 * запросов ставит отправку в очередь этого io_context, поэтому канал
 * трогает только один поток, а порядок вызовов publish() сохраняется.
 */
class RabbitMQEventPublisher : public ports::output::IEventPublisher {
public:
    explicit RabbitMQEventPublisher(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ioContext_()
        , work_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQPublisher] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
        start();
    }

    ~RabbitMQEventPublisher() override {
        stop();
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQPublisher] Cannot publish " << routingKey << ": not running" << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!channel_) {
                std::cerr << "[RabbitMQPublisher] Cannot publish " << routingKey << ": not connected" << std::endl;
                return;
            }
            try {
                channel_->publish(exchangeName_, routingKey, message);
                std::cout << "[RabbitMQPublisher] Published " << routingKey
                          << ": " << message.substr(0, 100) << "..." << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQPublisher] Publish error: " << e.what() << std::endl;
            }
        });
    }

    void start() {
        if (running_) return;

        running_ = true;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQPublisher] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQPublisher] Started" << std::endl;
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        work_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQPublisher] Stopped" << std::endl;
    }

private:
    void connect() {
        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQPublisher] Exchange declared: " << exchangeName_ << std::endl;
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQPublisher] Exchange error: " << msg << std::endl;
            });
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    std::atomic<bool> running_;
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace sessionkeys::adapters::secondary
