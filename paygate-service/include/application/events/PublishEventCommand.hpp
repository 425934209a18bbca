#pragma once

#include "ICommand.hpp"
#include "CommandException.hpp"
#include "ports/output/IEventPublisher.hpp"
#include <memory>
#include <string>

namespace paygate::application::events {

/**
 * @brief Отложенная публикация одного события
 */
class PublishEventCommand : public ICommand {
public:
    PublishEventCommand(std::shared_ptr<ports::output::IEventPublisher> target,
                        std::string routingKey,
                        std::string message)
        : target_(std::move(target))
        , routingKey_(std::move(routingKey))
        , message_(std::move(message))
    {}

    void execute() override {
        try {
            target_->publish(routingKey_, message_);
        } catch (const std::exception& e) {
            throw CommandException("publish " + routingKey_ + " failed: " + e.what());
        }
    }

    const std::string& routingKey() const { return routingKey_; }

private:
    std::shared_ptr<ports::output::IEventPublisher> target_;
    std::string routingKey_;
    std::string message_;
};

} // namespace paygate::application::events
