#pragma once

#include "domain/Timestamp.hpp"
#include "utils/IdGenerator.hpp"
#include <string>

namespace paygate::domain {

/**
 * @brief Базовый класс событий, уходящих в paygate.events
 *
 * eventType совпадает с routing key.
 */
struct DomainEvent {
    std::string eventId;
    std::string eventType;
    Timestamp timestamp;

    explicit DomainEvent(const std::string& type)
        : eventId(utils::IdGenerator::uuid()), eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    virtual std::string toJson() const = 0;
};

} // namespace paygate::domain
