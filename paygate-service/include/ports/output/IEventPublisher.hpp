#pragma once

#include <string>

namespace paygate::ports::output {

/**
 * @brief Интерфейс публикации событий
 *
 * Доставка не влияет на корректность платежа: реализации не бросают
 * наружу, ошибки только логируются.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @param routingKey Ключ маршрутизации (call.succeeded, oracle.report)
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace paygate::ports::output
