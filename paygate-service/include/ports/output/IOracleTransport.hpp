#pragma once

#include "domain/Deadline.hpp"
#include "domain/OracleRequest.hpp"
#include "domain/OracleResponse.hpp"

namespace paygate::ports::output {

/**
 * @brief Выходной порт: отправка HTTP-запроса оракулу
 */
class IOracleTransport {
public:
    virtual ~IOracleTransport() = default;

    /**
     * @brief Отправить запрос и вернуть ответ с любым HTTP-статусом
     * @throws domain::TransientNetworkException при обрыве соединения или истечении срока
     */
    virtual domain::OracleResponse send(const domain::OracleRequest& request,
                                        const domain::Deadline& deadline) = 0;
};

} // namespace paygate::ports::output
