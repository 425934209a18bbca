#pragma once

#include <string>

namespace paygate::domain {

struct OracleResponse {
    int status = 0;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
    bool isPaymentRequired() const { return status == 402; }
    bool isServerError() const { return status >= 500; }
};

} // namespace paygate::domain
