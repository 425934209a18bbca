#pragma once

#include <map>
#include <string>

namespace paygate::domain {

/**
 * @brief Описание HTTP-запроса к оракулу
 *
 * canonicalParams: канонический JSON параметров вызова (ключи отсортированы),
 * из него и целевого адреса строится RequestFingerprint.
 * Заголовки в отпечаток не входят.
 */
struct OracleRequest {
    std::string method = "GET";
    std::string host;
    int port = 80;
    std::string path;
    std::string body;
    std::map<std::string, std::string> headers;
    std::string canonicalParams;

    /// URI ресурса, под который выдаётся challenge
    std::string resourceUri() const {
        return "http://" + host + ":" + std::to_string(port) + path;
    }

    OracleRequest withHeader(const std::string& name, const std::string& value) const {
        OracleRequest copy = *this;
        copy.headers[name] = value;
        return copy;
    }
};

} // namespace paygate::domain
