#include "domain/RequestFingerprint.hpp"
#include "utils/CryptoUtils.hpp"

namespace paygate::domain {

RequestFingerprint RequestFingerprint::of(const OracleRequest& request) {
    std::string material = request.method + " " + request.host + ":" +
                           std::to_string(request.port) + request.path + "\n" +
                           request.canonicalParams;
    return RequestFingerprint(utils::CryptoUtils::sha256Hex(material));
}

} // namespace paygate::domain
