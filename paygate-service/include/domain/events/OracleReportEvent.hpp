#pragma once

#include "DomainEvent.hpp"
#include <string>

namespace paygate::domain {

/**
 * @brief Событие: отчёт инструмента для внешнего сигнального форвардера
 */
struct OracleReportEvent : public DomainEvent {
    std::string tool;
    std::string fingerprint;
    std::string report;

    OracleReportEvent() : DomainEvent("oracle.report") {}

    std::string toJson() const override;
};

} // namespace paygate::domain
