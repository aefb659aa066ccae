#pragma once

#include <ostream>
#include <vector>
#include "../common/Messages.hpp"

namespace lan_sentry::client
{
    void PrintNetworkInfo(std::ostream &os, const lan_sentry::common::NetworkInfo &info);
    void PrintDeviceTable(std::ostream &os, const std::vector<lan_sentry::common::DeviceRecord> &devices);
    void PrintScanSummary(std::ostream &os, const lan_sentry::common::ScanSummary &summary);
    void PrintDeviceDetail(std::ostream &os, const lan_sentry::common::DeviceDetail &detail);
    void PrintPingReport(std::ostream &os, const std::string &address, const lan_sentry::common::PingReport &report);
    void PrintEvent(std::ostream &os, const lan_sentry::common::DeviceEvent &event);
    void PrintError(std::ostream &os, const lan_sentry::common::ErrorInfo &error);
}
