#pragma once

#include <map>
#include <string>

namespace fritz {

// Output arguments of one remote action, keyed by argument name (e.g. "NewTotalBytesSent").
using ActionResponse = std::map<std::string, std::string>;

// Session to a managed device that can execute named remote actions.
// Implementations throw TransportError on connectivity, authentication or device failure.
class Transport {
public:
    virtual ~Transport() = default;

    virtual ActionResponse call(const std::string& service, const std::string& action) = 0;
};

}
