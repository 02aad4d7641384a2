#pragma once

#include <string>
#include "../core/exceptions.hpp"

namespace xvh {

// A venue could not produce a usable price: transport failure, HTTP error or
// an unparseable response.
class ExchangeException : public XvhException {
public:
    ExchangeException(const std::string& venue, const std::string& message)
        : XvhException(venue + ": " + message), venue_(venue) {}

    const std::string& venue() const { return venue_; }

private:
    std::string venue_;
};

} // namespace xvh
