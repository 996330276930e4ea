#include "waypoint/core/error.h"

#include <string>

namespace waypoint::core {

namespace {

class ErrorCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override {
        return "waypoint";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
        case errc::bad_request_target:
            return "bad request target";
        case errc::handler_failed:
            return "handler failed";
        }
        return "unknown waypoint error";
    }
};

} // namespace

const boost::system::error_category& error_category() noexcept {
    static const ErrorCategory category;
    return category;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace waypoint::core
