#pragma once

#include <boost/system/error_code.hpp>

#include <type_traits>

namespace waypoint::core {

// Failures reported through the router's completion handler.
enum class errc {
    // The request target could not be parsed into a URL.
    bad_request_target = 1,

    // Generic failure for handlers with nothing more specific to say.
    handler_failed
};

const boost::system::error_category& error_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

} // namespace waypoint::core

namespace boost::system {

template<>
struct is_error_code_enum<waypoint::core::errc> : std::true_type {};

} // namespace boost::system
