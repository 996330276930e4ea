#include "waypoint/core/http_router.h"

namespace waypoint::core {

HttpResponse not_found_response() {
    return HttpResponse::error("page not found", 404);
}

} // namespace waypoint::core
