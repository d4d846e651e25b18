#pragma once

#include "http_server.h"
#include "job_service.h"
#include "session.h"

namespace benefice {

// GET / (status), POST / (create), DELETE / (kill), POST /out and
// POST /err (output snapshots). The caller is identified by the
// X-Forwarded-User header of the fronting proxy.
void register_routes(HttpServer& server, JobService& service, SessionStore& sessions);

} // namespace benefice
