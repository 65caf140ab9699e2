#pragma once

#include "elector.hpp"
#include "selection_policy.hpp"
#include <httplib.h>

namespace elector {

// Status for an election failure: 400 invalid body, 503 no backend, 500 decode
int status_for(ElectionError error);

// GET /health and POST /predict. The elector must outlive the server.
void register_routes(httplib::Server& server, const Elector<PrimaryPreferencePolicy>& coordinator);

} // namespace elector
