#pragma once

#include "api/local_api.h"

class Node;

/**
 * Registers the draft screen's endpoints on `api`:
 *
 *   GET  /status               session status, room id and last error
 *   GET  /state                draft snapshot plus its status line
 *   POST /select               {"item": id}
 *   POST /reset
 *   POST /first-attack/toggle
 *   POST /sync                 pushes the whole state to the peer
 *   POST /room/host            returns {"room_id"}
 *   POST /room/join            {"room_id": id}
 *   POST /room/solo
 *   POST /room/leave
 *
 * `node` must outlive `api`.
 */
void register_draft_routes(LocalAPI& api, Node& node);
