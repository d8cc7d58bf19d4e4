#pragma once

#include "network/knowledge_base.h"

namespace transit_router {

// Populate `knowledge_base` with a simplified piece of Bogota's TransMilenio
// system: three trunk lines (Caracas, NQS, Americas) that meet at a transfer
// station, "Centro Memoria", plus a direct Virrey - Calle 75 transfer.
void BuildTransMilenioSample(KnowledgeBase& knowledge_base);

// Populate `knowledge_base` with three collinear stations P, Q, R where P and
// Q are on line "1" and R is on line "2", connected P - Q - R with 1 km and 2
// min each. Coordinates are (0, 0), (0, 1) and (0, 2).
void BuildThreeStationLine(KnowledgeBase& knowledge_base);

}  // namespace transit_router
