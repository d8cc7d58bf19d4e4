#include "test_util/sample_network.h"

namespace transit_router {

void BuildTransMilenioSample(KnowledgeBase& kb) {
  kb.AddStation("Portal Norte", "Troncal Caracas", Coordinates{4.7656, -74.0467});
  kb.AddStation("Toberin", "Troncal Caracas", Coordinates{4.7532, -74.0464});
  kb.AddStation("Calle 142", "Troncal Caracas", Coordinates{4.7241, -74.0511});
  kb.AddStation("Alcala", "Troncal Caracas", Coordinates{4.7110, -74.0532});
  kb.AddStation("Calle 100", "Troncal Caracas", Coordinates{4.6858, -74.0549});
  kb.AddStation("Virrey", "Troncal Caracas", Coordinates{4.6656, -74.0569});

  kb.AddStation("Portal Suba", "Troncal NQS", Coordinates{4.7462, -74.0832});
  kb.AddStation("Suba Calle 95", "Troncal NQS", Coordinates{4.7279, -74.0834});
  kb.AddStation("Calle 75", "Troncal NQS", Coordinates{4.6771, -74.0613});
  kb.AddStation("Heroes", "Troncal NQS", Coordinates{4.6531, -74.0633});
  kb.AddStation("CAD", "Troncal NQS", Coordinates{4.6437, -74.0641});

  kb.AddStation("Portal Americas", "Troncal Americas", Coordinates{4.6172, -74.1413});
  kb.AddStation("Pradera", "Troncal Americas", Coordinates{4.6294, -74.1291});
  kb.AddStation("Marsella", "Troncal Americas", Coordinates{4.6376, -74.1156});
  kb.AddStation("Zona Industrial", "Troncal Americas", Coordinates{4.6445, -74.1069});

  kb.AddStation("Centro Memoria", "Transbordo", Coordinates{4.6569, -74.0611});

  // Troncal Caracas
  kb.AddConnection("Portal Norte", "Toberin", 1.5, 3);
  kb.AddConnection("Toberin", "Calle 142", 3.2, 6);
  kb.AddConnection("Calle 142", "Alcala", 1.8, 4);
  kb.AddConnection("Alcala", "Calle 100", 2.8, 5);
  kb.AddConnection("Calle 100", "Virrey", 2.3, 4);

  // Troncal NQS
  kb.AddConnection("Portal Suba", "Suba Calle 95", 2.1, 4);
  kb.AddConnection("Suba Calle 95", "Calle 75", 5.8, 10);
  kb.AddConnection("Calle 75", "Heroes", 2.8, 5);
  kb.AddConnection("Heroes", "CAD", 1.2, 3);
  kb.AddConnection("CAD", "Centro Memoria", 0.8, 2);

  // Troncal Americas
  kb.AddConnection("Portal Americas", "Pradera", 1.7, 3);
  kb.AddConnection("Pradera", "Marsella", 1.9, 4);
  kb.AddConnection("Marsella", "Zona Industrial", 1.5, 3);
  kb.AddConnection("Zona Industrial", "Centro Memoria", 1.2, 3);

  // Transfers between lines. Virrey - Calle 75 includes waiting time.
  kb.AddConnection("Virrey", "Calle 75", 1.5, 8);
  kb.AddConnection("Virrey", "Centro Memoria", 1.8, 5);
}

void BuildThreeStationLine(KnowledgeBase& kb) {
  kb.AddStation("P", "1", Coordinates{0.0, 0.0});
  kb.AddStation("Q", "1", Coordinates{0.0, 1.0});
  kb.AddStation("R", "2", Coordinates{0.0, 2.0});
  kb.AddConnection("P", "Q", 1.0, 2.0);
  kb.AddConnection("Q", "R", 1.0, 2.0);
}

}  // namespace transit_router
