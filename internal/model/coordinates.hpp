#pragma once

namespace alerts::model {

struct Coordinates {
  double lat = 0.0;
  double lon = 0.0;
};

} // namespace alerts::model
