#pragma once

#include <chrono>

namespace blobxfer::transfer {

using Seconds = std::chrono::duration<double>;

// Time snapshot for one engine tick. Every decision in a tick uses these values.
struct TickTime {
  // Simulation time at the start of the tick.
  Seconds now{0.0};
  // Time since the previous tick.
  Seconds delta{0.0};
};

}  // namespace blobxfer::transfer
