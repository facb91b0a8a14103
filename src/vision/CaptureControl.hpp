// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>

namespace sightline
{

/// @brief Runtime controls shared between the service API and the vision loops.
class CaptureControl
{
  public:
    void pauseVision() { _visionPaused.store(true); }
    void resumeVision() { _visionPaused.store(false); }

    [[nodiscard]] auto visionPaused() const -> bool { return _visionPaused.load(); }

  private:
    std::atomic<bool> _visionPaused = false;
};

} // namespace sightline
