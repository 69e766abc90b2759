#ifndef SHADELOCK_QT_SCREEN_CAPTURER_H
#define SHADELOCK_QT_SCREEN_CAPTURER_H

#include "../lock/screenshot.h"

#include <functional>

class QScreen;

namespace shadelock {

// Grabs the current contents of a QScreen. Must run before any lock window
// is shown on that screen.
class QtScreenCapturer : public ScreenCapturer {
public:
    using ScreenLookup = std::function<QScreen *(OutputId)>;

    explicit QtScreenCapturer(ScreenLookup lookup) : m_lookup(std::move(lookup)) {}

    CaptureResult capture(OutputId id) override;

private:
    ScreenLookup m_lookup;
};

} // namespace shadelock

#endif // SHADELOCK_QT_SCREEN_CAPTURER_H
