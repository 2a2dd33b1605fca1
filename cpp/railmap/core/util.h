#ifndef RAILMAP_CORE_UTIL_H
#define RAILMAP_CORE_UTIL_H

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
#endif

namespace railmap {

// Monotonic milliseconds. Matches performance.now() when running in the browser.
inline double nowMs() {
#ifdef EMSCRIPTEN
    return emscripten_get_now();
#else
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
#endif
}

} // namespace railmap

#endif // RAILMAP_CORE_UTIL_H
