// Logger filtering/sinks and tick pacing.
#include <cassert>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../engine/core/Time.h"
#include "../engine/math/Vec2.h"

using namespace Engine;

int main() {
    {
        std::vector<std::string> lines;
        Logger::setSink([&lines](LogLevel, const std::string& line) { lines.push_back(line); });
        Logger::setMinLevel(LogLevel::Info);
        logDebug("hidden");
        logInfo("wave started");
        logError("boom");
        assert(lines.size() == 2);
        assert(lines[0].find("[INFO] wave started") != std::string::npos);
        assert(lines[1].find("[ERROR] boom") != std::string::npos);

        Logger::setMinLevel(LogLevel::Debug);
        logDebug("now visible");
        assert(lines.size() == 3);
        assert(lines[2].find("[DEBUG]") != std::string::npos);
        Logger::setSink({});
        Logger::setMinLevel(LogLevel::Info);
    }
    {
        LogLevel level = LogLevel::Info;
        assert(Logger::parseLevel("WARN", level) && level == LogLevel::Warning);
        assert(Logger::parseLevel("debug", level) && level == LogLevel::Debug);
        assert(!Logger::parseLevel("verbose", level));
        assert(level == LogLevel::Debug);
    }
    {
        TickPacer pacer;
        // Paused: nothing runs and the backlog is cleared.
        assert(pacer.advance(TimeStep{0.5, 0.5}, 0) == 0);
        assert(pacer.pending() == 0.0);
        // 1x: one tick per 50 ms.
        assert(pacer.advance(TimeStep{0.12, 0.12}, 1) == 2);
        assert(pacer.pending() > 0.019 && pacer.pending() < 0.021);
        pacer.reset();
        // 2x: one tick per 25 ms.
        assert(pacer.advance(TimeStep{0.12, 0.12}, 2) == 4);
        pacer.reset();
        // A long stall is capped and the backlog dropped.
        assert(pacer.advance(TimeStep{1.0, 1.0}, 3) == TickPacer::kMaxTicksPerFrame);
        assert(pacer.pending() == 0.0);
        assert(pacer.advance(TimeStep{0.01, 1.01}, 7) == 0);
    }
    {
        const Vec2 a{0.5, 0.5};
        const Vec2 b{3.5, 4.5};
        assert(distanceSquared(a, b) == 25.0);
        const Vec2 mid = lerp(a, b, 0.5);
        assert(mid == Vec2(2.0, 2.5));
        const Vec2 dir = directionTo(a, b);
        assert(dir.x == 0.6 && dir.y == 0.8);
        assert(directionTo(a, a) == Vec2(0.0, 0.0));
    }
    return 0;
}
