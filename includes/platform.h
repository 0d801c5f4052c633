#pragma once

namespace ntree {

class Platform {
public:
    // Turns on ANSI escape processing for the console. Always true off Windows.
    static bool enableVirtualTerminal();
    static bool isOutputTerminal();
};

}  // namespace ntree
