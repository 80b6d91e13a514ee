#pragma once

#include <chrono>

namespace connector::adapters {

    /**
     * @brief Transport timings shared by all protocol adapters
     */
    struct AdapterOptions {
        std::chrono::milliseconds connectTimeout{5000};
        std::chrono::seconds pushStaleness{60};
        std::chrono::seconds pullStaleness{120};
        std::chrono::seconds pollInterval{10};
        std::chrono::milliseconds requestTimeout{5000};
    };

}
