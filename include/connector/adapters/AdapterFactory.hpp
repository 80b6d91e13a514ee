#pragma once

#include <functional>
#include <memory>

#include "connector/adapters/AdapterOptions.hpp"
#include "connector/client/HttpClient.hpp"
#include "connector/client/WebSocketClient.hpp"
#include "core/printer/PrinterAdapter.hpp"

namespace connector::adapters {

    using AdapterFactoryFn = std::function<std::unique_ptr<core::printer::PrinterAdapter>(
            const core::printer::PrinterEndpoint &, core::printer::PrinterAdapter::StatusCallback)>;

    /**
     * @brief Builds the adapter matching an endpoint's protocol
     */
    class AdapterFactory {
    public:
        explicit AdapterFactory(AdapterOptions options = {},
                                WebSocketFactory socketFactory = createWebSocketClient,
                                std::function<std::shared_ptr<HttpClient>()> httpFactory = createHttpClient);

        std::unique_ptr<core::printer::PrinterAdapter> create(
                const core::printer::PrinterEndpoint &endpoint,
                core::printer::PrinterAdapter::StatusCallback onStatus) const;

        AdapterFactoryFn asFunction() const;

    private:
        AdapterOptions options_;
        WebSocketFactory socketFactory_;
        std::function<std::shared_ptr<HttpClient>()> httpFactory_;
    };

} // namespace connector::adapters
