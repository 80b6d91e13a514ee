#include "connector/adapters/AdapterFactory.hpp"
#include "connector/adapters/elegoo/ElegooAdapter.hpp"
#include "connector/adapters/moonraker/MoonrakerAdapter.hpp"
#include "connector/adapters/prusalink/PrusaLinkAdapter.hpp"

namespace connector::adapters {

    using core::printer::ProtocolKind;

    AdapterFactory::AdapterFactory(AdapterOptions options,
                                   WebSocketFactory socketFactory,
                                   std::function<std::shared_ptr<HttpClient>()> httpFactory)
            : options_(options),
              socketFactory_(std::move(socketFactory)),
              httpFactory_(std::move(httpFactory)) {
    }

    std::unique_ptr<core::printer::PrinterAdapter> AdapterFactory::create(
            const core::printer::PrinterEndpoint &endpoint,
            core::printer::PrinterAdapter::StatusCallback onStatus) const {
        switch (endpoint.kind) {
            case ProtocolKind::Moonraker:
                return std::make_unique<moonraker::MoonrakerAdapter>(endpoint, std::move(onStatus), options_,
                                                                     socketFactory_);
            case ProtocolKind::Elegoo:
                return std::make_unique<elegoo::ElegooAdapter>(endpoint, std::move(onStatus), options_,
                                                               socketFactory_);
            case ProtocolKind::PrusaLink:
                return std::make_unique<prusalink::PrusaLinkAdapter>(endpoint, std::move(onStatus), options_,
                                                                     httpFactory_());
        }
        return nullptr;
    }

    AdapterFactoryFn AdapterFactory::asFunction() const {
        AdapterFactory copy = *this;
        return [copy](const core::printer::PrinterEndpoint &endpoint,
                      core::printer::PrinterAdapter::StatusCallback onStatus) {
            return copy.create(endpoint, std::move(onStatus));
        };
    }

} // namespace connector::adapters
