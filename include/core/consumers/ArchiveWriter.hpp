#pragma once

#include <atomic>
#include <memory>

#include "core/events/EventSystem.hpp"
#include "storage/ArchiveRepository.hpp"

namespace core::consumers {

    /**
     * @brief Writes one immutable history row per closed job
     */
    class ArchiveWriter {
    public:
        explicit ArchiveWriter(storage::Database &db);

        void attach(events::EventBus &bus);

        void detach(events::EventBus &bus);

        size_t archivedCount() const { return archived_; }

    private:
        storage::ArchiveRepository archives_;
        std::shared_ptr<events::IEventObserver> observer_;
        std::atomic<size_t> archived_{0};

        void onJobClosed(const events::Event &event);
    };

} // namespace core::consumers
