#pragma once

#include <nlohmann/json.hpp>

#include "core/printer/CanonicalStatus.hpp"

namespace connector::adapters::prusalink {

    class PrusaLinkStatusParser {
    public:
        /**
         * @brief Decode GET /api/v1/status ({printer:{...}, job:{...}})
         */
        static core::printer::CanonicalStatus parseStatus(const nlohmann::json &body);

        /**
         * @brief Add file details from GET /api/v1/job
         */
        static void applyJob(core::printer::CanonicalStatus &status, const nlohmann::json &body);

        /**
         * @brief Merge the legacy GET /api/printer and GET /api/job replies
         * @param job may be null when the printer has no job endpoint answer
         */
        static core::printer::CanonicalStatus parseLegacy(const nlohmann::json &printer, const nlohmann::json &job);

        /**
         * @brief Map a PrusaLink state name onto the canonical state and job result
         */
        static void applyState(core::printer::CanonicalStatus &status, const std::string &state);
    };

} // namespace connector::adapters::prusalink
