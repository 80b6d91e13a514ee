#include "core/jobs/JobLinker.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace core::jobs {

    namespace {
        constexpr double TIME_WINDOW_SECONDS = 2 * 3600.0;
        constexpr double MAX_LAYER_RATIO = 1.2;

        void eraseAll(std::string &text, const std::string &token) {
            for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos)) {
                text.erase(pos, token.size());
            }
        }

        bool containsEitherWay(const std::string &a, const std::string &b) {
            return a.find(b) != std::string::npos || b.find(a) != std::string::npos;
        }
    }

    std::string linkStrategyToString(LinkStrategy strategy) {
        switch (strategy) {
            case LinkStrategy::None:
                return "none";
            case LinkStrategy::Name:
                return "name";
            case LinkStrategy::LayerCount:
                return "layer_count";
            case LinkStrategy::TimeWindow:
                return "time_window";
        }
        return "none";
    }

    JobLinker::JobLinker(config::LinkerConfig config) : config_(std::move(config)) {
    }

    std::string JobLinker::normalize(const std::string &name) {
        std::string normalized = name;
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        eraseAll(normalized, ".3mf");
        eraseAll(normalized, ".bgcode");
        eraseAll(normalized, ".gcode");

        auto first = normalized.find_first_not_of(" \t");
        if (first == std::string::npos) return "";
        auto last = normalized.find_last_not_of(" \t");
        return normalized.substr(first, last - first + 1);
    }

    LinkResult JobLinker::match(const std::string &observedName, int totalLayers,
                                const std::vector<storage::ScheduledJob> &candidates, double nowEpoch) const {
        LinkResult result;
        if (candidates.empty()) {
            result.detail = "no candidates";
            return result;
        }

        if (auto id = matchByName(normalize(observedName), candidates, result.detail)) {
            result.scheduledJobId = id;
            result.strategy = LinkStrategy::Name;
            return result;
        }

        if (auto id = matchByLayers(totalLayers, candidates, result.detail)) {
            result.scheduledJobId = id;
            result.strategy = LinkStrategy::LayerCount;
            return result;
        }

        if (config_.timeWindowFallback) {
            if (auto id = matchByTimeWindow(totalLayers, nowEpoch, candidates, result.detail)) {
                result.scheduledJobId = id;
                result.strategy = LinkStrategy::TimeWindow;
                return result;
            }
        }

        if (result.detail.empty()) {
            result.detail = "no match among " + std::to_string(candidates.size()) + " candidate(s)";
        }
        return result;
    }

    std::optional<int64_t> JobLinker::matchByName(const std::string &observed,
                                                  const std::vector<storage::ScheduledJob> &candidates,
                                                  std::string &detail) {
        // An empty name is contained in every target
        if (observed.empty()) return std::nullopt;

        for (const auto &candidate: candidates) {
            for (const auto *field: {&candidate.filename, &candidate.itemName, &candidate.modelName}) {
                std::string target = normalize(*field);
                if (target.empty()) continue;
                if (containsEitherWay(observed, target)) {
                    detail = "'" + observed + "' ~ '" + target + "'";
                    return candidate.id;
                }
            }
        }
        return std::nullopt;
    }

    std::optional<int64_t> JobLinker::matchByLayers(int totalLayers,
                                                    const std::vector<storage::ScheduledJob> &candidates,
                                                    std::string &detail) {
        if (totalLayers <= 0) return std::nullopt;

        std::set<int64_t> matches;
        for (const auto &candidate: candidates) {
            if (candidate.layerCount && *candidate.layerCount == totalLayers) {
                matches.insert(candidate.id);
            }
        }

        if (matches.size() == 1) {
            detail = std::to_string(totalLayers) + " layers";
            return *matches.begin();
        }
        if (matches.size() > 1) {
            detail = std::to_string(matches.size()) + " candidates share " + std::to_string(totalLayers) +
                     " layers, left unlinked";
        }
        return std::nullopt;
    }

    std::optional<int64_t> JobLinker::matchByTimeWindow(int totalLayers, double nowEpoch,
                                                        const std::vector<storage::ScheduledJob> &candidates,
                                                        std::string &detail) {
        std::vector<int64_t> inWindow;
        for (const auto &candidate: candidates) {
            if (candidate.status != "scheduled" || !candidate.scheduledStart) continue;

            if (totalLayers > 0 && candidate.layerCount && *candidate.layerCount > 0) {
                double high = std::max(totalLayers, *candidate.layerCount);
                double low = std::min(totalLayers, *candidate.layerCount);
                if (high / low > MAX_LAYER_RATIO) continue;
            }
            if (std::fabs(nowEpoch - *candidate.scheduledStart) <= TIME_WINDOW_SECONDS) {
                inWindow.push_back(candidate.id);
            }
        }

        if (inWindow.size() == 1) {
            detail = "sole scheduled job within 2h";
            return inWindow.front();
        }
        if (inWindow.size() > 1) {
            detail = std::to_string(inWindow.size()) + " scheduled jobs within 2h, left unlinked";
        }
        return std::nullopt;
    }

} // namespace core::jobs
