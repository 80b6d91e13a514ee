#pragma once

#include <string>
#include <vector>

namespace core::detector {

    /**
     * @brief Device error codes known to end an active print.
     *
     * Entries are exact codes ("klippy:shutdown") or prefixes ending in '*'
     * ("sdcp:*"). Loaded from detector.print_stopping_codes.
     */
    class PrintStoppingCodes {
    public:
        PrintStoppingCodes() = default;

        explicit PrintStoppingCodes(std::vector<std::string> entries);

        /**
         * @brief Parse a comma separated list, ignoring blanks around entries
         */
        static PrintStoppingCodes parse(const std::string &list);

        bool matches(const std::string &code) const;

        const std::vector<std::string> &entries() const { return entries_; }

        bool empty() const { return entries_.empty(); }

    private:
        std::vector<std::string> entries_;
    };

} // namespace core::detector
