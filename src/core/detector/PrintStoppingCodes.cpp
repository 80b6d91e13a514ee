#include "core/detector/PrintStoppingCodes.hpp"

#include <sstream>

namespace core::detector {

    namespace {
        std::string trim(const std::string &text) {
            auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }
    }

    PrintStoppingCodes::PrintStoppingCodes(std::vector<std::string> entries) {
        for (auto &entry: entries) {
            entry = trim(entry);
            if (!entry.empty()) entries_.push_back(std::move(entry));
        }
    }

    PrintStoppingCodes PrintStoppingCodes::parse(const std::string &list) {
        std::vector<std::string> entries;
        std::stringstream stream(list);
        std::string entry;
        while (std::getline(stream, entry, ',')) {
            entries.push_back(entry);
        }
        return PrintStoppingCodes(std::move(entries));
    }

    bool PrintStoppingCodes::matches(const std::string &code) const {
        if (code.empty()) return false;
        for (const auto &entry: entries_) {
            if (entry.back() == '*') {
                if (code.compare(0, entry.size() - 1, entry, 0, entry.size() - 1) == 0) return true;
            } else if (entry == code) {
                return true;
            }
        }
        return false;
    }

} // namespace core::detector
