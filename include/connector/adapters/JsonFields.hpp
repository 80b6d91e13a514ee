#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace connector::adapters::fields {

    // Device payloads routinely send null, omit fields or change a field's
    // type between firmware versions; these readers fall back instead of throwing.

    inline const nlohmann::json &object(const nlohmann::json &j, const char *key) {
        static const nlohmann::json empty = nlohmann::json::object();
        if (!j.is_object()) return empty;
        auto it = j.find(key);
        if (it == j.end() || !it->is_object()) return empty;
        return *it;
    }

    inline std::optional<double> optionalNumber(const nlohmann::json &j, const char *key) {
        if (!j.is_object()) return std::nullopt;
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return std::nullopt;
        if (it->is_number()) return it->get<double>();
        if (it->is_string()) {
            try {
                return std::stod(it->get<std::string>());
            } catch (const std::exception &) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    inline double number(const nlohmann::json &j, const char *key, double def = 0.0) {
        return optionalNumber(j, key).value_or(def);
    }

    inline int integer(const nlohmann::json &j, const char *key, int def = 0) {
        auto value = optionalNumber(j, key);
        return value ? static_cast<int>(*value) : def;
    }

    inline std::optional<std::string> optionalString(const nlohmann::json &j, const char *key) {
        if (!j.is_object()) return std::nullopt;
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }

    inline std::string string(const nlohmann::json &j, const char *key, const std::string &def = "") {
        return optionalString(j, key).value_or(def);
    }

    inline std::optional<bool> optionalBool(const nlohmann::json &j, const char *key) {
        if (!j.is_object()) return std::nullopt;
        auto it = j.find(key);
        if (it == j.end()) return std::nullopt;
        if (it->is_boolean()) return it->get<bool>();
        if (it->is_number()) return it->get<double>() != 0.0;
        return std::nullopt;
    }

}
