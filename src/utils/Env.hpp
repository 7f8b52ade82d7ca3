#pragma once

#include <HashCoreUtilsExports.h>

#include <optional>
#include <string>
#include <string_view>

// A C++-like interface for manipulating environment variables.
class HashCoreUtils_API Env {
   public:
    Env() = default;

    class HashCoreUtils_API ValueEntry {
        std::string _key;

       public:
        explicit ValueEntry(const std::string_view key) : _key(key) {}
        // Aka, setenv
        const Env::ValueEntry& operator=(const std::string_view value) const;
        // Aka, unsetenv
        void clear() const;
        // Aka, getenv
        [[nodiscard]] std::optional<std::string> get() const;

        [[nodiscard]] std::string_view key() const { return _key; }

        ValueEntry() = delete;
        ~ValueEntry() = default;
    };

    ValueEntry operator[](const std::string_view key) const {
        return ValueEntry{key};
    }
};
