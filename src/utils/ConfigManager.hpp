#pragma once

#include <HashCoreUtilsExports.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "CommandLine.hpp"

// Config loader over two sources, cmdline then env.
class HashCoreUtils_API ConfigManager {
   public:
    enum class Configs { STRING, LOG_FILE, BINARY, VERBOSE, HELP, MAX };
    static constexpr size_t CONFIG_MAX = static_cast<int>(Configs::MAX);

    // Prefix of the environment variable backing each config.
    static constexpr char kEnvPrefix[] = "HASHCORE_";

    /**
     * get - Function used to retrieve the value of a specific
     * configuration.
     *
     * @param config The configuration for which the value is to be retrieved.
     * @return A std::optional containing the value of the specified
     * configuration, or std::nullopt if the configuration is not found.
     * Flags that are set resolve to "1".
     */
    std::optional<std::string> get(Configs config) const;

    // True if a flag config is set and not explicitly false.
    [[nodiscard]] bool isSet(Configs config) const;

    // Positional arguments from the command line, in order.
    [[nodiscard]] const std::vector<std::string>& inputs() const;

    // False if the command line could not be parsed.
    [[nodiscard]] bool valid() const;

    /**
     * serializeHelpToOStream - Function used to serialize the help information
     * to an output stream.
     *
     * @param out The output stream to which the help information will be
     * serialized.
     */
    static void serializeHelpToOStream(std::ostream& out);

    explicit ConfigManager(CommandLine line);
    ~ConfigManager();

    struct Entry {
        static constexpr char ALIAS_NONE = '\0';

        Configs config;
        std::string_view name;
        std::string_view description;
        char alias;
        enum class ArgType { NONE, STRING } type;
    };

    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {
        Entry{
            Configs::STRING,
            "string",
            "Hash this string instead of files",
            's',
            Entry::ArgType::STRING,
        },
        {
            Configs::LOG_FILE,
            "log_file",
            "Also write logs to this file",
            'f',
            Entry::ArgType::STRING,
        },
        {
            Configs::BINARY,
            "binary",
            "Write raw 32-byte digests instead of hex",
            'b',
            Entry::ArgType::NONE,
        },
        {
            Configs::VERBOSE,
            "verbose",
            "Enable debug logging",
            'v',
            Entry::ArgType::NONE,
        },
        {
            Configs::HELP,
            "help",
            "Display help information",
            'h',
            Entry::ArgType::NONE,
        },
    };

    static constexpr const Entry& entryOf(const Configs config) {
        return *std::ranges::find_if(kConfigMap, [config](const Entry& entry) {
            return entry.config == config;
        });
    }

    // Environment variable name for a config, e.g. HASHCORE_LOG_FILE.
    static std::string envNameOf(Configs config);

    struct Backend {
        virtual ~Backend() = default;

        virtual bool load() { return true; }
        virtual std::optional<std::string> get(const std::string_view name) = 0;

        /**
         * @brief This field stores the name of the backend.
         *
         * This field stores the name of the backend, such as "Cmdline" or
         * "Env". This field is used for logging purposes.
         */
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

   private:
    enum class BackendType { COMMAND_LINE, ENV, MAX };

    class BackendStorage {
        std::array<std::unique_ptr<Backend>, static_cast<int>(BackendType::MAX)>
            backends;

       public:
        std::unique_ptr<Backend>& operator[](const BackendType type) {
            return backends[static_cast<int>(type)];
        }

        const std::unique_ptr<Backend>& operator[](const BackendType type) const {
            return backends[static_cast<int>(type)];
        }

        [[nodiscard]] decltype(backends)::const_iterator begin() const {
            return backends.cbegin();
        }

        [[nodiscard]] decltype(backends)::const_iterator end() const {
            return backends.cend();
        }

        [[nodiscard]] size_t size() const {
            return std::ranges::count_if(
                backends, [](const auto& ent) { return ent != nullptr; });
        }
    } storage;
    std::vector<std::string> _inputs;
};
