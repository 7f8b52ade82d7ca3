#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <fmt/format.h>

#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <boost/program_options.hpp>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include "CommandLine.hpp"
#include "Env.hpp"

namespace po = boost::program_options;

namespace {

constexpr const char* kInputsOption = "input";

void AddOption(po::options_description &desc,
               const ConfigManager::Entry &entry) {
    std::string spec(entry.name);
    if (entry.alias != ConfigManager::Entry::ALIAS_NONE) {
        spec = fmt::format("{},{}", entry.name, entry.alias);
    }
    switch (entry.type) {
        case ConfigManager::Entry::ArgType::NONE:
            desc.add_options()(spec.c_str(), po::bool_switch(),
                               entry.description.data());
            break;
        case ConfigManager::Entry::ArgType::STRING:
            desc.add_options()(spec.c_str(), po::value<std::string>(),
                               entry.description.data());
            break;
    }
}

std::string envNameFor(const std::string_view name) {
    std::string var =
        absl::StrCat(ConfigManager::kEnvPrefix, std::string(name));
    absl::AsciiStrToUpper(&var);
    return var;
}

bool isTruthy(const std::string_view value) {
    std::string lowered(value);
    absl::AsciiStrToLower(&lowered);
    return lowered == "1" || lowered == "true" || lowered == "yes" ||
           lowered == "on";
}

}  // namespace

struct ConfigBackendEnv : public ConfigManager::Backend {
    ~ConfigBackendEnv() override = default;
    ConfigBackendEnv() = default;

    std::optional<std::string> get(const std::string_view name) override {
        Env env;
        return env[envNameFor(name)].get();
    }

    [[nodiscard]] std::string_view name() const override { return "Env"; }
};

struct ConfigBackendCmdline : public ConfigManager::Backend {
    CommandLine _line;

    static po::options_description getOptionsDesc() {
        po::options_description desc("HashCore options");
        for (const auto &entry : ConfigManager::kConfigMap) {
            AddOption(desc, entry);
        }
        return desc;
    }

    bool load() override {
        po::options_description all = getOptionsDesc();
        all.add_options()(kInputsOption,
                          po::value<std::vector<std::string>>(),
                          "Input files");
        po::positional_options_description positional;
        positional.add(kInputsOption, -1);

        try {
            po::store(po::command_line_parser(_line.argc(), _line.argv())
                          .options(all)
                          .positional(positional)
                          .run(),
                      mp);
            po::notify(mp);
        } catch (const po::error &e) {
            LOG(ERROR) << "Cmdline backend failed to parse: " << e.what();
            return false;
        }

        if (const auto it = mp.find(kInputsOption); it != mp.end()) {
            inputs = it->second.as<std::vector<std::string>>();
        }
        DLOG(INFO) << "Loaded " << mp.size() << " entries (cmdline)";
        return true;
    }

    std::optional<std::string> get(const std::string_view name) override {
        const auto it = mp.find(std::string(name));
        if (it == mp.end() || it->second.empty() || it->second.defaulted()) {
            return std::nullopt;
        }
        if (const auto *flag = boost::any_cast<bool>(&it->second.value())) {
            if (*flag) {
                return "1";
            }
            return std::nullopt;
        }
        return it->second.as<std::string>();
    }

    [[nodiscard]] std::string_view name() const override { return "Cmdline"; }

    explicit ConfigBackendCmdline(CommandLine line) : _line(line) {}
    ~ConfigBackendCmdline() override = default;

    po::variables_map mp;
    std::vector<std::string> inputs;
};

ConfigManager::ConfigManager(CommandLine line) {
    auto cmdline = std::make_unique<ConfigBackendCmdline>(line);
    if (cmdline->load()) {
        _inputs = std::move(cmdline->inputs);
        storage[BackendType::COMMAND_LINE] = std::move(cmdline);
    }
    auto env = std::make_unique<ConfigBackendEnv>();
    if (env->load()) {
        storage[BackendType::ENV] = std::move(env);
    }
    DLOG(INFO) << "Loaded " << storage.size() << " config sources";
}

ConfigManager::~ConfigManager() = default;

std::string ConfigManager::envNameOf(const Configs config) {
    return envNameFor(entryOf(config).name);
}

std::optional<std::string> ConfigManager::get(Configs config) const {
    const std::string_view name = entryOf(config).name;

    for (const auto &bit : storage) {
        if (!bit) {
            continue;
        }
        if (config == Configs::HELP && bit->name() != "Cmdline") {
            continue;
        }
        const auto &result = bit->get(name);
        if (result.has_value()) {
            DLOG(INFO) << fmt::format("Used '{}' backend for variable {}",
                                      bit->name(), name);
            return result;
        }
    }

    return std::nullopt;
}

bool ConfigManager::isSet(Configs config) const {
    const auto value = get(config);
    return value.has_value() && isTruthy(*value);
}

const std::vector<std::string> &ConfigManager::inputs() const {
    return _inputs;
}

bool ConfigManager::valid() const {
    return storage[BackendType::COMMAND_LINE] != nullptr;
}

void ConfigManager::serializeHelpToOStream(std::ostream &out) {
    out << ConfigBackendCmdline::getOptionsDesc() << std::endl;
}
