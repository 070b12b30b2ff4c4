#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <absl/strings/numbers.h>
#include <fmt/format.h>

#include <algorithm>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include "CommandLine.hpp"
#include "Env.hpp"

namespace po = boost::program_options;

namespace {

constexpr bool isOrdered() {
    for (std::size_t i = 0; i < ConfigManager::CONFIG_MAX; ++i) {
        if (static_cast<std::size_t>(ConfigManager::kConfigMap[i].config) !=
            i) {
            return false;
        }
    }
    return true;
}
static_assert(isOrdered(), "kConfigMap must follow the order of Configs");

enum class Source { CommandLine, File };

void AddOption(po::options_description &desc,
               const ConfigManager::Entry &entry, const Source source) {
    std::string name;
    if (source == Source::File) {
        name = entry.name;
    } else if (entry.alias != ConfigManager::Entry::ALIAS_NONE) {
        name = fmt::format("{},{}", entry.option, entry.alias);
    } else {
        name = entry.option;
    }
    if (entry.type == ConfigManager::Entry::ArgType::NONE) {
        desc.add_options()(name.c_str(), entry.description.data());
    } else {
        desc.add_options()(name.c_str(), po::value<std::string>(),
                           entry.description.data());
    }
}

po::options_description getOptionsDesc(const Source source) {
    po::options_description desc("File transfer configs");
    for (const auto &entry : ConfigManager::kConfigMap) {
        using Configs = ConfigManager::Configs;
        if (source == Source::File &&
            (entry.config == Configs::HELP || entry.config == Configs::SOURCE ||
             entry.config == Configs::CONFIG_FILE)) {
            continue;
        }
        AddOption(desc, entry, source);
    }
    return desc;
}

struct ConfigBackendEnv : public ConfigManager::Backend {
    std::optional<std::string> get(const ConfigManager::Entry &entry) override {
        Env env;
        const auto value =
            env[fmt::format("{}{}", ConfigManager::kEnvPrefix, entry.name)];
        if (value.has()) {
            return value.get();
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string_view name() const override { return "Env"; }
};

struct ConfigBackendBoostPOBase : public ConfigManager::Backend {
    std::optional<std::string> get(const ConfigManager::Entry &entry) override {
        const auto key = std::string(keyOf(entry));
        if (!mp.contains(key)) {
            return std::nullopt;
        }
        if (entry.type == ConfigManager::Entry::ArgType::NONE) {
            return std::string();
        }
        return mp[key].as<std::string>();
    }

   protected:
    [[nodiscard]] virtual std::string_view keyOf(
        const ConfigManager::Entry &entry) const = 0;

    po::variables_map mp;
};

struct ConfigBackendFile : public ConfigBackendBoostPOBase {
    bool load() override {
        std::ifstream ifs(path_);
        if (ifs.fail()) {
            if (required_) {
                LOG(ERROR) << "Opening " << path_ << " failed";
            } else {
                DLOG(INFO) << "No config file at " << path_;
            }
            return false;
        }
        try {
            po::store(po::parse_config_file(ifs, getOptionsDesc(Source::File)),
                      mp);
        } catch (const boost::program_options::error &e) {
            LOG(ERROR) << "File backend failed to parse: " << e.what();
            return false;
        }
        po::notify(mp);

        LOG(INFO) << "Loaded " << mp.size() << " entries from " << path_;
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "File"; }

    ConfigBackendFile(std::filesystem::path path, bool required)
        : path_(std::move(path)), required_(required) {}

   private:
    [[nodiscard]] std::string_view keyOf(
        const ConfigManager::Entry &entry) const override {
        return entry.name;
    }

    std::filesystem::path path_;
    bool required_;
};

struct ConfigBackendCmdline : public ConfigBackendBoostPOBase {
    CommandLine _line;

    bool load() override {
        po::positional_options_description positional;
        positional.add(
            ConfigManager::entryOf(ConfigManager::Configs::SOURCE)
                .option.data(),
            1);
        try {
            po::store(po::command_line_parser(_line.argc(), _line.argv())
                          .options(getOptionsDesc(Source::CommandLine))
                          .positional(positional)
                          .run(),
                      mp);
        } catch (const boost::program_options::error &e) {
            LOG(ERROR) << "Cmdline backend failed to parse: " << e.what();
            return false;
        }
        po::notify(mp);

        DLOG(INFO) << "Loaded " << mp.size() << " entries (cmdline)";
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "Cmdline"; }

    explicit ConfigBackendCmdline(CommandLine line) : _line(std::move(line)) {}

   private:
    [[nodiscard]] std::string_view keyOf(
        const ConfigManager::Entry &entry) const override {
        return entry.option;
    }
};

}  // namespace

size_t ConfigManager::BackendStorage::size() const {
    return std::ranges::count_if(
        backends, [](const auto &ent) { return ent != nullptr; });
}

ConfigManager::ConfigManager(CommandLine line) {
    auto cmdline = std::make_unique<ConfigBackendCmdline>(std::move(line));
    if (cmdline->load()) {
        storage[BackendType::COMMAND_LINE] = std::move(cmdline);
        loaded_ = true;
    }
    storage[BackendType::ENV] = std::make_unique<ConfigBackendEnv>();

    std::unique_ptr<ConfigBackendFile> file;
    if (auto path = get(Configs::CONFIG_FILE); path) {
        file = std::make_unique<ConfigBackendFile>(*path, true);
    } else if (Env env; env["HOME"].has()) {
        file = std::make_unique<ConfigBackendFile>(
            std::filesystem::path(env["HOME"].get()) / kDefaultConfigFile,
            false);
    }
    if (file && file->load()) {
        storage[BackendType::FILE] = std::move(file);
    }
    DLOG(INFO) << "Loaded " << storage.size() << " config sources";
}

ConfigManager::~ConfigManager() = default;

std::optional<std::string> ConfigManager::get(Configs config) const {
    const auto &entry = entryOf(config);

    for (const auto &bit : storage) {
        if (!bit) {
            continue;
        }
        auto result = bit->get(entry);
        if (result.has_value()) {
            DLOG(INFO) << fmt::format("Used '{}' backend for variable {}",
                                      bit->name(), entry.name);
            return result;
        }
    }
    return std::nullopt;
}

absl::StatusOr<uint64_t> ConfigManager::getNumber(Configs config,
                                                  uint64_t fallback) const {
    const auto value = get(config);
    if (!value) {
        return fallback;
    }
    uint64_t number = 0;
    if (!absl::SimpleAtoi(*value, &number)) {
        return absl::InvalidArgumentError(
            fmt::format("{} must be an unsigned number, got '{}'",
                        entryOf(config).name, *value));
    }
    return number;
}

bool ConfigManager::has(Configs config) const {
    return get(config).has_value();
}

void ConfigManager::serializeHelpToOStream(std::ostream &out) {
    out << getOptionsDesc(Source::CommandLine) << std::endl;
}
