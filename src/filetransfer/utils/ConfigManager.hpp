#pragma once

#include <UtilsExports.h>
#include <absl/status/statusor.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "CommandLine.hpp"

// Abstract manager for config loader
// Three sources in priority order: cmdline, env, file
class Utils_API ConfigManager {
   public:
    enum class Configs {
        HOST,
        PORT,
        SERVICE_ID,
        MAX_SEGMENT_SIZE,
        IO_TIMEOUT,
        STORAGE_DIR,
        WORKING_DIR,
        IO_THREADS,
        LOG_FILE,
        CONFIG_FILE,
        NAME,
        SOURCE,
        HELP,
        MAX
    };
    static constexpr size_t CONFIG_MAX = static_cast<int>(Configs::MAX);

    // Environment variables are looked up as FILETRANSFER_<NAME>.
    static constexpr std::string_view kEnvPrefix = "FILETRANSFER_";
    // Looked up in $HOME when CONFIG_FILE is not given.
    static constexpr std::string_view kDefaultConfigFile = ".filetransfer.ini";

    /**
     * get - Function used to retrieve the value of a specific
     * configuration.
     *
     * @param config The configuration for which the value is to be retrieved.
     * @return A std::optional containing the value of the specified
     * configuration, or std::nullopt if the configuration is not found.
     */
    std::optional<std::string> get(Configs config) const;

    /**
     * @brief Retrieves a numeric configuration.
     *
     * @return The value, `fallback` if unset, or InvalidArgument if the value
     * is not an unsigned number.
     */
    absl::StatusOr<uint64_t> getNumber(Configs config, uint64_t fallback) const;

    // Whether a flag like HELP was given.
    [[nodiscard]] bool has(Configs config) const;

    // Whether the command line parsed. Other sources are optional.
    [[nodiscard]] bool loaded() const { return loaded_; }

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
        // Name in the env and the config file
        std::string_view name;
        // Long option on the command line
        std::string_view option;
        std::string_view description;
        char alias;
        enum class ArgType { NONE, STRING } type;
    };

    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {
        Entry{
            Configs::HOST,
            "HOST",
            "host",
            "Fabric server address",
            'H',
            Entry::ArgType::STRING,
        },
        {
            Configs::PORT,
            "PORT",
            "port",
            "Fabric server port",
            'p',
            Entry::ArgType::STRING,
        },
        {
            Configs::SERVICE_ID,
            "SERVICE_ID",
            "service-id",
            "Id of the store service instance",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::MAX_SEGMENT_SIZE,
            "MAX_SEGMENT_SIZE",
            "max-segment-size",
            "Maximum segment size in bytes",
            's',
            Entry::ArgType::STRING,
        },
        {
            Configs::IO_TIMEOUT,
            "IO_TIMEOUT",
            "io-timeout",
            "Socket I/O timeout in seconds, 0 waits forever",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::STORAGE_DIR,
            "STORAGE_DIR",
            "storage-dir",
            "Directory the store service writes files to",
            'd',
            Entry::ArgType::STRING,
        },
        {
            Configs::WORKING_DIR,
            "WORKING_DIR",
            "working-dir",
            "Directory for files in transit",
            'w',
            Entry::ArgType::STRING,
        },
        {
            Configs::IO_THREADS,
            "IO_THREADS",
            "io-threads",
            "Number of server io threads",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::LOG_FILE,
            "LOG_FILE",
            "log-file",
            "Log file path",
            'f',
            Entry::ArgType::STRING,
        },
        {
            Configs::CONFIG_FILE,
            "CONFIG_FILE",
            "config-file",
            "INI file with further settings",
            'c',
            Entry::ArgType::STRING,
        },
        {
            Configs::NAME,
            "NAME",
            "name",
            "File name on the server, defaults to the source file name",
            'n',
            Entry::ArgType::STRING,
        },
        {
            Configs::SOURCE,
            "SOURCE",
            "source",
            "File to store",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
        },
        {
            Configs::HELP,
            "HELP",
            "help",
            "Display help information",
            'h',
            Entry::ArgType::NONE,
        },
    };

    static constexpr const Entry& entryOf(const Configs config) {
        return kConfigMap[static_cast<std::size_t>(config)];
    }

    struct Backend {
        virtual ~Backend() = default;

        virtual bool load() { return true; }
        virtual std::optional<std::string> get(const Entry& entry) = 0;

        /**
         * @brief This field stores the name of the backend.
         *
         * Such as "Cmdline" or "File". Used for logging purposes.
         */
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

   private:
    enum class BackendType { COMMAND_LINE, ENV, FILE, MAX };

    class BackendStorage {
        std::array<std::unique_ptr<Backend>, static_cast<int>(BackendType::MAX)>
            backends;

       public:
        std::unique_ptr<Backend>& operator[](const BackendType type) {
            return backends[static_cast<int>(type)];
        }

        [[nodiscard]] decltype(backends)::const_iterator begin() const {
            return backends.cbegin();
        }

        [[nodiscard]] decltype(backends)::const_iterator end() const {
            return backends.cend();
        }

        [[nodiscard]] size_t size() const;
    } storage;
    bool loaded_ = false;
};
