#pragma once

#include <string>

namespace roster {

/**
 * Environment variables read by Configuration.
 */
static inline constexpr auto ROSTER_STORE_DIR_ENV = "ROSTER_STORE_DIR";
static inline constexpr auto ROSTER_NAMESPACE_ENV = "ROSTER_NAMESPACE";
static inline constexpr auto ROSTER_APP_NAME_ENV = "ROSTER_APP_NAME";

static inline constexpr auto DefaultNamespace = "application-instance-ids";
static inline constexpr auto DefaultApplicationName = "roster";

/**
 * Accessors for configuration settings.
 */
class Configuration {
public:
    Configuration();
    // Uses store_dir in place of the environment's store directory, which then need not be set.
    explicit Configuration(const std::string &store_dir);
    // Directory holding the namespaces, always with a trailing slash.
    [[nodiscard]] std::string store_dir() const;
    [[nodiscard]] std::string namespace_name() const;
    [[nodiscard]] std::string application_name() const;

private:
    [[nodiscard]] bool is_valid_dir(const char *dirname) const;
    [[nodiscard]] std::string require_path_env(const std::string &envkey) const;
    [[nodiscard]] std::string make_path(std::string dir) const;
    [[nodiscard]] std::string string_env(const std::string &envkey, const std::string &default_value) const;

    std::string store_dir_;
    std::string namespace_name_;
    std::string application_name_;
};

}
