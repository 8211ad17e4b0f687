#include "Configuration.hpp"

#include <fmt/format.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdlib>
#include <stdexcept>

namespace roster {

Configuration::Configuration() {
    store_dir_ = make_path(require_path_env(ROSTER_STORE_DIR_ENV));
    namespace_name_ = string_env(ROSTER_NAMESPACE_ENV, DefaultNamespace);
    application_name_ = string_env(ROSTER_APP_NAME_ENV, DefaultApplicationName);
}

Configuration::Configuration(const std::string &store_dir) {
    if (!is_valid_dir(store_dir.c_str())) {
        throw std::invalid_argument(fmt::format("Store directory {} must be a directory path", store_dir));
    }
    store_dir_ = make_path(store_dir);
    namespace_name_ = string_env(ROSTER_NAMESPACE_ENV, DefaultNamespace);
    application_name_ = string_env(ROSTER_APP_NAME_ENV, DefaultApplicationName);
}

std::string Configuration::store_dir() const { return store_dir_; }
std::string Configuration::namespace_name() const { return namespace_name_; }
std::string Configuration::application_name() const { return application_name_; }

bool Configuration::is_valid_dir(const char *dirname) const {
    if (!dirname) {
        return false;
    }
    struct stat dir;
    return !stat(dirname, &dir) && S_ISDIR(dir.st_mode);
}

std::string Configuration::require_path_env(const std::string &envkey) const {
    const auto value = std::getenv(envkey.c_str());
    if (!is_valid_dir(value)) {
        throw std::invalid_argument(
            fmt::format("An environment variable called {} must specify a directory path", envkey));
    }
    return value;
}

std::string Configuration::make_path(std::string dir) const {
    if (dir.empty()) {
        return "./";
    } else if (dir.back() != '/') {
        dir.append("/");
        return dir;
    } else {
        return dir;
    }
}

std::string Configuration::string_env(const std::string &envkey, const std::string &default_value) const {
    const auto value = std::getenv(envkey.c_str());
    return value && *value ? std::string(value) : default_value;
}

}
