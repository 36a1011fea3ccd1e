#pragma once

#include <coil/common.hpp>

#include <span>
#include <string>
#include <string_view>

namespace coil {

class Configuration {
public:
    /*
     * Create the project configuration directory if none is found.
     *
     * Returns true if a new directory was created.
     */
    static bool init();

    /*
     * Open an INI file under the project directory, or the user directory if
     * user_wide. Project files fall back to the user file of the same name.
     */
    Configuration(std::span<std::string_view const> subpath, bool user_wide = false);

    /*
     * Accessor for a value by {section, key} or {section, subsection, key}.
     * Values assigned through the reference are written back on destruction.
     */
    std::string & operator[](std::span<std::string_view const> locator);

    ~Configuration();

    Configuration(Configuration const&) = delete;
    Configuration & operator=(Configuration const&) = delete;

    /*
     * Get a per-project configuration path.
     */
    static std::string_view path_local(std::span<std::string_view const> subpath = {}, bool is_dir = false);

    /*
     * Get a per-user configuration path.
     */
    static std::string_view path_user(std::span<std::string_view const> subpath = {}, bool is_dir = false);

private:
    void* impl_;
};

} // namespace coil
