#pragma once

#include <format>
#include <string>
#include <string_view>

namespace archivefile {

void init_localization();
void load_strings(const std::string& lang);
const std::string& get_string(const std::string& key);
bool has_string(const std::string& key);

// Variadic template for string formatting using modern C++20 std::format
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "archivefile formatting error [key: " + key + "]: " + e.what();
    }
}

} // namespace archivefile
