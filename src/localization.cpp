#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace archivefile {

namespace {
    // English catalogue, always available. Files under L10N_DIR override it.
    const std::unordered_map<std::string, std::string> builtin_strings = {
        {"info.log_prefix", "==> "},
        {"debug.prefix", "--> "},
        {"warning.prefix", "WARNING:"},
        {"error.prefix", "ERROR:"},

        {"error.file_not_found", "Archive file not found or not a regular file: '{}'"},
        {"error.unsupported_format",
         "Unsupported or unrecognized archive format for file: '{}'. "
         "7z and RAR support are optional components: they require a build with "
         "ARCHIVEFILE_WITH_7Z / ARCHIVEFILE_WITH_RAR and a libarchive providing those formats."},
        {"error.archive_closed", "Archive file is closed: '{}'"},
        {"error.read_failed", "Failed to read archive '{}': {}"},
        {"error.read_member_failed", "Failed to read member '{}' from archive '{}': {}"},
        {"error.unsafe_member", "Refusing to extract member '{}' from archive '{}': {}"},
        {"error.member_not_found", "Archive member '{}' not found in file: '{}'"},
        {"error.member_not_a_file", "Archive member '{}' is not a file in: '{}'"},
        {"error.member_type_mismatch",
         "Unsupported type for 'member'. Expected 'std::string', 'std::filesystem::path', "
         "or 'archivefile::Member', but got '{}'."},
        {"error.decode_failed", "'{}' codec can't decode byte 0x{:02x} in position {}: {}"},
        {"error.unknown_encoding", "unknown encoding: {}"},
        {"error.unknown_error_handler", "unknown error handler name '{}'"},
        {"error.create_dir_failed", "Failed to create directory {}"},
        {"error.path_not_dir", "Path exists but is not a directory: {}"},
        {"error.write_failed", "Failed to write {}: {}"},
        {"error.out_of_memory", "out of memory"},
        {"error.passphrase_failed", "could not register the password with the decoder"},
        {"error.link_target_missing", "link target '{}' not found in archive"},
        {"error.link_loop", "too many levels of links"},
        {"error.unknown", "unknown error"},
        {"error.cmd_parse_error", "Command line error: {}"},
        {"error.archivefile_error", "{}"},
        {"error.unexpected_error", "Unexpected error: {}"},
        {"error.invalid_arg_count", "Invalid number of arguments."},
        {"error.unknown_command", "Unknown command: {}"},

        {"reason.absolute_path", "absolute path"},
        {"reason.path_traversal", "path traversal"},
        {"reason.special_file", "special device file"},
        {"reason.absolute_link", "absolute link target"},
        {"reason.link_outside", "link target outside the destination"},
        {"reason.invalid_utf8", "invalid start byte"},
        {"reason.invalid_continuation", "invalid continuation byte"},
        {"reason.unexpected_end", "unexpected end of data"},
        {"reason.invalid_sequence", "invalid multibyte sequence"},

        {"warning.codec", "{}: {}"},
        {"warning.l10n_fallback", "Could not open localization file for {}, falling back to English."},
        {"debug.opened", "Opened {} archive {}"},
        {"info.extracting", "Extracted {} entries..."},
        {"info.extract_complete", "Extraction complete: {} entries."},

        {"info.usage", "archivefile <command> <archive> [members...] [options]"},
        {"info.commands", "Commands:"},
        {"info.list_desc", "  list <archive>                  List the members of an archive"},
        {"info.extract_desc", "  extract <archive> [members...]  Extract members (all by default)"},
        {"info.cat_desc", "  cat <archive> <member>          Print a member as text"},
        {"info.check_desc", "  check <file>...                 Print the detected archive format"},
        {"info.unsupported", "unsupported"},
        {"info.type_dir", "dir"},
        {"info.type_file", "file"},
        {"info.extracted_to", "Extracted to {}"},
        {"help.help", "Print this help"},
        {"help.output", "Destination directory (default: current directory)"},
        {"help.password", "Password for encrypted archives"},
        {"help.long", "Show sizes and types when listing"},
        {"help.encoding", "Text encoding used by 'cat'"},
        {"help.errors", "Decode error policy used by 'cat' (strict, ignore, replace, backslashreplace)"},
        {"help.verbose", "Print debug messages"},
        {"help.quiet", "Only print errors"},
    };

    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex strings_mutex;
}

void load_strings(const std::string& lang) {
    if (lang == "en") {
        return;
    }

    std::ifstream file(L10N_DIR / (lang + ".txt"));
    if (!file.is_open()) {
        log_warning(string_format("warning.l10n_fallback", lang));
        return;
    }

    std::lock_guard<std::mutex> lock(strings_mutex);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.front() == '#') continue;
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            translations[line.substr(0, pos)] = line.substr(pos + 1);
        }
    }
}

void init_localization() {
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).find("zh") == 0) {
        lang = "zh";
    }
    load_strings(lang);
}

const std::string& get_string(const std::string& key) {
    std::lock_guard<std::mutex> lock(strings_mutex);
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto builtin_it = builtin_strings.find(key);
    if (builtin_it != builtin_strings.end()) {
        return builtin_it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}

bool has_string(const std::string& key) {
    return builtin_strings.contains(key);
}

} // namespace archivefile
