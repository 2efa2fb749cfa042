#pragma once

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

inline fs::path data_file(const std::string& name) {
    return fs::path(ARCHIVEFILE_TEST_DATA_DIR) / name;
}

// Fresh, empty directory under /tmp, unique per process
inline fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("archivefile_test_" + name + "_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline std::string slurp(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

inline const std::string README_CONTENT = "# Sample project\n\nUsed by the archivefile test suite.\n";
inline const std::string GUIDE_CONTENT = "Guide\n=====\n\nRead the README first.\n";
inline const std::string MAIN_C_CONTENT =
    "#include <stdio.h>\n\nint main(void) {\n    puts(\"hello\");\n    return 0;\n}\n";
inline const std::string LATIN1_CONTENT = "caf\xe9 cr\xe8me\n";
