#include "archive_file.hpp"
#include "config.hpp"
#include "detect.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace archivefile;

namespace {

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
    std::cerr << get_string("info.extract_desc") << std::endl;
    std::cerr << get_string("info.cat_desc") << std::endl;
    std::cerr << get_string("info.check_desc") << std::endl;
}

std::vector<std::string> operands(const cxxopts::ParseResult& result, const cxxopts::Options& options,
                                  size_t min, std::optional<size_t> max = std::nullopt) {
    std::vector<std::string> args;
    if (result.count("args")) {
        args = result["args"].as<std::vector<std::string>>();
    }
    if (args.size() < min || (max.has_value() && args.size() > max.value())) {
        print_usage(options);
        throw ArchiveFileException(get_string("error.invalid_arg_count"));
    }
    return args;
}

std::optional<std::string> password_option(const cxxopts::ParseResult& result) {
    if (result.count("password")) {
        return result["password"].as<std::string>();
    }
    return std::nullopt;
}

void list_members(ArchiveFile& archive, bool long_format) {
    if (!long_format) {
        for (const auto& name : archive.get_names()) {
            std::cout << name << '\n';
        }
        return;
    }
    for (const auto& member : archive.get_members()) {
        std::cout << std::format("{:>12} {:>12} {:<4} {}\n", member.size, member.compressed_size,
                                 get_string(member.is_dir ? "info.type_dir" : "info.type_file"), member.name);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        set_log_level(LogLevel::INFO);
        init_config();
        init_localization();

        cxxopts::Options options("archivefile", get_string("info.usage"));

        options.add_options()
            ("h,help", get_string("help.help"))
            ("o,output", get_string("help.output"), cxxopts::value<std::string>()->default_value(""))
            ("p,password", get_string("help.password"), cxxopts::value<std::string>())
            ("l,long", get_string("help.long"), cxxopts::value<bool>()->default_value("false"))
            ("encoding", get_string("help.encoding"), cxxopts::value<std::string>()->default_value("utf-8"))
            ("errors", get_string("help.errors"), cxxopts::value<std::string>()->default_value("strict"))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("args", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "args"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result["quiet"].as<bool>()) {
            set_log_level(LogLevel::ERROR);
        } else if (result["verbose"].as<bool>()) {
            set_log_level(LogLevel::DEBUG);
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();

        if (command == "list") {
            auto args = operands(result, options, 1, 1);
            ArchiveFile archive(args[0], password_option(result));
            list_members(archive, result["long"].as<bool>());
        } else if (command == "extract") {
            auto args = operands(result, options, 1);
            ArchiveFile archive(args[0], password_option(result));
            std::optional<std::vector<MemberRef>> members;
            if (args.size() > 1) {
                members.emplace(args.begin() + 1, args.end());
            }
            auto destination = archive.extractall(result["output"].as<std::string>(), members);
            log_info(string_format("info.extracted_to", destination.string()));
        } else if (command == "cat") {
            auto args = operands(result, options, 2, 2);
            ArchiveFile archive(args[0], password_option(result));
            std::cout << archive.read_text(args[1], result["encoding"].as<std::string>(),
                                           result["errors"].as<std::string>());
        } else if (command == "check") {
            auto args = operands(result, options, 1);
            for (const auto& path : args) {
                auto format = detect_format(real_path(path));
                std::cout << path << ": " << (format ? to_string(*format) : get_string("info.unsupported")) << '\n';
            }
        } else {
            log_error(string_format("error.unknown_command", command));
            print_usage(options);
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const ArchiveFileException& e) {
        log_error(string_format("error.archivefile_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
