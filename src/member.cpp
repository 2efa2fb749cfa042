#include "member.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <format>
#include <memory>
#include <unordered_set>

namespace archivefile {

std::string Member::to_string() const {
    return std::format("Member(name='{}', size={}, compressed_size={}, is_dir={}, is_file={})",
                       name, size, compressed_size, is_dir, is_file);
}

std::ostream& operator<<(std::ostream& os, const Member& member) {
    return os << member.name;
}

std::string demangle(const std::type_info& type) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> name(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
    if (status == 0 && name) {
        return name.get();
    }
    return type.name();
}

namespace {
    struct NameVisitor {
        std::string operator()(const std::monostate&) const {
            throw MemberTypeMismatch(demangle(typeid(std::monostate)));
        }
        std::string operator()(const std::string& name) const { return name; }
        std::string operator()(const std::filesystem::path& path) const { return path.generic_string(); }
        std::string operator()(const Member& member) const { return member.name; }
    };
}

std::string resolve_name(const MemberRef& member) {
    return std::visit(NameVisitor{}, member.value());
}

std::vector<std::string> validate_members(const std::vector<MemberRef>& requested,
                                          const std::vector<std::string>& available,
                                          const std::filesystem::path& archive) {
    const std::unordered_set<std::string> known(available.begin(), available.end());
    std::unordered_set<std::string> seen;
    std::vector<std::string> names;
    names.reserve(requested.size());

    for (const auto& member : requested) {
        std::string name = resolve_name(member);
        if (!known.contains(name)) {
            throw ArchiveMemberNotFound(name, archive);
        }
        if (seen.insert(name).second) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

} // namespace archivefile
