#pragma once

#include "exception.hpp"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

namespace archivefile {

// Snapshot of one archive entry. Exactly one of is_dir / is_file is true.
struct Member {
    std::string name;
    std::uint64_t size = 0;
    std::uint64_t compressed_size = 0;
    bool is_dir = false;
    bool is_file = false;

    bool operator==(const Member& other) const = default;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const Member& member);

// Anything a caller may use to name a member: a raw name, a filesystem path or a Member.
// A default-constructed reference names nothing.
class MemberRef {
public:
    using Value = std::variant<std::monostate, std::string, std::filesystem::path, Member>;

    MemberRef() = default;
    MemberRef(std::string name) : value_(std::move(name)) {}
    MemberRef(const char* name) : value_(std::string(name)) {}
    MemberRef(std::string_view name) : value_(std::string(name)) {}
    MemberRef(std::filesystem::path path) : value_(std::move(path)) {}
    MemberRef(Member member) : value_(std::move(member)) {}

    const Value& value() const { return value_; }

private:
    Value value_;
};

std::string demangle(const std::type_info& type);

// Canonical member name for a reference. Throws MemberTypeMismatch for an empty reference.
std::string resolve_name(const MemberRef& member);

// Same, for arbitrary values: anything that is not a name, path or Member is a type mismatch.
template <typename T>
std::string resolve_name(const T& member) {
    if constexpr (std::is_constructible_v<MemberRef, const T&>) {
        return resolve_name(MemberRef(member));
    } else {
        throw MemberTypeMismatch(demangle(typeid(T)));
    }
}

// Checks every requested member against the archive's names, in request order.
// Returns the names with duplicates removed (first occurrence wins).
// Throws ArchiveMemberNotFound on the first unknown name.
std::vector<std::string> validate_members(const std::vector<MemberRef>& requested,
                                          const std::vector<std::string>& available,
                                          const std::filesystem::path& archive);

} // namespace archivefile
