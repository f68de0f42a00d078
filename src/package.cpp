#include "package.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <array>
#include <utility>

namespace {

using TextField = std::string PackageMetadata::*;
using ListField = std::vector<std::string> PackageMetadata::*;
using DependsField = std::vector<Dependency> PackageMetadata::*;

struct FieldDescriptor {
    std::string_view key;
    std::variant<TextField, ListField, DependsField> member;
};

const std::vector<FieldDescriptor>& field_table() {
    static const std::vector<FieldDescriptor> table = {
        {"name", &PackageMetadata::name},
        {"pkgver", &PackageMetadata::pkgver},
        {"pkgrel", &PackageMetadata::pkgrel},
        {"epoch", &PackageMetadata::epoch},
        {"description", &PackageMetadata::description},
        {"url", &PackageMetadata::url},
        {"repo", &PackageMetadata::repo},
        {"category", &PackageMetadata::category},
        {"arch", &PackageMetadata::arch},
        {"base", &PackageMetadata::base},
        {"maintainer", &PackageMetadata::maintainer},
        {"packager", &PackageMetadata::packager},
        {"urlpath", &PackageMetadata::urlpath},
        {"size", &PackageMetadata::size},
        {"isize", &PackageMetadata::isize},
        {"votes", &PackageMetadata::votes},
        {"popularity", &PackageMetadata::popularity},
        {"outofdate", &PackageMetadata::outofdate},
        {"builddate", &PackageMetadata::builddate},
        {"installdate", &PackageMetadata::installdate},
        {"lastupdate", &PackageMetadata::lastupdate},
        {"submitted", &PackageMetadata::submitted},
        {"reason", &PackageMetadata::reason},
        {"filename", &PackageMetadata::filename},
        {"groups", &PackageMetadata::groups},
        {"license", &PackageMetadata::license},
        {"provides", &PackageMetadata::provides},
        {"conflicts", &PackageMetadata::conflicts},
        {"replaces", &PackageMetadata::replaces},
        {"backup", &PackageMetadata::backup},
        {"required_by", &PackageMetadata::required_by},
        {"optdepends", &PackageMetadata::optdepends},
        {"checkdepends", &PackageMetadata::checkdepends},
        {"source", &PackageMetadata::source},
        {"noextract", &PackageMetadata::noextract},
        {"options", &PackageMetadata::options},
        {"keywords", &PackageMetadata::keywords},
        {"md5sums", &PackageMetadata::md5sums},
        {"sha1sums", &PackageMetadata::sha1sums},
        {"sha256sums", &PackageMetadata::sha256sums},
        {"sha384sums", &PackageMetadata::sha384sums},
        {"sha512sums", &PackageMetadata::sha512sums},
        {"b2sums", &PackageMetadata::b2sums},
        {"depends", &PackageMetadata::depends},
        {"makedepends", &PackageMetadata::makedepends},
    };
    return table;
}

constexpr std::array<std::pair<std::string_view, std::string_view>, 15> ALIASES = {{
    {"desc", "description"},
    {"pkgdesc", "description"},
    {"pkgname", "name"},
    {"pkgsite", "url"},
    {"site", "url"},
    {"repository", "repo"},
    {"tarsize", "size"},
    {"csize", "size"},
    {"pkgbase", "base"},
    {"packagebase", "base"},
    {"numvotes", "votes"},
    {"firstsubmitted", "submitted"},
    {"lastmodified", "lastupdate"},
    {"requiredby", "required_by"},
    {"required-by", "required_by"},
}};

const FieldDescriptor* find_descriptor(std::string_view canonical) {
    for (const auto& descriptor : field_table()) {
        if (descriptor.key == canonical) return &descriptor;
    }
    return nullptr;
}

std::vector<std::string> as_list(const FieldValue& value) {
    if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
        return *list;
    }
    const auto& text = std::get<std::string>(value);
    if (text.empty()) return {};
    return {text};
}

}

std::string field_to_string(const FieldValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return join(std::get<std::vector<std::string>>(value), " ");
}

std::string_view PackageMetadata::canonical_key(std::string_view key) {
    for (const auto& [alias, canonical] : ALIASES) {
        if (alias == key) return canonical;
    }
    return key;
}

bool PackageMetadata::is_known_key(std::string_view key) {
    const auto canonical = canonical_key(key);
    return canonical == "version" || find_descriptor(canonical) != nullptr;
}

PackageMetadata PackageMetadata::from_fields(const FieldMap& fields, bool lazy, bool strict) {
    PackageMetadata metadata;
    for (const auto& [key, value] : fields) {
        if (strict && !is_known_key(key)) {
            throw MetadataError(string_format("error.unhandled_package_attribute", key));
        }
        metadata.set(key, value);
    }
    metadata.finalize(lazy);
    return metadata;
}

void PackageMetadata::set(std::string_view key, const FieldValue& value) {
    const auto canonical = canonical_key(key);
    if (canonical == "version") {
        const auto text = trim(field_to_string(value));
        version = text.empty() ? std::nullopt : std::optional<Version>(Version::parse(text));
        return;
    }
    const auto* descriptor = find_descriptor(canonical);
    if (!descriptor) {
        extra[std::string(key)] = value;
        return;
    }
    std::visit([&](auto member) {
        using Member = decltype(member);
        if constexpr (std::is_same_v<Member, TextField>) {
            this->*member = field_to_string(value);
        } else if constexpr (std::is_same_v<Member, ListField>) {
            this->*member = as_list(value);
        } else {
            std::vector<Dependency> deps;
            for (const auto& depstring : as_list(value)) {
                if (!trim(depstring).empty()) deps.push_back(Dependency::parse(trim(depstring)));
            }
            this->*member = std::move(deps);
        }
    }, descriptor->member);
}

void PackageMetadata::finalize(bool lazy) {
    if (version) {
        pkgver = version->version();
        pkgrel = std::to_string(version->release());
        epoch = version->epoch() ? std::to_string(version->epoch()) : "";
    } else if (!pkgver.empty() && !pkgrel.empty()) {
        version = Version::parse((epoch.empty() ? "" : epoch + ":") + pkgver + "-" + pkgrel);
    }

    if (!lazy) {
        for (const auto* required : {&name, &pkgver, &pkgrel}) {
            if (required->empty()) {
                const auto key = required == &name ? "name" : required == &pkgver ? "pkgver" : "pkgrel";
                throw MetadataError(string_format("error.required_metadata_missing", std::string(key)));
            }
        }
    } else if (name.empty()) {
        throw MetadataError(get_string("error.metadata_needs_name"));
    }
}

std::optional<FieldValue> PackageMetadata::get(std::string_view key) const {
    const auto canonical = canonical_key(key);
    if (canonical == "version") {
        return FieldValue(version ? version->display() : std::string());
    }
    if (const auto* descriptor = find_descriptor(canonical)) {
        return std::visit([&](auto member) -> FieldValue {
            using Member = decltype(member);
            if constexpr (std::is_same_v<Member, DependsField>) {
                std::vector<std::string> out;
                for (const auto& dep : this->*member) out.push_back(dep.to_string());
                return out;
            } else {
                return this->*member;
            }
        }, descriptor->member);
    }
    if (auto it = extra.find(key); it != extra.end()) {
        return it->second;
    }
    return std::nullopt;
}

const std::vector<std::string>& PackageMetadata::checksums() const {
    for (const auto* sums : {&sha1sums, &sha256sums, &sha384sums, &sha512sums, &md5sums}) {
        if (!sums->empty()) return *sums;
    }
    return md5sums;
}

Package::Package(PackageMetadata metadata, bool lazy)
    : metadata_(std::move(metadata)), lazy_(lazy) {}

Package Package::from_fields(const FieldMap& fields, bool lazy) {
    return Package(PackageMetadata::from_fields(fields, lazy), lazy);
}

std::vector<Dependency> Package::all_depends() const {
    std::vector<Dependency> deps = metadata_.depends;
    deps.insert(deps.end(), metadata_.makedepends.begin(), metadata_.makedepends.end());
    return deps;
}

std::optional<FieldValue> Package::get(std::string_view key) const {
    if (key == "installed_version") {
        return FieldValue(installed_version_ ? installed_version_->display() : std::string());
    }
    return metadata_.get(key);
}

std::string Package::to_string() const {
    if (lazy_ || !metadata_.version) {
        return metadata_.name;
    }
    return metadata_.name + " " + metadata_.version->display();
}
