#include "version.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <variant>
#include <vector>

namespace {

const std::regex version_regex(R"(^(?:(\d+):)?([^:\-\s]+)(?:-(\d+|o))?$)");

// A loose version component is either a digit run (kept as text so that
// arbitrarily long numbers compare correctly) or a letter run.
struct Numeric {
    std::string digits;
};
using Component = std::variant<Numeric, std::string>;

std::vector<Component> split_components(std::string_view s) {
    std::vector<Component> out;
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t j = i;
        if (std::isdigit(c)) {
            while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) ++j;
            std::string_view run = s.substr(i, j - i);
            size_t nz = run.find_first_not_of('0');
            out.emplace_back(Numeric{nz == std::string_view::npos ? "0" : std::string(run.substr(nz))});
        } else if (std::isalpha(c)) {
            while (j < s.size() && std::isalpha(static_cast<unsigned char>(s[j]))) ++j;
            out.emplace_back(std::string(s.substr(i, j - i)));
        } else {
            ++j;
        }
        i = j;
    }
    return out;
}

int compare_component(const Component& a, const Component& b) {
    const auto* na = std::get_if<Numeric>(&a);
    const auto* nb = std::get_if<Numeric>(&b);
    if (na && nb) {
        if (na->digits.size() != nb->digits.size()) {
            return na->digits.size() < nb->digits.size() ? -1 : 1;
        }
        int res = na->digits.compare(nb->digits);
        return (res > 0) - (res < 0);
    }
    // Numbers sort before words.
    if (na) return -1;
    if (nb) return 1;
    int res = std::get<std::string>(a).compare(std::get<std::string>(b));
    return (res > 0) - (res < 0);
}

unsigned long parse_ulong(const std::string& digits, std::string_view whole) {
    try {
        return std::stoul(digits);
    } catch (const std::exception& e) {
        throw FormatError(string_format("error.invalid_version_format", std::string(whole)) + ": " + e.what());
    }
}

}

Version::Version(unsigned long epoch, std::string version, unsigned long release)
    : epoch_(epoch), version_(std::move(version)), release_(release) {}

Version Version::parse(std::string_view str) {
    std::string s(str);
    std::smatch match;
    if (!std::regex_match(s, match, version_regex)) {
        throw FormatError(string_format("error.invalid_version_format", s));
    }
    unsigned long epoch = match[1].matched ? parse_ulong(match[1].str(), str) : 0;
    unsigned long release = 1;
    if (match[3].matched) {
        release = (match[3].str() == "o") ? 0 : parse_ulong(match[3].str(), str);
    }
    return Version(epoch, match[2].str(), release);
}

std::string Version::to_string() const {
    return std::to_string(epoch_) + ":" + version_ + "-" + std::to_string(release_);
}

std::string Version::display() const {
    std::string out = version_ + "-" + std::to_string(release_);
    if (epoch_ != 0) {
        out = std::to_string(epoch_) + ":" + out;
    }
    return out;
}

int Version::compare(const Version& other) const {
    if (epoch_ != other.epoch_) return epoch_ < other.epoch_ ? -1 : 1;
    if (int res = compare_loose(version_, other.version_); res != 0) return res;
    if (release_ != other.release_) return release_ < other.release_ ? -1 : 1;
    return 0;
}

int compare_loose(std::string_view a, std::string_view b) {
    const auto pa = split_components(a);
    const auto pb = split_components(b);
    const size_t min_len = std::min(pa.size(), pb.size());
    for (size_t i = 0; i < min_len; ++i) {
        if (int res = compare_component(pa[i], pb[i]); res != 0) return res;
    }
    if (pa.size() == pb.size()) return 0;
    return pa.size() < pb.size() ? -1 : 1;
}

bool version_compare(const std::string& v1_str, const std::string& v2_str) {
    return Version::parse(v1_str) < Version::parse(v2_str);
}

bool version_satisfies(const std::string& current_version, const std::string& op, const std::string& required_version) {
    const int res = Version::parse(current_version).compare(Version::parse(required_version));
    if (op == ">=") return res >= 0;
    if (op == "<=") return res <= 0;
    if (op == ">") return res > 0;
    if (op == "<") return res < 0;
    if (op == "=" || op == "==") return res == 0;
    throw FormatError(string_format("error.invalid_dependency_operator", op));
}
