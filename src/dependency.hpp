#pragma once

#include "version.hpp"

#include <optional>
#include <string>
#include <string_view>

class Package;

// A reference to a package by name, optionally constrained to versions that
// compare to `target` with `comparison`.
class Dependency {
public:
    enum class Comparison {
        Greater,
        Less,
        Equal,
        GreaterEqual,
        LessEqual,
    };

    explicit Dependency(std::string name, std::optional<Comparison> comparison = std::nullopt,
                        std::optional<Version> target = std::nullopt);

    // Parses "name", "name>=1.2-1", "name<2", ... The name ends at the first
    // of '<', '>' or '='. Throws FormatError on a bad operator or version.
    static Dependency parse(std::string_view depstring);

    const std::string& name() const { return name_; }
    const std::optional<Comparison>& comparison() const { return comparison_; }
    const std::optional<Version>& target() const { return target_; }
    bool constrained() const { return comparison_.has_value(); }

    // A candidate satisfies the dependency when the names match and, for a
    // constrained dependency, the candidate's version compares as required.
    // A candidate without a known version never satisfies a constraint.
    bool is_satisfied_by(const Package& candidate) const;
    bool is_satisfied_by_version(const Version& version) const;

    // The string the dependency was parsed from, or a composed one.
    std::string to_string() const;

    bool operator==(const Dependency& other) const {
        return name_ == other.name_ && comparison_ == other.comparison_ && target_ == other.target_;
    }

private:
    std::string name_;
    std::optional<Comparison> comparison_;
    std::optional<Version> target_;
    std::string depstring_;
};

std::string_view comparison_symbol(Dependency::Comparison comparison);
