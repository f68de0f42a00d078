#include "dependency.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "package.hpp"

Dependency::Dependency(std::string name, std::optional<Comparison> comparison, std::optional<Version> target)
    : name_(std::move(name)), comparison_(comparison), target_(std::move(target)) {
    if (comparison_.has_value() != target_.has_value()) {
        throw FormatError(string_format("error.invalid_dependency", name_));
    }
}

Dependency Dependency::parse(std::string_view depstring) {
    const auto pos = depstring.find_first_of("<>=");
    if (pos == std::string_view::npos) {
        return Dependency(std::string(depstring));
    }

    std::string name(depstring.substr(0, pos));
    std::string_view rest = depstring.substr(pos);
    const auto op_len = rest.find_first_not_of("<>=");
    std::string_view op = rest.substr(0, op_len);

    Comparison comparison;
    if (op == ">") comparison = Comparison::Greater;
    else if (op == "<") comparison = Comparison::Less;
    else if (op == "=") comparison = Comparison::Equal;
    else if (op == ">=") comparison = Comparison::GreaterEqual;
    else if (op == "<=") comparison = Comparison::LessEqual;
    else throw FormatError(string_format("error.invalid_dependency_operator", std::string(op)));

    if (name.empty() || op_len == std::string_view::npos) {
        throw FormatError(string_format("error.invalid_dependency", std::string(depstring)));
    }
    Dependency dep(std::move(name), comparison, Version::parse(rest.substr(op_len)));
    dep.depstring_ = std::string(depstring);
    return dep;
}

bool Dependency::is_satisfied_by(const Package& candidate) const {
    if (candidate.name() != name_) {
        return false;
    }
    if (!comparison_) {
        return true;
    }
    const auto& version = candidate.version();
    return version && is_satisfied_by_version(*version);
}

bool Dependency::is_satisfied_by_version(const Version& version) const {
    if (!comparison_) {
        return true;
    }
    const int res = version.compare(*target_);
    switch (*comparison_) {
        case Comparison::Greater: return res > 0;
        case Comparison::Less: return res < 0;
        case Comparison::Equal: return res == 0;
        case Comparison::GreaterEqual: return res >= 0;
        case Comparison::LessEqual: return res <= 0;
    }
    return false;
}

std::string Dependency::to_string() const {
    if (!depstring_.empty()) {
        return depstring_;
    }
    if (!comparison_) {
        return name_;
    }
    return name_ + std::string(comparison_symbol(*comparison_)) + target_->display();
}

std::string_view comparison_symbol(Dependency::Comparison comparison) {
    switch (comparison) {
        case Dependency::Comparison::Greater: return ">";
        case Dependency::Comparison::Less: return "<";
        case Dependency::Comparison::Equal: return "=";
        case Dependency::Comparison::GreaterEqual: return ">=";
        case Dependency::Comparison::LessEqual: return "<=";
    }
    return "";
}
