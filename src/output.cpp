#include "output.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace {

std::string_view color_code(char c) {
    switch (c) {
    case 'K': return "\033[1;30m";
    case 'R': return "\033[1;31m";
    case 'G': return "\033[1;32m";
    case 'Y': return "\033[1;33m";
    case 'B': return "\033[1;34m";
    case 'M': return "\033[1;35m";
    case 'C': return "\033[1;36m";
    case 'W': return "\033[1;37m";
    case 'N':
    case 'n': return COLOR_RESET;
    default: return {};
    }
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        const auto pos = text.find('\n', start);
        lines.emplace_back(text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return lines;
}

bool is_number(std::string_view s) {
    return !s.empty() && s.size() < 19 && std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c); });
}

std::string apply_spec(const std::string& value, std::string_view spec, std::string_view field) {
    if (spec.empty()) return value;
    const std::string fmt = "{:" + std::string(spec) + "}";
    try {
        if (is_number(value)) {
            long long n = std::stoll(value);
            try {
                return std::vformat(fmt, std::make_format_args(n));
            } catch (const std::format_error&) {
                // Not a numeric spec; format as text below.
            }
        }
        return std::vformat(fmt, std::make_format_args(value));
    } catch (const std::format_error&) {
        throw FormatError(string_format("error.invalid_format_string", std::string(field)));
    }
}

std::string lookup(std::string_view field, const RenderContext& context) {
    if (field.starts_with("fmt_lines[") && field.ends_with("]")) {
        const auto index_text = field.substr(10, field.size() - 11);
        if (!is_number(index_text)) {
            throw FormatError(string_format("error.invalid_format_string", std::string(field)));
        }
        const auto index = static_cast<size_t>(std::stoll(std::string(index_text)));
        return index < context.lines.size() ? context.lines[index] : std::string();
    }
    if (auto it = context.values.find(PackageMetadata::canonical_key(field)); it != context.values.end()) {
        return it->second;
    }
    if (context.package) {
        if (auto value = context.package->get(field)) {
            return field_to_string(*value);
        }
    }
    throw FormatError(string_format("error.invalid_format_string", std::string(field)));
}

}

std::string render_template(std::string_view tmpl, const RenderContext& context, bool color) {
    std::string out;
    size_t i = 0;
    while (i < tmpl.size()) {
        const char c = tmpl[i];
        if (c == '\\' && i + 1 < tmpl.size() && tmpl[i + 1] == 'n') {
            out += '\n';
            i += 2;
        } else if (c == '%' && i + 1 < tmpl.size()) {
            const char code = tmpl[i + 1];
            if (code == '%') {
                out += '%';
            } else if (auto seq = color_code(code); !seq.empty()) {
                if (color) out += seq;
            } else {
                out += c;
                out += code;
            }
            i += 2;
        } else if (c == '{') {
            if (i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
                out += '{';
                i += 2;
                continue;
            }
            const auto close = tmpl.find('}', i);
            if (close == std::string_view::npos) {
                throw FormatError(string_format("error.invalid_format_string", std::string(tmpl.substr(i))));
            }
            const auto placeholder = tmpl.substr(i + 1, close - i - 1);
            const auto colon = placeholder.find(':');
            const auto field = placeholder.substr(0, colon);
            const auto spec = colon == std::string_view::npos ? std::string_view() : placeholder.substr(colon + 1);
            out += apply_spec(lookup(field, context), spec, field);
            i = close + 1;
        } else if (c == '}' && i + 1 < tmpl.size() && tmpl[i + 1] == '}') {
            out += '}';
            i += 2;
        } else {
            out += c;
            ++i;
        }
    }
    return out;
}

PackagePrinter::PackagePrinter(const FrontendConfig& config, Capability action, std::ostream& out, bool color)
    : config_(config), action_(action), out_(out), color_(color),
      format_(config.format_for(to_lower(capability_name(action)))) {}

std::string PackagePrinter::installed_diff_template(const Package& package) const {
    const auto& installed = *package.installed_version();
    if (!package.version() || installed == *package.version()) {
        return config_.output_fmt_installed_same;
    }
    return installed < *package.version() ? config_.output_fmt_installed_new : config_.output_fmt_installed_old;
}

void PackagePrinter::print(const Package& package, size_t index) {
    RenderContext context;
    context.package = &package;
    context.values["index"] = std::to_string(index);
    if (config_.output_desc_wrap > 0) {
        context.values["description"] = wrap_text(package.metadata().description,
                                                  static_cast<size_t>(config_.output_desc_wrap),
                                                  std::string(static_cast<size_t>(std::max(config_.output_desc_indent, 0)), ' '));
    }

    std::string text = render_template(format_, context, color_);

    if (action_ != Capability::Query && package.installed() && !config_.output_fmt_installed.empty()) {
        context.lines = split_lines(text);
        context.values["installed_diff"] = render_template(installed_diff_template(package), context, color_);
        text = render_template(config_.output_fmt_installed, context, color_);
    }

    out_ << text;
    if (color_) out_ << COLOR_RESET;
    // Flushed per package: an interrupt exits without unwinding.
    out_ << '\n' << std::flush;
}
