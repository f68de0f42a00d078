#pragma once

#include "capability.hpp"
#include "config.hpp"
#include "package.hpp"

#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// Values a template can refer to besides the package's own fields.
struct RenderContext {
    const Package* package = nullptr;
    std::map<std::string, std::string, std::less<>> values;
    // Lines of a previously rendered template, as {fmt_lines[N]}.
    std::vector<std::string> lines;
};

// Expands an output template:
//   {field} or {field:spec}   a value, formatted with a std::format spec
//   {fmt_lines[N]}            line N of the context's lines
//   %K %R %G %Y %B %M %C %W   colors, %N or %n to reset, %% for '%'
//   \n                        a newline
// Colors are dropped unless `color` is set. Unknown fields and bad specs
// throw FormatError.
std::string render_template(std::string_view tmpl, const RenderContext& context, bool color);

// Renders the results of one action with the configured templates.
class PackagePrinter {
public:
    PackagePrinter(const FrontendConfig& config, Capability action, std::ostream& out, bool color);

    // Writes `package` as the `index`-th (1-based) result.
    void print(const Package& package, size_t index);

private:
    std::string installed_diff_template(const Package& package) const;

    const FrontendConfig& config_;
    Capability action_;
    std::ostream& out_;
    bool color_;
    std::string format_;
};
