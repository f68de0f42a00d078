#pragma once

#include "package.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

class CommandRunner;

struct RecipeParserOptions {
    bool use_fakeroot = true;
    std::chrono::seconds timeout{5};
};

// Evaluates a PKGBUILD with bash and returns the variables it introduces,
// with `overrides` applied on top. Best effort: the recipe is executed, not
// interpreted, so only what it assigns at top level is seen. Throws
// BorealisException when bash fails or times out.
FieldMap parse_recipe(CommandRunner& runner, const std::filesystem::path& pkgbuild,
                      const RecipeParserOptions& options, const FieldMap& overrides = {});

// Variable assignments printed by bash's `set` builtin, values still quoted.
// Function definitions are ignored.
std::map<std::string, std::string, std::less<>> parse_set_output(std::string_view output);

// Decodes one value as printed by `set`: 'single', $'ansi-c' and
// ([0]="array" [1]="elements") forms.
FieldValue decode_bash_value(std::string_view raw);
