#pragma once

#include "config.hpp"

#include <memory>
#include <string_view>
#include <vector>

class Backend;
class Dispatcher;

// How to build one kind of backend. `name` is the identifier used in
// backend_order and the name of its config section.
struct BackendEntry {
    std::string_view name;
    const ConfigDefaults& (*defaults)();
    std::unique_ptr<Backend> (*create)(Dispatcher& dispatcher, const ConfigSection& section);
};

const std::vector<BackendEntry>& backend_registry();
const BackendEntry* find_backend_entry(std::string_view name);
