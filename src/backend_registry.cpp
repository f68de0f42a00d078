#include "backend_registry.hpp"
#include "alpm_backend.hpp"
#include "aur_backend.hpp"
#include "pacman_backend.hpp"

const std::vector<BackendEntry>& backend_registry() {
    static const std::vector<BackendEntry> entries = {
        {"pacman", &PacmanConfig::defaults, &PacmanBackend::create},
        {"alpm", &AlpmConfig::defaults, &AlpmBackend::create},
        {"aur", &AurConfig::defaults, &AurBackend::create},
    };
    return entries;
}

const BackendEntry* find_backend_entry(std::string_view name) {
    for (const auto& entry : backend_registry()) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}
