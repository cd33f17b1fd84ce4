#include "session/client_factory.hpp"

#include <fmt/format.h>

HostPtr ClientFactory::resolve(std::string_view qualified_name) const {
    HostPtr current = root_module();
    if (!current) {
        return nullptr;
    }

    const auto first_dot = qualified_name.find('.');
    if (qualified_name.substr(0, first_dot) != current->type_name()) {
        return nullptr;
    }
    if (first_dot == std::string_view::npos) {
        return current;
    }

    std::size_t pos = first_dot;
    while (pos != std::string_view::npos) {
        const auto next = qualified_name.find('.', pos + 1);
        const auto part = qualified_name.substr(
            pos + 1, next == std::string_view::npos ? std::string_view::npos : next - pos - 1);
        Value member;
        try {
            member = current->get_attribute(part);
        } catch (const ScriptError&) {
            return nullptr;
        }
        const auto* host = member.get_if<HostPtr>();
        if (!host) {
            return nullptr;
        }
        current = *host;
        pos     = next;
    }
    return current;
}

// ---------------------------------------------------------------------------
// ModuleObject
// ---------------------------------------------------------------------------
ModuleObject::ModuleObject(std::string path)
    : path_(std::move(path))
{}

std::string ModuleObject::repr() const {
    return fmt::format("<module '{}'>", path_);
}

Value ModuleObject::get_attribute(std::string_view name) {
    const auto it = members_.find(std::string(name));
    if (it == members_.end()) {
        throw ScriptError(fmt::format("AttributeError: module '{}' has no attribute '{}'", path_, name));
    }
    return it->second;
}

void ModuleObject::add(std::string name, Value value) {
    members_.insert_or_assign(std::move(name), std::move(value));
}
