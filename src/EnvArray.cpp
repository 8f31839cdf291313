/**
 * @file EnvArray.cpp
 * @brief Implementation of environment-variable entry sources
 */

#include "jpatch/EnvArray.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Util.hpp"

#include <map>

namespace jpatch {

namespace {
    std::vector<EnvEntry> from_map(const std::map<std::string, std::string>& m) {
        std::vector<EnvEntry> out;
        out.reserve(m.size());
        for (const auto& [name, value] : m) {
            out.push_back({name, value});
        }
        return out;
    }

    std::string value_text(const Value& v) {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_null()) return "";
        return v.dump(-1, ' ', false, Value::error_handler_t::replace);
    }
}

std::vector<EnvEntry> env_to_entries(const Value& env) {
    if (!env.is_object()) {
        return {};
    }
    std::map<std::string, std::string> m;
    for (auto it = env.begin(); it != env.end(); ++it) {
        m[it.key()] = value_text(it.value());
    }
    return from_map(m);
}

std::vector<EnvEntry> env_from_text(const std::string& text) {
    Value parsed;
    try {
        parsed = Value::parse(text, nullptr, true, true);
    } catch (const Value::parse_error& e) {
        throw InvalidEnvError(std::string("Environment source is not valid JSON: ") + e.what());
    }
    if (!parsed.is_object()) {
        throw InvalidEnvError("Environment source must be an object, got " + type_name(parsed));
    }
    return env_to_entries(parsed);
}

EnvEntry parse_assignment(const std::string& assignment) {
    const auto pos = assignment.find('=');
    if (pos == std::string::npos) {
        throw InvalidEnvError("Expected NAME=VALUE, got '" + assignment + "'");
    }
    std::string name = trim(assignment.substr(0, pos));
    if (name.empty()) {
        throw InvalidEnvError("Empty variable name in '" + assignment + "'");
    }
    return {name, assignment.substr(pos + 1)};
}

std::vector<EnvEntry> collect_env_vars(const std::string& prefix) {
    if (prefix.empty()) {
        throw InvalidEnvError("An environment prefix is required");
    }
    std::map<std::string, std::string> m;
    for (const auto& [name, value] : enumerate_environment()) {
        if (starts_with_icase(name, prefix)) {
            m[name] = value;
        }
    }
    return from_map(m);
}

std::vector<EnvEntry> merge_entries(const std::vector<std::vector<EnvEntry>>& sources) {
    std::map<std::string, std::string> m;
    for (const auto& source : sources) {
        for (const auto& entry : source) {
            m[entry.name] = entry.value;
        }
    }
    return from_map(m);
}

} // namespace jpatch
