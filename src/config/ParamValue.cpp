#include "tilegen/config/ParamValue.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>

namespace tilegen::config {

namespace {

std::string lower(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

const ParamRule* find_rule(const std::vector<ParamRule>& rules, std::string_view key)
{
    for (const auto& r : rules)
        if (r.name == key) return &r;
    return nullptr;
}

std::string range_message(const ParamRule& r)
{
    if (!r.message.empty())
        return r.message;

    std::ostringstream os;
    os << "Parameter '" << r.name << "' out of range";
    return os.str();
}

} // namespace

std::string_view param_kind_name(ParamKind k) noexcept
{
    switch (k)
    {
        case ParamKind::Float:  return "float";
        case ParamKind::Int:    return "int";
        case ParamKind::Bool:   return "bool";
        case ParamKind::String: return "string";
    }
    return "unknown";
}

ParamKind kind_of(const ParamValue& v) noexcept
{
    switch (v.index())
    {
        case 0:  return ParamKind::Float;
        case 1:  return ParamKind::Int;
        case 2:  return ParamKind::Bool;
        default: return ParamKind::String;
    }
}

std::string to_string(const ParamValue& v)
{
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) return x;
        else if constexpr (std::is_same_v<T, bool>)   return x ? "true" : "false";
        else {
            std::ostringstream os;
            os << x;
            return os.str();
        }
    }, v);
}

std::optional<float> as_float(const ParamValue& v) noexcept
{
    if (const float* f = std::get_if<float>(&v)) return *f;
    if (const int* i = std::get_if<int>(&v))     return static_cast<float>(*i);
    return std::nullopt;
}

std::optional<int> as_int(const ParamValue& v) noexcept
{
    if (const int* i = std::get_if<int>(&v)) return *i;
    return std::nullopt;
}

std::optional<bool> as_bool(const ParamValue& v) noexcept
{
    if (const bool* b = std::get_if<bool>(&v)) return *b;
    return std::nullopt;
}

std::optional<std::string> as_string(const ParamValue& v)
{
    if (const std::string* s = std::get_if<std::string>(&v)) return *s;
    return std::nullopt;
}

float get_float(const ParamMap& p, std::string_view key, float fallback)
{
    auto it = p.find(key);
    if (it == p.end()) return fallback;
    return as_float(it->second).value_or(fallback);
}

int get_int(const ParamMap& p, std::string_view key, int fallback)
{
    auto it = p.find(key);
    if (it == p.end()) return fallback;
    return as_int(it->second).value_or(fallback);
}

bool get_bool(const ParamMap& p, std::string_view key, bool fallback)
{
    auto it = p.find(key);
    if (it == p.end()) return fallback;
    return as_bool(it->second).value_or(fallback);
}

std::string get_string(const ParamMap& p, std::string_view key, const std::string& fallback)
{
    auto it = p.find(key);
    if (it == p.end()) return fallback;
    return as_string(it->second).value_or(fallback);
}

std::vector<std::string> validate_params(const ParamMap& params,
                                         const std::vector<ParamRule>& rules,
                                         std::string_view owner)
{
    std::vector<std::string> errors;

    for (const auto& [key, value] : params)
    {
        const ParamRule* rule = find_rule(rules, key);
        if (!rule)
        {
            errors.push_back("Unknown parameter '" + key + "' for " + std::string(owner));
            continue;
        }

        const auto wrongType = [&] {
            errors.push_back("Parameter '" + key + "' must be a " +
                             std::string(param_kind_name(rule->kind)) + ", got " +
                             std::string(param_kind_name(kind_of(value))));
        };

        switch (rule->kind)
        {
            case ParamKind::Float:
            case ParamKind::Int:
            {
                std::optional<double> num;
                if (rule->kind == ParamKind::Float) {
                    if (auto f = as_float(value)) num = *f;
                } else {
                    if (auto i = as_int(value)) num = *i;
                }
                if (!num) { wrongType(); break; }

                const bool belowMin = rule->min &&
                    (rule->minExclusive ? *num <= *rule->min : *num < *rule->min);
                const bool aboveMax = rule->max && *num > *rule->max;
                if (belowMin || aboveMax)
                    errors.push_back(range_message(*rule));
                break;
            }
            case ParamKind::Bool:
                if (!as_bool(value)) wrongType();
                break;
            case ParamKind::String:
            {
                auto s = as_string(value);
                if (!s) { wrongType(); break; }
                if (rule->choices.empty()) break;
                const std::string v = lower(*s);
                const bool ok = std::any_of(rule->choices.begin(), rule->choices.end(),
                    [&](const std::string& c) { return lower(c) == v; });
                if (!ok)
                {
                    std::string msg = rule->message.empty()
                        ? "Invalid value '" + *s + "' for parameter '" + key + "'"
                        : rule->message + " (got '" + *s + "')";
                    errors.push_back(std::move(msg));
                }
                break;
            }
        }
    }
    return errors;
}

} // namespace tilegen::config
