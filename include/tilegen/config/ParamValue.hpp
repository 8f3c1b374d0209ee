#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tilegen::config {

using ParamValue = std::variant<float, int, bool, std::string>;
using ParamMap   = std::map<std::string, ParamValue, std::less<>>;

enum class ParamKind { Float, Int, Bool, String };

std::string_view param_kind_name(ParamKind k) noexcept;
ParamKind        kind_of(const ParamValue& v) noexcept;
std::string      to_string(const ParamValue& v);

// Typed reads. Ints are accepted where a float is expected; every other
// mismatch yields std::nullopt.
std::optional<float>       as_float(const ParamValue& v) noexcept;
std::optional<int>         as_int(const ParamValue& v) noexcept;
std::optional<bool>        as_bool(const ParamValue& v) noexcept;
std::optional<std::string> as_string(const ParamValue& v);

// Lookup with fallback for missing keys or wrong types.
float       get_float (const ParamMap& p, std::string_view key, float fallback);
int         get_int   (const ParamMap& p, std::string_view key, int fallback);
bool        get_bool  (const ParamMap& p, std::string_view key, bool fallback);
std::string get_string(const ParamMap& p, std::string_view key, const std::string& fallback);

// One row of a per-algorithm rule table. Bounds are inclusive unless the
// matching exclusive flag is set; an empty `choices` list accepts any string.
struct ParamRule {
    std::string name;
    ParamKind   kind = ParamKind::Float;
    std::optional<double> min;
    std::optional<double> max;
    bool minExclusive = false;
    std::vector<std::string> choices;
    std::string message; // used for range/choice violations
};

// Checks `params` against `rules`: unknown keys, wrong value kinds, range and
// choice violations. Never throws; an empty result means the map is valid.
// `owner` names the generator in unknown-key messages.
std::vector<std::string> validate_params(const ParamMap& params,
                                         const std::vector<ParamRule>& rules,
                                         std::string_view owner);

} // namespace tilegen::config
