#include "schemac/settings.hpp"

#include <algorithm>
#include <cstdlib>

namespace schemac
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool parse_flag(const std::string& v)
{
    return v == "1" || v == "true" || v == "TRUE";
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("SCHEMAC_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;

    auto tolerance = getenv_str("SCHEMAC_MULTIPLE_OF_TOLERANCE", "");
    if (!tolerance.empty())
    {
        char* end = nullptr;
        double parsed = std::strtod(tolerance.c_str(), &end);
        if (end && *end == '\0' && parsed >= 0)
            s.multiple_of_tolerance = parsed;
    }

    s.eager_compile = parse_flag(getenv_str("SCHEMAC_EAGER_COMPILE", "0"));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("multiple_of_tolerance"))
    {
        double parsed = j.at("multiple_of_tolerance").get<double>();
        if (parsed >= 0)
            s.multiple_of_tolerance = parsed;
    }
    if (j.contains("eager_compile"))
        s.eager_compile = j.at("eager_compile").get<bool>();
    return s;
}

} // namespace schemac
