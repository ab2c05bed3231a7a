#pragma once

#include <string>
#include <unordered_map>

namespace GBASave {
namespace Common {

using EnvVars = std::unordered_map<std::string, std::string>;

class Dotenv {
public:
    // Loads KEY=VALUE pairs from a file (default: ".env").
    // - Ignores blank lines and lines starting with '#'
    // - Accepts an optional leading "export "
    // - Supports optional quotes: KEY="value" or KEY='value'
    // - Unquoted values end at " #" (trailing comment)
    static EnvVars LoadFile(const std::string& path = ".env");

    // Applies loaded variables to the process environment.
    // Existing environment variables are not overwritten.
    static void ApplyToEnvironment(const EnvVars& vars);

    // Process environment value for key, or fallback when unset/empty.
    static std::string Get(const std::string& key, const std::string& fallback = "");

    static bool ParseLine(const std::string& line, std::string& keyOut, std::string& valueOut);

private:
    static std::string Trim(const std::string& s);
};

} // namespace Common
} // namespace GBASave
