#include "gbasave/common/Dotenv.h"

#include <fstream>
#include <cctype>
#include <cstdlib>

namespace GBASave {
namespace Common {

std::string Dotenv::Trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

bool Dotenv::ParseLine(const std::string& rawLine, std::string& keyOut, std::string& valueOut) {
    std::string line = Trim(rawLine);
    if (line.empty() || line[0] == '#') return false;

    static const std::string kExport = "export ";
    if (line.compare(0, kExport.size(), kExport) == 0) {
        line = Trim(line.substr(kExport.size()));
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) return false;

    std::string key = Trim(line.substr(0, eq));
    std::string value = Trim(line.substr(eq + 1));
    if (key.empty()) return false;

    const bool quoted = value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''));
    if (quoted) {
        value = value.substr(1, value.size() - 2);
    } else {
        const auto comment = value.find(" #");
        if (comment != std::string::npos) {
            value = Trim(value.substr(0, comment));
        }
    }

    keyOut = key;
    valueOut = value;
    return true;
}

EnvVars Dotenv::LoadFile(const std::string& path) {
    EnvVars vars;

    std::ifstream in(path);
    if (!in.good()) {
        return vars;
    }

    std::string line;
    while (std::getline(in, line)) {
        std::string key;
        std::string value;
        if (ParseLine(line, key, value)) {
            vars[key] = value;
        }
    }

    return vars;
}

void Dotenv::ApplyToEnvironment(const EnvVars& vars) {
    for (const auto& kv : vars) {
        if (std::getenv(kv.first.c_str()) != nullptr) {
            continue;
        }
#if defined(_WIN32)
        _putenv_s(kv.first.c_str(), kv.second.c_str());
#else
        setenv(kv.first.c_str(), kv.second.c_str(), 0);
#endif
    }
}

std::string Dotenv::Get(const std::string& key, const std::string& fallback) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

} // namespace Common
} // namespace GBASave
