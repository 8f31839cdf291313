#include "jpatch/Util.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#if defined(_WIN32)
  #include <windows.h>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace jpatch {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool starts_with_icase(const std::string& text, const std::string& prefix) {
    if (prefix.size() > text.size()) return false;
    return to_lower(text.substr(0, prefix.size())) == to_lower(prefix);
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
    LPTCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = (LPSTR)env; *var != '\0'; var += strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos || pos == 0) continue;
        envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
        }
    }
#endif
    return envs;
}

} // namespace jpatch
