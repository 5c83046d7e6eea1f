#pragma once
#include <string>
#include <stdexcept>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  or  --key value
    - Flags:      --key        (boolean presence)
    - Scanning starts at argv[1]; a leading mode word (argv[1] without
      "--") is simply skipped.
      Example:   prog convert --input stack.czi --output=out
    - Keys are case-sensitive.

  Notes:
    - If a key is missing, the default value is returned.
    - A value that is present but not a number throws std::invalid_argument.
    - This parser does not handle quotes, repeated keys, or short flags (-k).
*/

inline bool isOptionToken(const std::string& a) {
    return a.rfind("--", 0) == 0;
}

/* Get string value for "--key=value" or "--key value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string flag = "--" + key;
    const std::string pref = flag + "=";
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
        if (a == flag && i + 1 < argc && !isOptionToken(argv[i + 1])) return argv[i + 1];
    }
    return def;
}

/* Get int value. Returns 'def' when missing, throws on a malformed number. */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    std::size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(v, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + key + ": '" + v + "' is not an integer");
    }
    if (used != v.size()) throw std::invalid_argument("--" + key + ": '" + v + "' is not an integer");
    return n;
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 1; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}
