#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <fstream>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Minimal INI reader/writer: "[Section]" headers, "key = value" pairs,
 * ';' and '#' comments.
 */
class IniConfig {
public:
    bool load(const std::string& filename);
    // owner_only stages and leaves the file readable by the owner alone.
    bool save(const std::string& filename, bool owner_only = false) const;

    std::string getValue(const std::string& section,
                         const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;
    void removeValue(const std::string& section, const std::string& key);

    std::map<std::string, std::string> sectionValues(const std::string& section) const;
    std::vector<std::string> sections() const;
    void clear() { data.clear(); }

private:
    const std::string* find(const std::string& section, const std::string& key) const;

    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif // INICONFIG_HPP
