#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <vector>


/**
 * @brief `[section]` / `key = value` reader for installer.ini.
 *
 * Lines starting with `;` or `#` are comments. A repeated key keeps its last
 * value. Lines that could not be used are kept as problems() rather than
 * logged, because the file is read before logging is configured.
 */
class IniConfig {
public:
    bool load(const std::string &filename);
    void load(std::istream &input, const std::string &source = "<input>");

    std::string getValue(const std::string &section, const std::string &key, const std::string &default_value = "") const;
    bool hasValue(const std::string &section, const std::string &key) const;

    // Every (section, key) pair present, sorted.
    std::vector<std::pair<std::string, std::string>> entries() const;

    // "source:line: reason" for malformed lines and overridden duplicates.
    const std::vector<std::string>& problems() const { return problems_; }

private:
    void note_problem(const std::string &source, std::size_t line_number, const std::string &reason);

    std::map<std::string, std::map<std::string, std::string>> data;
    std::vector<std::string> problems_;
};

#endif
