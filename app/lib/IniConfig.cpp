#include "IniConfig.hpp"

#include <fmt/format.h>

#include <fstream>
#include <istream>

namespace {

std::string strip(const std::string& input)
{
    const auto begin = input.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r");
    return input.substr(begin, end - begin + 1);
}

bool is_comment_or_blank(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

} // namespace


bool IniConfig::load(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    load(file, filename);
    return !file.bad();
}


void IniConfig::load(std::istream &input, const std::string &source)
{
    std::string raw_line;
    std::string section;
    std::size_t line_number = 0;

    while (std::getline(input, raw_line)) {
        ++line_number;
        const std::string line = strip(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }

        if (line.front() == '[') {
            if (line.size() < 2 || line.back() != ']') {
                note_problem(source, line_number, fmt::format("unterminated section header '{}'", line));
                continue;
            }
            section = strip(line.substr(1, line.size() - 2));
            continue;
        }

        const auto equals = line.find('=');
        const std::string key = equals == std::string::npos ? std::string() : strip(line.substr(0, equals));
        if (key.empty()) {
            note_problem(source, line_number, fmt::format("expected 'key = value', got '{}'", line));
            continue;
        }

        auto& keys = data[section];
        if (keys.count(key) != 0) {
            note_problem(source, line_number, fmt::format("[{}] {} repeated; the later value wins", section, key));
        }
        keys[key] = strip(line.substr(equals + 1));
    }
}


std::string IniConfig::getValue(const std::string &section, const std::string &key, const std::string &default_value) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return default_value;
    }
    const auto key_it = sec_it->second.find(key);
    return key_it == sec_it->second.end() ? default_value : key_it->second;
}


bool IniConfig::hasValue(const std::string &section, const std::string &key) const
{
    const auto sec_it = data.find(section);
    return sec_it != data.end() && sec_it->second.count(key) != 0;
}


std::vector<std::pair<std::string, std::string>> IniConfig::entries() const
{
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto& [section, keys] : data) {
        for (const auto& entry : keys) {
            result.emplace_back(section, entry.first);
        }
    }
    return result;
}


void IniConfig::note_problem(const std::string &source, std::size_t line_number, const std::string &reason)
{
    problems_.push_back(fmt::format("{}:{}: {}", source, line_number, reason));
}
