#include <streamgate/environment.h>
#include <streamgate/util/string.h>
#include <fstream>

namespace streamgate {

    bool load_env(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            std::string clean_line = util::trim(line);

            if (clean_line.empty() || clean_line[0] == '#') {
                continue;
            }

            size_t delimiter_pos = clean_line.find('=');
            if (delimiter_pos == std::string::npos) {
                continue;
            }

            std::string key = util::trim(clean_line.substr(0, delimiter_pos));
            std::string value = util::trim(clean_line.substr(delimiter_pos + 1));

            if (value.size() >= 2 &&
               ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            // Values already present in the process environment win
            setenv(key.c_str(), value.c_str(), 0);
        }

        return true;
    }

    std::vector<std::string> env_list(const std::string& key, const std::vector<std::string>& default_value) {
        const char* val = std::getenv(key.c_str());
        if (val == nullptr || *val == '\0') {
            return default_value;
        }

        std::vector<std::string> items;
        for (const auto& part : util::split(val, ',')) {
            auto item = util::trim(part);
            if (!item.empty()) {
                items.push_back(std::move(item));
            }
        }
        return items;
    }
}
