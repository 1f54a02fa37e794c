#include "scanner/project_dir.hpp"

#include <vector>

namespace {

constexpr char DELIMITER = '-';

std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace

ProjectLocation decode_project_dir(std::string_view dir_name) {
    if (dir_name.empty() || dir_name.front() != DELIMITER) {
        return {std::string(dir_name), std::string(dir_name)};
    }

    auto parts = split(dir_name, DELIMITER);

    ProjectLocation loc;
    loc.name = std::string(dir_name);
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        if (!it->empty()) {
            loc.name = std::string(*it);
            break;
        }
    }

    // parts[0] is the empty segment before the leading delimiter.
    loc.path = "/";
    for (size_t i = 1; i < parts.size(); i++) {
        if (i > 1) loc.path += '/';
        loc.path += parts[i];
    }
    return loc;
}
