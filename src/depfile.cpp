#include "lpb/depfile.hpp"

#include <cctype>

namespace libprobe {

Depfile parse_depfile_content(std::string_view content) {
    Depfile result;
    std::string current_token;
    bool in_target = true;
    bool escape = false;

    auto flush_token = [&] {
        if (current_token.empty())
            return;
        if (in_target) {
            result.target = std::move(current_token);
        } else {
            result.dependencies.push_back(std::move(current_token));
        }
        current_token.clear();
    };

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];

        if (escape) {
            if (c == '\n') {
                // line continuation
            } else if (c == '\r') {
                if (i + 1 < content.size() && content[i + 1] == '\n') {
                    i++;
                }
            } else {
                current_token += c;
            }
            escape = false;
        } else if (c == '\\') {
            escape = true;
        } else if (c == ':' && in_target) {
            flush_token();
            in_target = false;
        } else if (c == '\n' && !in_target) {
            // an unescaped newline ends the rule
            flush_token();
            break;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            flush_token();
        } else {
            current_token += c;
        }
    }

    flush_token();
    return result;
}

Result<Depfile> parse_depfile(const std::filesystem::path &path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return parse_depfile_content(*content);
}

} // namespace libprobe
