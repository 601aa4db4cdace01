#include "interpreter_registry.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>

namespace mcpexec {

std::vector<LanguageSpec> InterpreterRegistry::builtin_languages() {
    return {
        {"python",     {"python3", "py"},           {"python3", "{file}"},             ".py"},
        {"javascript", {"js", "node", "nodejs"},    {"node", "{file}"},                ".js"},
        {"bash",       {"shell"},                   {"bash", "{file}"},                ".sh"},
        {"sh",         {"posix"},                   {"sh", "{file}"},                  ".sh"},
        {"ruby",       {"rb"},                      {"ruby", "{file}"},                ".rb"},
        {"perl",       {"pl"},                      {"perl", "{file}"},                ".pl"},
        {"php",        {},                          {"php", "{file}"},                 ".php"},
        {"lua",        {},                          {"lua", "{file}"},                 ".lua"},
        {"typescript", {"ts"},                      {"npx", "--yes", "tsx", "{file}"}, ".ts"},
        {"r",          {"rscript"},                 {"Rscript", "{file}"},             ".R"},
    };
}

InterpreterRegistry::InterpreterRegistry(
    const std::unordered_map<std::string, std::string>& binary_overrides)
    : specs_(builtin_languages())
{
    for (size_t i = 0; i < specs_.size(); ++i) {
        auto& spec = specs_[i];
        auto it = binary_overrides.find(spec.id);
        if (it != binary_overrides.end() && !spec.argv_template.empty()) {
            spec.argv_template[0] = it->second;
        }
        index_[spec.id] = i;
        for (const auto& alias : spec.aliases) {
            index_.emplace(alias, i);
        }
    }
}

const LanguageSpec& InterpreterRegistry::lookup(const std::string& language) const {
    auto it = index_.find(to_lower(trim(language)));
    if (it == index_.end()) {
        throw ExecError(ErrorKind::UnsupportedLanguage,
                        "Unsupported language: " + language);
    }
    return specs_[it->second];
}

const LanguageSpec* InterpreterRegistry::find_by_extension(const std::string& extension) const {
    for (const auto& spec : specs_) {
        if (to_lower(spec.extension) == to_lower(extension)) return &spec;
    }
    return nullptr;
}

std::vector<std::string> InterpreterRegistry::languages() const {
    std::vector<std::string> ids;
    ids.reserve(specs_.size());
    for (const auto& spec : specs_) {
        ids.push_back(spec.id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

Command command_for(const LanguageSpec& spec, const std::string& file) {
    Command cmd;
    cmd.argv.reserve(spec.argv_template.size());
    for (const auto& arg : spec.argv_template) {
        cmd.argv.push_back(replace_all(arg, "{file}", file));
    }
    for (const auto& arg : cmd.argv) {
        if (!cmd.display.empty()) cmd.display += ' ';
        cmd.display += arg;
    }
    return cmd;
}

Command shell_command(const std::string& shell, const std::string& text) {
    return Command{{shell, "-c", text}, text};
}

} // namespace mcpexec
