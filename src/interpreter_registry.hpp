#pragma once
#include <string>
#include <vector>
#include <unordered_map>

namespace mcpexec {

// A runnable command line plus the text shown in job listings and logs.
struct Command {
    std::vector<std::string> argv;
    std::string display;
};

struct LanguageSpec {
    std::string id;
    std::vector<std::string> aliases;
    std::vector<std::string> argv_template; // "{file}" is replaced by the script path
    std::string extension;
};

// Maps language identifiers to interpreter invocations. Immutable after
// construction, so lookups need no locking.
class InterpreterRegistry {
public:
    // Built-in table, with optional per-language binary overrides
    explicit InterpreterRegistry(
        const std::unordered_map<std::string, std::string>& binary_overrides = {});

    // Case-insensitive lookup by id or alias.
    // Throws ExecError(UnsupportedLanguage).
    const LanguageSpec& lookup(const std::string& language) const;

    // Find the language whose default extension matches (e.g. ".py").
    // Returns nullptr when none does.
    const LanguageSpec* find_by_extension(const std::string& extension) const;

    // Sorted language ids
    std::vector<std::string> languages() const;

    static std::vector<LanguageSpec> builtin_languages();

private:
    std::vector<LanguageSpec> specs_;
    std::unordered_map<std::string, size_t> index_; // id/alias -> specs_ slot
};

// Render a language template into a command for the given script file
Command command_for(const LanguageSpec& spec, const std::string& file);

// Wrap shell text as `<shell> -c <text>`
Command shell_command(const std::string& shell, const std::string& text);

} // namespace mcpexec
