#include "cli.hpp"
#include "errors.hpp"

#include <string.h>

namespace NOdin {

TCommandLine::TCommandLine(std::string program)
    : Program_(std::move(program))
{
    AddOption("config", "path to the JSON configuration", true);
    AddOption("log", "log level: trace, debug, info, warn, error, off", true);
    AddOption("help", "print this help");
}

TCommandLine& TCommandLine::AddOption(std::string name, std::string help, bool takesValue, std::optional<std::string> defaultValue) {
    for (auto& option : Options_) {
        if (option.Name == name) {
            option = TOption{std::move(name), std::move(help), takesValue, std::move(defaultValue)};
            return *this;
        }
    }
    Options_.push_back(TOption{std::move(name), std::move(help), takesValue, std::move(defaultValue)});
    return *this;
}

void TCommandLine::Parse(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (!strcmp(argv[i], "--")) {
            for (++i; i < argc; ++i) {
                Positional_.emplace_back(argv[i]);
            }
            break;
        }
        if (strncmp(argv[i], "--", 2) != 0) {
            Positional_.emplace_back(argv[i]);
            continue;
        }

        std::string name(argv[i] + 2);
        std::optional<std::string> value;
        if (auto eq = name.find('='); eq != std::string::npos) {
            value = name.substr(eq + 1);
            name.resize(eq);
        }
        const auto* option = Find(name);
        if (!option) {
            throw TOdinError(EErrorKind::ConfigError, "unknown option --" + name);
        }
        if (option->TakesValue) {
            if (!value) {
                if (i + 1 >= argc) {
                    throw TOdinError(EErrorKind::ConfigError, "option --" + name + " needs a value");
                }
                value = argv[++i];
            }
            Values_[name] = *value;
        } else {
            if (value) {
                throw TOdinError(EErrorKind::ConfigError, "option --" + name + " takes no value");
            }
            Values_[name] = "";
        }
    }
}

bool TCommandLine::Has(const std::string& name) const {
    return Values_.contains(name);
}

std::optional<std::string> TCommandLine::Get(const std::string& name) const {
    if (auto it = Values_.find(name); it != Values_.end()) {
        return it->second;
    }
    if (const auto* option = Find(name)) {
        return option->Default;
    }
    return std::nullopt;
}

void TCommandLine::PrintUsage(std::ostream& out) const {
    out << "Usage: " << Program_ << " [options]\n";
    for (const auto& option : Options_) {
        std::string flag = "  --" + option.Name + (option.TakesValue ? " <value>" : "");
        out << flag;
        if (flag.size() < 28) {
            out << std::string(28 - flag.size(), ' ');
        } else {
            out << "\n" << std::string(28, ' ');
        }
        out << option.Help;
        if (option.Default) {
            out << " (default: " << *option.Default << ")";
        }
        out << "\n";
    }
}

const TCommandLine::TOption* TCommandLine::Find(const std::string& name) const {
    for (const auto& option : Options_) {
        if (option.Name == name) {
            return &option;
        }
    }
    return nullptr;
}

} // namespace NOdin
