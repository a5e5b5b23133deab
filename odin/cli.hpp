#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace NOdin {

/**
 * @class TCommandLine
 * @brief Declared options plus the result of parsing argv against them.
 *
 * Options are `--name value` (or `--name=value`) when they take a value and
 * `--name` otherwise. `--config`, `--log` and `--help` are always declared.
 *
 * @code{.cpp}
 * TCommandLine cli("odin_server");
 * cli.AddOption("port", "listen port", true);
 * cli.Parse(argc, argv);
 * if (cli.Has("help")) { cli.PrintUsage(std::cout); return 0; }
 * auto port = cli.Get("port");
 * @endcode
 */
class TCommandLine {
public:
    explicit TCommandLine(std::string program);

    TCommandLine& AddOption(std::string name, std::string help, bool takesValue = false, std::optional<std::string> defaultValue = std::nullopt);

    /// @throws TOdinError ConfigError on unknown options or a missing value
    void Parse(int argc, const char* const* argv);

    bool Has(const std::string& name) const;
    /// Given value, else the declared default.
    std::optional<std::string> Get(const std::string& name) const;

    /// Arguments that are not options.
    const std::vector<std::string>& Positional() const {
        return Positional_;
    }

    void PrintUsage(std::ostream& out) const;

private:
    struct TOption {
        std::string Name;
        std::string Help;
        bool TakesValue = false;
        std::optional<std::string> Default;
    };

    const TOption* Find(const std::string& name) const;

    std::string Program_;
    std::vector<TOption> Options_;
    std::map<std::string, std::string> Values_;
    std::vector<std::string> Positional_;
};

} // namespace NOdin
