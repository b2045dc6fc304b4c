#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace onto {

// A single option as given on the command line (or its default)
struct OptionValue {
    std::string text;
    bool present = false;

    /**
     * @brief Parse as an unsigned integer
     * @throws std::invalid_argument if the text is not entirely digits
     */
    uint64_t as_uint64() const;
};

// Options parsed for one command
class Options {
public:
    OptionValue get(const std::string& name, const std::string& fallback = "") const;
    bool has(const std::string& name) const;

    void set(const std::string& name, const std::string& text);

private:
    std::map<std::string, OptionValue> values_;
};

struct OptionSpec {
    std::string name;               // --name
    std::string alias;              // -x, may be empty
    std::string help;
    std::string default_text;
    bool is_switch = false;         // Takes no value
};

struct Command {
    std::string name;
    std::string summary;
    std::vector<OptionSpec> options;
    std::function<int(const Options&)> handler;

    void print_usage(const std::string& program) const;
};

/**
 * @brief Subcommand dispatcher: `program <command> [--option value]...`
 *
 * Handler exceptions are reported as "Error: ..." on stderr and turn into
 * exit code 1.
 */
class CommandLine {
public:
    CommandLine(std::string program, std::string version);

    void add(Command command);

    int run(int argc, char** argv) const;

    /**
     * @brief Parse the arguments following the command name
     * @throws std::runtime_error on unknown options or a missing value
     */
    static Options parse(const Command& command, const std::vector<std::string>& argv);

    void print_usage() const;

private:
    std::string program_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

} // namespace onto
