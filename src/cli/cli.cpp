#include "cli/cli.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace onto {

uint64_t OptionValue::as_uint64() const {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("expected a non-negative integer, got '" + text + "'");
    }
    return static_cast<uint64_t>(std::stoull(text));
}

OptionValue Options::get(const std::string& name, const std::string& fallback) const {
    auto it = values_.find(name);
    if (it != values_.end()) {
        return it->second;
    }
    return OptionValue{fallback, false};
}

bool Options::has(const std::string& name) const {
    return values_.count(name) > 0;
}

void Options::set(const std::string& name, const std::string& text) {
    values_[name] = OptionValue{text, true};
}

void Command::print_usage(const std::string& program) const {
    std::cout << "\nUsage: " << program << " " << name << " [options]\n\n";
    std::cout << summary << "\n\nOptions:\n";
    for (const auto& opt : options) {
        std::cout << "  --" << opt.name;
        if (!opt.alias.empty()) std::cout << ", -" << opt.alias;
        if (!opt.is_switch) std::cout << " <value>";
        std::cout << "\n      " << opt.help;
        if (!opt.default_text.empty()) {
            std::cout << " (default: " << opt.default_text << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

CommandLine::CommandLine(std::string program, std::string version)
    : program_(std::move(program)), version_(std::move(version)) {}

void CommandLine::add(Command command) {
    std::string name = command.name;
    commands_[name] = std::move(command);
}

Options CommandLine::parse(const Command& command, const std::vector<std::string>& argv) {
    std::map<std::string, const OptionSpec*> lookup;
    for (const auto& opt : command.options) {
        lookup["--" + opt.name] = &opt;
        if (!opt.alias.empty()) {
            lookup["-" + opt.alias] = &opt;
        }
    }

    Options result;
    for (size_t i = 0; i < argv.size(); ++i) {
        std::string token = argv[i];
        std::string inline_value;
        bool has_inline = false;

        // --name=value
        auto eq = token.find('=');
        if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
            inline_value = token.substr(eq + 1);
            token = token.substr(0, eq);
            has_inline = true;
        }

        auto it = lookup.find(token);
        if (it == lookup.end()) {
            throw std::runtime_error("Unknown argument: " + argv[i]);
        }
        const OptionSpec& spec = *it->second;

        if (spec.is_switch) {
            if (has_inline) {
                throw std::runtime_error("Option --" + spec.name + " takes no value");
            }
            result.set(spec.name, "true");
        } else if (has_inline) {
            result.set(spec.name, inline_value);
        } else {
            if (i + 1 >= argv.size()) {
                throw std::runtime_error("Option --" + spec.name + " requires a value");
            }
            result.set(spec.name, argv[++i]);
        }
    }

    for (const auto& opt : command.options) {
        if (!opt.default_text.empty() && !result.has(opt.name)) {
            result.set(opt.name, opt.default_text);
        }
    }
    return result;
}

int CommandLine::run(int argc, char** argv) const {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string name = argv[1];
    if (name == "--help" || name == "-h") {
        print_usage();
        return 0;
    }
    if (name == "--version") {
        std::cout << program_ << " " << version_ << "\n";
        return 0;
    }

    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cerr << "Unknown command: " << name << "\n"
                  << "Run '" << program_ << " --help' for available commands.\n";
        return 1;
    }
    const Command& command = it->second;

    std::vector<std::string> rest(argv + 2, argv + argc);
    for (const auto& token : rest) {
        if (token == "--help" || token == "-h") {
            command.print_usage(program_);
            return 0;
        }
    }

    Options options;
    try {
        options = parse(command, rest);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        command.print_usage(program_);
        return 1;
    }

    try {
        return command.handler(options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

void CommandLine::print_usage() const {
    std::cout << program_ << " - ontology structure analyzer\n\n"
              << "Usage: " << program_ << " <command> [options]\n\nCommands:\n";
    for (const auto& [name, command] : commands_) {
        std::cout << "  " << std::left << std::setw(16) << name << command.summary << "\n";
    }
    std::cout << "\nRun '" << program_ << " <command> --help' for command options.\n";
}

} // namespace onto
