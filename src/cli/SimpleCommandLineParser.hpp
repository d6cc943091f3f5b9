/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight header-only command-line parser
 *
 * Copyright (c) 2026 NeuroForge 3D contributors
 * Licensed under the MIT License.
 */

#pragma once

#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace neuroforge {

/**
 * @brief Long/short option parser with typed lookups
 *
 * Accepts "--name value", "--name=value" and "-n value". Flags take no value
 * and read back as "true". Anything that is not an option is collected as a
 * positional argument.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool takes_value = true;
    };

    SimpleCommandLineParser(std::string program_name, std::string description)
        : program_name_(std::move(program_name)), description_(std::move(description)) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description) {
        register_option({long_name, short_name, description, true});
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option({long_name, short_name, description, false});
    }

    /**
     * @brief Parse argv
     * @return false on a usage error or when help was shown; check
     *         help_requested() to tell the two apart
     */
    bool parse(int argc, char* argv[]) {
        tokens_.assign(argv + (argc > 0 ? 1 : 0), argv + argc);
        values_.clear();
        positional_.clear();
        help_requested_ = false;

        for (const std::string& token : tokens_) {
            if (token == "--help" || token == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        size_t index = 0;
        while (index < tokens_.size()) {
            const std::string& token = tokens_[index];
            bool ok = true;
            if (token.starts_with("--")) {
                ok = consume_long(index);
            } else if (token.size() > 1 && token[0] == '-') {
                ok = consume_short(index);
            } else {
                positional_.push_back(token);
            }
            if (!ok) {
                return false;
            }
            ++index;
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    std::optional<std::string> get(const std::string& option_name) const {
        auto found = values_.find(option_name);
        if (found == values_.end()) {
            return std::nullopt;
        }
        return found->second;
    }

    bool get_flag(const std::string& option_name) const {
        return get(option_name) == "true";
    }

    /// Typed lookup; std::nullopt when absent or when the whole value does not parse as T
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto raw = get(option_name);
        if (!raw) {
            return std::nullopt;
        }

        std::istringstream stream(*raw);
        T parsed;
        if (!(stream >> parsed) || !(stream >> std::ws).eof()) {
            return std::nullopt;
        }
        return parsed;
    }

    const std::vector<std::string>& get_positional() const { return positional_; }

    void show_help() const {
        std::cout << "NEUROFORGE PREP - " << description_ << "\n\n";

        std::cout << "USAGE:\n"
                  << "    " << program_name_ << " --input MESH [--output FILE] [OPTIONS]\n"
                  << "    " << program_name_ << " --generate SHAPE [--output FILE] [OPTIONS]\n\n";

        std::cout << "EXAMPLES:\n"
                  << "    # Repair a scan and scale its largest side to 120mm\n"
                  << "    " << program_name_ << " --input scan.stl --output print.stl --target-size 120\n\n"
                  << "    # Check a file without changing or writing it\n"
                  << "    " << program_name_ << " --input part.obj --no-repair --no-scale\n\n"
                  << "    # Write a configuration file to edit\n"
                  << "    " << program_name_ << " --create-config prep.json\n\n";

        print_section("MESH SOURCE", {"input", "generate", "size", "prompt"});
        print_section("PROCESSING", {"target-size", "scale", "no-scale", "repair", "no-repair",
                                     "fill-holes", "no-fill-holes", "fix-normals", "no-fix-normals",
                                     "remove-small-components", "no-remove-small-components",
                                     "min-component-ratio"});
        print_section("OUTPUT", {"output", "stl-format", "report"});
        print_section("GENERAL", {"config", "create-config", "silent", "verbose", "log-level",
                                  "log-config", "log-file", "dry-run", "version"});

        std::cout << "EXIT STATUS:\n"
                  << "    0  mesh is valid (and was written if --output was given)\n"
                  << "    1  usage, input or I/O error\n"
                  << "    2  mesh was rejected by validation\n";
    }

private:
    static constexpr size_t HELP_LABEL_WIDTH = 36;

    void register_option(const Option& option) {
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_names_[option.short_name] = option.long_name;
        }
    }

    // --name, --name value, --name=value
    bool consume_long(size_t& index) {
        std::string name = tokens_[index].substr(2);
        std::optional<std::string> inline_value;
        if (size_t eq = name.find('='); eq != std::string::npos) {
            inline_value = name.substr(eq + 1);
            name.resize(eq);
        }

        auto found = options_.find(name);
        if (found == options_.end()) {
            std::cerr << "Unknown option: --" << name << std::endl;
            return false;
        }

        if (!found->second.takes_value) {
            if (inline_value) {
                std::cerr << "Flag --" << name << " does not take a value" << std::endl;
                return false;
            }
            values_[name] = "true";
            return true;
        }

        if (inline_value) {
            values_[name] = *inline_value;
            return true;
        }
        return consume_value(index, name, "--" + name);
    }

    // -n, -n value
    bool consume_short(size_t& index) {
        const std::string short_name = tokens_[index].substr(1);
        auto found = short_names_.find(short_name);
        if (found == short_names_.end()) {
            std::cerr << "Unknown option: -" << short_name << std::endl;
            return false;
        }

        const std::string name = found->second;
        if (!options_.at(name).takes_value) {
            values_[name] = "true";
            return true;
        }
        return consume_value(index, name, "-" + short_name);
    }

    bool consume_value(size_t& index, const std::string& name, const std::string& spelled) {
        if (!is_value_token(index + 1)) {
            std::cerr << "Option " << spelled << " requires a value" << std::endl;
            return false;
        }
        values_[name] = tokens_[++index];
        return true;
    }

    // A following token is a value unless it looks like another option.
    // Negative numbers such as "-5" still count as values.
    bool is_value_token(size_t index) const {
        if (index >= tokens_.size()) {
            return false;
        }
        const std::string& token = tokens_[index];
        if (token.size() < 2 || token[0] != '-') {
            return true;
        }
        return std::isdigit(static_cast<unsigned char>(token[1])) || token[1] == '.';
    }

    void print_section(const std::string& title, const std::vector<std::string>& names) const {
        std::cout << title << ":\n";
        for (const std::string& name : names) {
            auto found = options_.find(name);
            if (found == options_.end()) continue;

            const Option& option = found->second;
            std::string label = "--" + option.long_name;
            if (!option.short_name.empty()) {
                label = "-" + option.short_name + ", " + label;
            }
            if (option.takes_value) {
                label += " VALUE";
            }

            size_t padding = label.size() < HELP_LABEL_WIDTH ? HELP_LABEL_WIDTH - label.size() : 2;
            std::cout << "    " << label << std::string(padding, ' ') << option.description << "\n";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_names_;
    std::vector<std::string> tokens_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_;
    bool help_requested_ = false;
};

} // namespace neuroforge
