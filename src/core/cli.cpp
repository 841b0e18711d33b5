#include "mediapush/core/cli.hpp"
#include "mediapush/core/errors.hpp"
#include "mediapush/core/utils.hpp"
#include <iostream>
#include <iomanip>

namespace mediapush::core {

CommandLineParser::CommandLineParser(const std::string& program_name) 
    : program_name_(program_name) {
    
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("", "limit", "Upload at most N files (default: all)", true);
    add_option("r", "recursive", "Scan subdirectories of the download directory");
    add_option("", "no-proxy", "Ignore proxy settings from the environment");
    add_option("", "connections", "Force the number of parallel connections (default: by file size)", true);
    add_option("", "env", "Settings file to load", true, ".env");
    add_option("", "verbose", "Enable verbose logging");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name, 
                                  const std::string& description, bool has_value, 
                                  const std::string& default_value) {
    Option option{long_name, description, has_value, default_value};
    
    if (!long_name.empty()) {
        options_[long_name] = option;
    }
    
    if (!short_name.empty()) {
        short_to_long_[short_name] = long_name;
        if (long_name.empty()) {
            options_[short_name] = option;
        }
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

bool CommandLineParser::parse(const std::vector<std::string>& args) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        
        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            std::string option_name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            
            auto it = options_.find(option_name);
            if (it == options_.end()) {
                error_ = "Unknown option: --" + option_name;
                return false;
            }
            
            if (it->second.has_value) {
                if (eq_pos != std::string::npos) {
                    parsed_options_[option_name] = arg.substr(eq_pos + 1);
                } else if (i + 1 < args.size()) {
                    parsed_options_[option_name] = args[++i];
                } else {
                    error_ = "Option --" + option_name + " requires a value";
                    return false;
                }
            } else if (eq_pos != std::string::npos) {
                error_ = "Option --" + option_name + " does not take a value";
                return false;
            } else {
                parsed_options_[option_name] = "true";
            }
        }
        else if (arg.starts_with("-") && arg.length() > 1) {
            for (size_t j = 1; j < arg.length(); ++j) {
                std::string short_opt(1, arg[j]);
                
                auto long_it = short_to_long_.find(short_opt);
                if (long_it == short_to_long_.end()) {
                    error_ = "Unknown option: -" + short_opt;
                    return false;
                }
                
                std::string long_name = long_it->second;
                auto opt_it = options_.find(long_name);
                
                if (opt_it->second.has_value) {
                    if (j == arg.length() - 1) {
                        if (i + 1 < args.size()) {
                            parsed_options_[long_name] = args[++i];
                        } else {
                            error_ = "Option -" + short_opt + " requires a value";
                            return false;
                        }
                    } else {
                        parsed_options_[long_name] = arg.substr(j + 1);
                        break;
                    }
                } else {
                    parsed_options_[long_name] = "true";
                }
            }
        }
        else {
            positional_args_.push_back(arg);
        }
    }
    
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    std::string normalized = normalize_option_name(name);
    return parsed_options_.find(normalized) != parsed_options_.end();
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    std::string normalized = normalize_option_name(name);
    auto it = parsed_options_.find(normalized);
    if (it != parsed_options_.end()) {
        return it->second;
    }
    
    auto opt_it = options_.find(normalized);
    if (opt_it != options_.end() && !opt_it->second.default_value.empty()) {
        return opt_it->second.default_value;
    }
    
    return default_value;
}

std::optional<long long> CommandLineParser::get_int_option(const std::string& name) const {
    if (!has_option(name)) {
        return std::nullopt;
    }
    
    auto value = utils::StringUtils::trim(get_option(name));
    if (!utils::StringUtils::is_integer(value)) {
        throw ConfigurationError("Option --" + normalize_option_name(name) + " expects an integer, got '" + value + "'");
    }
    
    try {
        return std::stoll(value);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Option --" + normalize_option_name(name) + " is out of range: " + value);
    }
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options]\n\n";
    std::cout << "Uploads the video files of the download directory to the configured target\n";
    std::cout << "and reports throughput. Without arguments, asks for each setting interactively.\n\n";
    std::cout << "Options:\n";
    
    for (const auto& [name, option] : options_) {
        std::string short_opt;
        for (const auto& [short_name, long_name] : short_to_long_) {
            if (long_name == name) {
                short_opt = "-" + short_name + ", ";
                break;
            }
        }
        
        std::cout << "  " << std::left << std::setw(24) 
                  << (short_opt + "--" + name + (option.has_value ? " <value>" : ""))
                  << option.description;
        
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.0.0\n";
    std::cout << "Built with C++20\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

}
