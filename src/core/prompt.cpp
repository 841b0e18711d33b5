#include "mediapush/core/prompt.hpp"
#include "mediapush/core/errors.hpp"
#include "mediapush/core/utils.hpp"

namespace mediapush::core {

namespace {
    std::string read_answer(std::istream& in) {
        std::string line;
        if (!std::getline(in, line)) {
            throw ConfigurationError("Interactive input ended before all settings were answered");
        }
        return utils::StringUtils::to_lower(utils::StringUtils::trim(line));
    }
}

bool prompt_yes_no(const std::string& prompt, bool default_yes, std::istream& in, std::ostream& out) {
    const char* suffix = default_yes ? " (Y/n): " : " (y/N): ";
    
    while (true) {
        out << prompt << suffix << std::flush;
        auto answer = read_answer(in);
        
        if (answer.empty()) {
            return default_yes;
        }
        if (answer == "y" || answer == "yes" || answer == "1" || answer == "true" || answer == "on") {
            return true;
        }
        if (answer == "n" || answer == "no" || answer == "0" || answer == "false" || answer == "off") {
            return false;
        }
        out << "Please answer y or n\n";
    }
}

std::optional<long long> prompt_int(const std::string& prompt,
                                    std::optional<long long> default_value,
                                    std::optional<long long> min_value,
                                    std::optional<long long> max_value,
                                    std::istream& in, std::ostream& out) {
    std::string hint = default_value ? " (default " + std::to_string(*default_value) + ")" : "";
    
    while (true) {
        out << prompt << hint << ": " << std::flush;
        auto answer = read_answer(in);
        
        if (answer.empty()) {
            return default_value;
        }
        if (!utils::StringUtils::is_integer(answer) || answer.size() > 18) {
            out << "Please enter an integer\n";
            continue;
        }
        
        long long value = std::stoll(answer);
        if (min_value && max_value && (value < *min_value || value > *max_value)) {
            out << "Please enter an integer between " << *min_value << " and " << *max_value << "\n";
            continue;
        }
        if (min_value && value < *min_value) {
            out << "Please enter an integer >= " << *min_value << "\n";
            continue;
        }
        if (max_value && value > *max_value) {
            out << "Please enter an integer <= " << *max_value << "\n";
            continue;
        }
        return value;
    }
}

}
